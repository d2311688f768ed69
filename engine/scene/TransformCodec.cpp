#include "TransformCodec.h"

#include <cmath>
#include <cstdlib>
#include <spdlog/fmt/fmt.h>
#include <vector>

namespace Scrim::TransformCodec {

static bool isIdentChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '-' || c == '_';
}

// Argument list of the first "name(" call, split on commas.
static bool findCall(std::string_view s, std::string_view name,
                     std::vector<std::string> &args) {
  size_t from = 0;
  while (true) {
    const size_t at = s.find(name, from);
    if (at == std::string_view::npos)
      return false;
    from = at + 1;
    if (at > 0 && isIdentChar(s[at - 1]))
      continue;

    size_t i = at + name.size();
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t'))
      ++i;
    if (i >= s.size() || s[i] != '(')
      continue;

    const size_t close = s.find(')', i + 1);
    if (close == std::string_view::npos)
      return false;

    args.clear();
    std::string_view inner = s.substr(i + 1, close - i - 1);
    size_t start = 0;
    while (true) {
      const size_t c = inner.find(',', start);
      args.emplace_back(
          inner.substr(start, c == std::string_view::npos ? c : c - start));
      if (c == std::string_view::npos)
        break;
      start = c + 1;
    }
    return true;
  }
}

static bool toFloat(const std::string &s, float &out, std::string *unit) {
  const char *p = s.c_str();
  char *end = nullptr;
  const float v = std::strtof(p, &end);
  if (end == p || !std::isfinite(v))
    return false;
  out = v;
  if (unit) {
    std::string u(end);
    while (!u.empty() && (u.back() == ' ' || u.back() == '\t'))
      u.pop_back();
    *unit = u;
  }
  return true;
}

static float toDegrees(float v, const std::string &unit) {
  if (unit == "rad")
    return v * 180.0f / 3.14159265358979323846f;
  if (unit == "turn")
    return v * 360.0f;
  if (unit == "grad")
    return v * 0.9f;
  return v;
}

TransformValues parse(std::string_view transform) {
  TransformValues out{};
  if (transform.empty())
    return out;

  std::vector<std::string> args;

  if (findCall(transform, "translate", args)) {
    float x = 0.0f;
    float y = 0.0f;
    if (toFloat(args[0], x, nullptr))
      out.translateX = x;
    if (args.size() > 1 && toFloat(args[1], y, nullptr))
      out.translateY = y;
  }

  if (findCall(transform, "scale", args)) {
    float sx = 1.0f;
    if (toFloat(args[0], sx, nullptr)) {
      out.scaleX = sx;
      out.scaleY = sx;
    }
    float sy = 1.0f;
    if (args.size() > 1 && toFloat(args[1], sy, nullptr))
      out.scaleY = sy;
  }

  if (findCall(transform, "rotate", args)) {
    float deg = 0.0f;
    std::string unit;
    if (toFloat(args[0], deg, &unit))
      out.rotation = toDegrees(deg, unit);
  }

  return out;
}

std::string format(const TransformValues &v) {
  return fmt::format("translate({}px, {}px) scale({}, {}) rotate({}deg)",
                     v.translateX, v.translateY, v.scaleX, v.scaleY,
                     v.rotation);
}

TransformValues merge(const TransformValues &base, const TransformPatch &patch) {
  TransformValues out = base;
  if (patch.translateX)
    out.translateX = *patch.translateX;
  if (patch.translateY)
    out.translateY = *patch.translateY;
  if (patch.scaleX)
    out.scaleX = *patch.scaleX;
  if (patch.scaleY)
    out.scaleY = *patch.scaleY;
  if (patch.rotation)
    out.rotation = *patch.rotation;
  return out;
}

bool isIdentity(const TransformValues &v) {
  return v == TransformValues{};
}

} // namespace Scrim::TransformCodec
