#include "Dimension.h"

#include <cmath>
#include <cstdlib>
#include <string>
#include <vector>

namespace Scrim {

static std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
    s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
    s.remove_suffix(1);
  return s;
}

std::optional<float> resolveLength(std::string_view value, Axis axis,
                                   const LayoutFrame &frame) {
  const std::string s(trim(value));
  if (s.empty())
    return std::nullopt;

  char *end = nullptr;
  const float n = std::strtof(s.c_str(), &end);
  if (end == s.c_str() || !std::isfinite(n))
    return std::nullopt;

  const std::string_view unit = trim(std::string_view(end));
  if (unit.empty() || unit == "px")
    return n;
  if (unit == "%")
    return n / 100.0f * frame.extent(axis);
  if (unit == "vw")
    return n / 100.0f * frame.width;
  if (unit == "vh")
    return n / 100.0f * frame.height;
  return std::nullopt;
}

bool isFullPercent(std::string_view value) {
  return trim(value) == "100%";
}

EdgeInsets resolveInsetShorthand(std::string_view value,
                                 const LayoutFrame &frame) {
  std::vector<std::string_view> parts;
  std::string_view rest = trim(value);
  while (!rest.empty()) {
    const size_t sp = rest.find(' ');
    parts.push_back(rest.substr(0, sp));
    if (sp == std::string_view::npos)
      break;
    rest = trim(rest.substr(sp + 1));
  }

  auto len = [&](size_t i, Axis a) {
    return resolveLength(parts[i], a, frame).value_or(0.0f);
  };

  EdgeInsets e{};
  switch (parts.size()) {
  case 1:
    e.top = len(0, Axis::Y);
    e.bottom = e.top;
    e.left = len(0, Axis::X);
    e.right = e.left;
    break;
  case 2:
    e.top = e.bottom = len(0, Axis::Y);
    e.left = e.right = len(1, Axis::X);
    break;
  case 3:
    e.top = len(0, Axis::Y);
    e.left = e.right = len(1, Axis::X);
    e.bottom = len(2, Axis::Y);
    break;
  case 4:
    e.top = len(0, Axis::Y);
    e.right = len(1, Axis::X);
    e.bottom = len(2, Axis::Y);
    e.left = len(3, Axis::X);
    break;
  default:
    break;
  }
  return e;
}

} // namespace Scrim
