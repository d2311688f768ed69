#include "PropertyValue.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <spdlog/fmt/fmt.h>

namespace Scrim {

static const std::string &emptyStr() {
  static std::string s{};
  return s;
}
static const PropertyValue::Array &emptyArr() {
  static PropertyValue::Array a{};
  return a;
}
static const PropertyValue::Object &emptyObj() {
  static PropertyValue::Object o{};
  return o;
}

const std::string &PropertyValue::asString() const {
  if (!isString())
    return emptyStr();
  return std::get<std::string>(v);
}
double PropertyValue::asNum(double def) const {
  if (!isNum())
    return def;
  return std::get<double>(v);
}
bool PropertyValue::asBool(bool def) const {
  if (!isBool())
    return def;
  return std::get<bool>(v);
}
const PropertyValue::Array &PropertyValue::asArray() const {
  if (!isArray())
    return emptyArr();
  return std::get<Array>(v);
}
const PropertyValue::Object &PropertyValue::asObject() const {
  if (!isObject())
    return emptyObj();
  return std::get<Object>(v);
}
const PropertyValue::Animated *PropertyValue::asAnimated() const {
  return std::get_if<Animated>(&v);
}

static std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
    s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
    s.remove_suffix(1);
  return s;
}

static std::vector<std::string_view> splitComma(std::string_view s) {
  std::vector<std::string_view> out;
  size_t start = 0;
  while (true) {
    const size_t c = s.find(',', start);
    out.push_back(trim(s.substr(start, c == std::string_view::npos ? c : c - start)));
    if (c == std::string_view::npos)
      break;
    start = c + 1;
  }
  return out;
}

// -?\d+\.?\d*
static bool isPlainNumber(std::string_view s) {
  size_t i = 0;
  if (i < s.size() && s[i] == '-')
    ++i;
  const size_t digitsStart = i;
  while (i < s.size() && s[i] >= '0' && s[i] <= '9')
    ++i;
  if (i == digitsStart)
    return false;
  if (i < s.size() && s[i] == '.')
    ++i;
  while (i < s.size() && s[i] >= '0' && s[i] <= '9')
    ++i;
  return i == s.size();
}

static double toNumber(std::string_view s) {
  const std::string tmp(s);
  return std::strtod(tmp.c_str(), nullptr);
}

static PropertyValue parseSimple(std::string_view s) {
  if (s == "true")
    return PropertyValue(true);
  if (s == "false")
    return PropertyValue(false);
  if (isPlainNumber(s))
    return PropertyValue(toNumber(s));
  return PropertyValue(std::string(s));
}

static bool parseAnimated(std::string_view s, PropertyValue &out,
                          PropertyParseError &err) {
  constexpr std::string_view prefix = "@animate[";
  const size_t closeTs = s.find(']', prefix.size());
  if (closeTs == std::string_view::npos ||
      s.substr(closeTs + 1, 2) != ":[" || s.back() != ']') {
    err.message = fmt::format("invalid animation syntax: {}", s);
    return false;
  }

  const std::string_view tsStr =
      s.substr(prefix.size(), closeTs - prefix.size());
  const std::string_view valStr =
      s.substr(closeTs + 3, s.size() - closeTs - 4);

  PropertyValue::Animated anim;
  for (std::string_view t : splitComma(tsStr)) {
    const std::string tmp(t);
    char *end = nullptr;
    const double n = std::strtod(tmp.c_str(), &end);
    if (tmp.empty() || end == tmp.c_str()) {
      err.message = fmt::format("invalid timestamp '{}' in animation", t);
      return false;
    }
    anim.timestamps.push_back(n);
  }
  for (std::string_view v : splitComma(valStr))
    anim.values.push_back(parseSimple(v));

  if (anim.timestamps.size() != anim.values.size()) {
    err.message = fmt::format(
        "animation timestamp/value count mismatch: {} timestamps, {} values",
        anim.timestamps.size(), anim.values.size());
    return false;
  }
  if (anim.timestamps.size() < 2) {
    err.message = "animation needs at least 2 keyframes";
    return false;
  }

  out = PropertyValue(std::move(anim));
  return true;
}

bool parsePropertyValue(std::string_view raw, PropertyValue &out,
                        PropertyParseError &err) {
  const std::string_view s = trim(raw);

  if (s.rfind("@animate[", 0) == 0)
    return parseAnimated(s, out, err);

  if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
    PropertyValue::Array arr;
    const std::string_view content = trim(s.substr(1, s.size() - 2));
    if (!content.empty())
      for (std::string_view item : splitComma(content))
        arr.push_back(parseSimple(item));
    out = PropertyValue(std::move(arr));
    return true;
  }

  if (s.size() >= 2 && s.front() == '{' && s.back() == '}') {
    PropertyValue::Object obj;
    const std::string_view content = trim(s.substr(1, s.size() - 2));
    if (!content.empty()) {
      for (std::string_view pair : splitComma(content)) {
        const size_t colon = pair.find(':');
        if (colon == std::string_view::npos)
          continue;
        const std::string_view key = trim(pair.substr(0, colon));
        if (key.empty())
          continue;
        obj.emplace_back(std::string(key),
                         parseSimple(trim(pair.substr(colon + 1))));
      }
    }
    out = PropertyValue(std::move(obj));
    return true;
  }

  out = parseSimple(s);
  return true;
}

// Leading number of "12.5px" -> 12.5, unit "px".
static bool splitNumberUnit(const PropertyValue &v, double &num,
                            std::string &unit) {
  if (v.isNum()) {
    num = v.asNum();
    unit.clear();
    return true;
  }
  if (!v.isString())
    return false;
  const std::string &s = v.asString();
  char *end = nullptr;
  num = std::strtod(s.c_str(), &end);
  if (end == s.c_str())
    return false;
  unit.assign(end);
  return true;
}

static double easeInOut(double t) {
  return (t < 0.5) ? 4.0 * t * t * t
                   : 1.0 - std::pow(-2.0 * t + 2.0, 3.0) / 2.0;
}

std::optional<std::string> sampleAnimated(const PropertyValue::Animated &anim,
                                          double t) {
  const size_t n = std::min(anim.timestamps.size(), anim.values.size());
  if (n == 0)
    return std::nullopt;

  std::vector<double> nums(n);
  std::string unit;
  for (size_t i = 0; i < n; ++i) {
    std::string u;
    if (!splitNumberUnit(anim.values[i], nums[i], u))
      return std::nullopt;
    if (i == 0)
      unit = u;
  }

  double value = nums.back();
  if (n == 1 || t <= anim.timestamps.front()) {
    value = nums.front();
  } else if (t < anim.timestamps.back()) {
    for (size_t i = 0; i + 1 < n; ++i) {
      const double a = anim.timestamps[i];
      const double b = anim.timestamps[i + 1];
      if (t >= a && t <= b) {
        const double span = b - a;
        const double k = span > 0.0 ? easeInOut((t - a) / span) : 1.0;
        value = nums[i] + k * (nums[i + 1] - nums[i]);
        break;
      }
    }
  }

  return fmt::format("{}{}", value, unit);
}

bool isAnimatedValue(std::string_view raw) {
  return trim(raw).rfind("@animate[", 0) == 0;
}

std::optional<std::string> resolveAtTime(std::string_view raw, double t) {
  if (!isAnimatedValue(raw))
    return std::string(raw);

  PropertyValue pv;
  PropertyParseError err;
  if (!parsePropertyValue(raw, pv, err))
    return std::nullopt;
  return sampleAnimated(*pv.asAnimated(), t);
}

} // namespace Scrim
