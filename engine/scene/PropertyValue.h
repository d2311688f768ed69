#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace Scrim {

// Typed view over a raw element property string.
//   "true" / "false"            -> Bool
//   "-12.5"                     -> Number
//   "[a,b,c]"                   -> Array (of simple values)
//   "{k:v,k2:v2}"               -> Object (of simple values)
//   "@animate[0,1]:[0,100px]"   -> Animated (timestamps in composition seconds)
//   anything else               -> String
struct PropertyValue final {
  using Array = std::vector<PropertyValue>;
  using Object = std::vector<std::pair<std::string, PropertyValue>>;

  struct Animated final {
    std::vector<double> timestamps;
    Array values;
  };

  using Storage = std::variant<std::string, bool, double, Array, Object, Animated>;
  Storage v = std::string();

  PropertyValue() = default;
  PropertyValue(bool b) : v(b) {}
  PropertyValue(double n) : v(n) {}
  PropertyValue(std::string s) : v(std::move(s)) {}
  PropertyValue(Array a) : v(std::move(a)) {}
  PropertyValue(Object o) : v(std::move(o)) {}
  PropertyValue(Animated a) : v(std::move(a)) {}

  bool isString() const { return std::holds_alternative<std::string>(v); }
  bool isBool() const { return std::holds_alternative<bool>(v); }
  bool isNum() const { return std::holds_alternative<double>(v); }
  bool isArray() const { return std::holds_alternative<Array>(v); }
  bool isObject() const { return std::holds_alternative<Object>(v); }
  bool isAnimated() const { return std::holds_alternative<Animated>(v); }

  const std::string &asString() const;
  double asNum(double def = 0.0) const;
  bool asBool(bool def = false) const;
  const Array &asArray() const;
  const Object &asObject() const;
  const Animated *asAnimated() const;
};

struct PropertyParseError final {
  std::string message;
};

// Malformed animation syntax is the only hard failure; everything else
// degrades to a String.
bool parsePropertyValue(std::string_view raw, PropertyValue &out,
                        PropertyParseError &err);

// Numeric sample of an animated value at composition time t (seconds), eased
// in-out between keys and clamped outside the key range. Values may carry a
// unit suffix ("100px"); the unit of the first key is kept in the result.
// Returns nullopt when the values are not numeric.
std::optional<std::string> sampleAnimated(const PropertyValue::Animated &anim,
                                          double t);

// True for "@animate[...]" values (leading whitespace allowed).
bool isAnimatedValue(std::string_view raw);

// Raw property string resolved at time t: animated values are sampled, other
// values come back unchanged. Unparsable animations resolve to nullopt.
std::optional<std::string> resolveAtTime(std::string_view raw, double t);

} // namespace Scrim
