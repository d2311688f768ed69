#pragma once

#include <optional>

namespace Scrim {

struct TransformValues final {
  float translateX = 0.0f; // px
  float translateY = 0.0f; // px
  float scaleX = 1.0f;     // 1 = 100%
  float scaleY = 1.0f;
  float rotation = 0.0f; // degrees

  bool operator==(const TransformValues &o) const {
    return translateX == o.translateX && translateY == o.translateY &&
           scaleX == o.scaleX && scaleY == o.scaleY && rotation == o.rotation;
  }
  bool operator!=(const TransformValues &o) const { return !(*this == o); }
};

// Partial transform: unset fields keep the base value on merge.
struct TransformPatch final {
  std::optional<float> translateX;
  std::optional<float> translateY;
  std::optional<float> scaleX;
  std::optional<float> scaleY;
  std::optional<float> rotation;

  bool empty() const {
    return !translateX && !translateY && !scaleX && !scaleY && !rotation;
  }
};

} // namespace Scrim
