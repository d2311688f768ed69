#pragma once

#include <optional>
#include <string_view>

namespace Scrim {

enum class Axis : unsigned char { X = 0, Y };

// Composition extents CSS lengths resolve against.
struct LayoutFrame final {
  float width = 0.0f;
  float height = 0.0f;

  float extent(Axis a) const { return a == Axis::X ? width : height; }
};

// "120px", "50%", "10vw", "10vh", "120" -> pixels.
// % resolves against the axis extent, vw/vh against width/height.
// Empty or unparsable values are unset.
std::optional<float> resolveLength(std::string_view value, Axis axis,
                                   const LayoutFrame &frame);

// Literal "100%".
bool isFullPercent(std::string_view value);

struct EdgeInsets final {
  float top = 0.0f;
  float right = 0.0f;
  float bottom = 0.0f;
  float left = 0.0f;
};

// CSS padding/margin shorthand: 1 to 4 space separated lengths.
EdgeInsets resolveInsetShorthand(std::string_view value, const LayoutFrame &frame);

} // namespace Scrim
