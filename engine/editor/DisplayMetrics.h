#pragma once

#include "scene/Geometry.h"

#include <glm/glm.hpp>

namespace Scrim {

// Live viewport rectangle in pointer coordinates.
struct ViewportRect final {
  glm::vec2 origin{0.0f};
  glm::vec2 size{0.0f};
};

// Composition space -> letterboxed display space.
struct DisplayMetrics final {
  float scaleX = 0.0f;
  float scaleY = 0.0f;
  float offsetX = 0.0f;
  float offsetY = 0.0f;
  glm::vec2 displaySize{0.0f}; // letterboxed image size

  bool valid() const { return scaleX > 0.0f && scaleY > 0.0f; }

  glm::vec2 toComposition(const glm::vec2 &display) const {
    return {(display.x - offsetX) / scaleX, (display.y - offsetY) / scaleY};
  }
  glm::vec2 toDisplay(const glm::vec2 &comp) const {
    return {comp.x * scaleX + offsetX, comp.y * scaleY + offsetY};
  }
  BoundingBox toDisplay(const BoundingBox &b) const {
    return {b.x * scaleX + offsetX, b.y * scaleY + offsetY, b.width * scaleX,
            b.height * scaleY};
  }

  // Point lies on the letterboxed image, not in the bars.
  bool insideImage(const glm::vec2 &display) const;
};

// The overflowing axis is clamped to the viewport, the other keeps the
// composition aspect ratio and is centered. Invalid (zero scale) metrics for
// degenerate composition or viewport sizes.
DisplayMetrics computeDisplayMetrics(float compositionWidth,
                                     float compositionHeight,
                                     const ViewportRect &viewport);

} // namespace Scrim
