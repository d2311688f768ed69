#include "editor/DisplayMetrics.h"

namespace Scrim {

bool DisplayMetrics::insideImage(const glm::vec2 &display) const {
  if (!valid())
    return false;
  const float u = (display.x - offsetX) / displaySize.x;
  const float v = (display.y - offsetY) / displaySize.y;
  return u >= 0.0f && u <= 1.0f && v >= 0.0f && v <= 1.0f;
}

DisplayMetrics computeDisplayMetrics(float compositionWidth,
                                     float compositionHeight,
                                     const ViewportRect &viewport) {
  DisplayMetrics m{};
  if (!(compositionWidth > 0.0f) || !(compositionHeight > 0.0f) ||
      !(viewport.size.x > 0.0f) || !(viewport.size.y > 0.0f))
    return m;

  const float compAspect = compositionWidth / compositionHeight;
  const float viewAspect = viewport.size.x / viewport.size.y;

  float w = 0.0f;
  float h = 0.0f;
  if (viewAspect > compAspect) {
    // Wider than the composition: bars left and right.
    h = viewport.size.y;
    w = h * compAspect;
  } else {
    // Taller: bars top and bottom.
    w = viewport.size.x;
    h = w / compAspect;
  }

  m.displaySize = {w, h};
  m.scaleX = w / compositionWidth;
  m.scaleY = h / compositionHeight;
  m.offsetX = viewport.origin.x + (viewport.size.x - w) * 0.5f;
  m.offsetY = viewport.origin.y + (viewport.size.y - h) * 0.5f;
  return m;
}

} // namespace Scrim
