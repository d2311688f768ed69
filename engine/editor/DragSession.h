#pragma once

#include "scene/TransformValues.h"

#include <cstdint>
#include <glm/glm.hpp>
#include <string>

namespace Scrim {

enum class DragMode : uint8_t { Idle = 0, Translate, Rotate, Scale };

enum class ScaleHandle : uint8_t { TopLeft = 0, TopRight, BottomLeft, BottomRight };

// Local-frame direction of a corner from the box center; also the sign the
// dragged corner's local delta from the anchor must keep.
inline glm::vec2 handleSigns(ScaleHandle h) {
  switch (h) {
  case ScaleHandle::TopLeft:
    return {-1.0f, -1.0f};
  case ScaleHandle::TopRight:
    return {1.0f, -1.0f};
  case ScaleHandle::BottomLeft:
    return {-1.0f, 1.0f};
  case ScaleHandle::BottomRight:
  default:
    return {1.0f, 1.0f};
  }
}

inline const char *dragModeName(DragMode m) {
  switch (m) {
  case DragMode::Translate:
    return "translate";
  case DragMode::Rotate:
    return "rotate";
  case DragMode::Scale:
    return "scale";
  case DragMode::Idle:
  default:
    return "idle";
  }
}

struct ManipulationSettings final {
  float minScale = 0.01f;
  float minLocalExtentPx = 1.0f; // composition px
  float handleHitRadiusPx = 8.0f; // display px
  float rotateHandleOffsetPx = 24.0f; // display px beyond the right edge
};

// One press-to-release gesture. Everything is captured at press time and
// every move is computed from it, never from the previous move.
struct DragSession final {
  DragMode mode = DragMode::Idle;
  ScaleHandle handle = ScaleHandle::BottomRight;
  std::string clipId;

  glm::vec2 pointerOrigin{0.0f}; // composition space
  TransformValues initialTransform{};
  glm::vec2 initialCenter{0.0f}; // composition space

  // Scale only.
  glm::vec2 baseSize{0.0f}; // unscaled bounds size
  glm::vec2 anchor{0.0f};   // opposite corner, world (composition) space
  float rotationDeg = 0.0f;

  bool active() const { return mode != DragMode::Idle; }
  void reset() { *this = DragSession{}; }
};

} // namespace Scrim
