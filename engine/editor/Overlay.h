#pragma once

#include "editor/DisplayMetrics.h"
#include "editor/DragSession.h"
#include "scene/BoundsResolver.h"
#include "scene/Geometry.h"
#include "scene/SceneTypes.h"
#include "scene/TransformValues.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace Scrim {

// What is selectable at the current frame, in composition space.
struct OverlayEntry final {
  std::string clipId;
  uint32_t trackIndex = 0;
  BoundingBox bounds{};         // layout box, translation folded in
  TransformValues transform{};  // clip root transform
  OrientedBox box{};            // bounds with scale and rotation applied
};

// Handle positions of one box in display space.
struct OverlayHandles final {
  std::array<glm::vec2, 4> corners{}; // indexed by ScaleHandle
  glm::vec2 rotate{0.0f};
  glm::vec2 center{0.0f};
};

// Visible clips with bounds, bottom track first. Clips without selectable
// content are skipped.
std::vector<OverlayEntry> buildOverlay(const Scene &scene, double frame,
                                       double fps, const BoundsQuery &query);

OverlayHandles overlayHandles(const OrientedBox &box,
                              const DisplayMetrics &metrics,
                              const ManipulationSettings &settings);

} // namespace Scrim
