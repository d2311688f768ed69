#include "editor/Overlay.h"

#include "core/Log.h"
#include "scene/ClipTransform.h"
#include "scene/ElementTree.h"
#include "scene/VisibleClips.h"

namespace Scrim {

std::vector<OverlayEntry> buildOverlay(const Scene &scene, double frame,
                                       double fps, const BoundsQuery &query) {
  std::vector<OverlayEntry> out;
  BoundsQuery q = query;
  if (fps > 0.0)
    q.timeSeconds = frame / fps;

  for (const VisibleClip &vc : visibleClips(scene, frame, fps)) {
    // One tree and one transform decode per clip and refresh.
    const ElementTree tree(vc.clip->element.elements);
    const TransformValues transform = rootTransform(tree);
    const auto bounds = clipBounds(tree, transform, q);
    if (!bounds) {
      Log::Debug("Overlay: clip '{}' has no selectable area", vc.clip->id);
      continue;
    }

    OverlayEntry e{};
    e.clipId = vc.clip->id;
    e.trackIndex = vc.trackIndex;
    e.bounds = *bounds;
    e.transform = transform;
    e.box = transformedBounds(*bounds, e.transform);
    out.push_back(std::move(e));
  }
  return out;
}

OverlayHandles overlayHandles(const OrientedBox &box,
                              const DisplayMetrics &metrics,
                              const ManipulationSettings &settings) {
  OverlayHandles h{};
  const ScaleHandle order[4] = {ScaleHandle::TopLeft, ScaleHandle::TopRight,
                                ScaleHandle::BottomLeft,
                                ScaleHandle::BottomRight};
  for (ScaleHandle sh : order) {
    const glm::vec2 s = handleSigns(sh);
    h.corners[(size_t)sh] = metrics.toDisplay(box.corner(s.x, s.y));
  }

  h.center = metrics.toDisplay(box.center);

  // Right edge midpoint, pushed outward along the box' local +x so the
  // handle direction matches the rotation angle.
  const glm::vec2 edge =
      metrics.toDisplay(box.center + rotate2D({box.size.x * 0.5f, 0.0f},
                                              box.rotationDeg));
  h.rotate = edge + rotate2D({settings.rotateHandleOffsetPx, 0.0f},
                             box.rotationDeg);
  return h;
}

} // namespace Scrim
