#pragma once

#include "editor/DisplayMetrics.h"
#include "editor/DragSession.h"
#include "editor/ManipulationEvents.h"
#include "editor/Overlay.h"
#include "editor/Selection.h"
#include "scene/BoundsResolver.h"
#include "scene/SceneTypes.h"

#include <cstdint>
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Scrim {

enum class PressResult : uint8_t {
  Ignored = 0, // playing, or no usable metrics
  Rejected,    // a session is already active
  Selected,    // selection moved to another clip
  Deselected,  // pressed on empty space
  SessionStarted
};

// Selection and drag state machine of one editor viewport:
//   Idle -> Translating | Rotating | Scaling(corner) -> Idle
//
// Inputs are pushed by the owner (frame changes via refresh(), viewport
// resizes, pointer events in display coordinates). Outputs are queued in
// events() and the patch of each move is also returned. Scene data is never
// mutated here; the owner merges patches into the clip (applyTransformPatch)
// and calls refresh() again.
class TransformController final {
public:
  explicit TransformController(ManipulationSettings settings = {},
                               LayoutHeuristics layout = {});

  void setComposition(float width, float height);
  void setViewport(const ViewportRect &viewport);
  void setPlaying(bool playing);

  // Rebuilds the selectable boxes for the displayed frame.
  void refresh(const Scene &scene, double frame, double fps);

  PressResult pointerDown(const glm::vec2 &display);
  std::optional<TransformPatch> pointerMove(const glm::vec2 &display);
  void pointerUp();

  // External selection change; cancels a session on another clip.
  void select(std::optional<std::string> clipId);
  void deselect() { select(std::nullopt); }

  const std::optional<std::string> &selectedClipId() const {
    return m_selection.clipId;
  }
  DragMode mode() const { return m_session.mode; }
  const DragSession &session() const { return m_session; }
  bool playing() const { return m_playing; }

  const DisplayMetrics &metrics() const { return m_metrics; }
  const std::vector<OverlayEntry> &overlay() const { return m_overlay; }
  const OverlayEntry *findEntry(const std::string &clipId) const;

  // Handles of the selected clip, when it is visible.
  std::optional<OverlayHandles> selectedHandles() const;

  ManipulationEvents &events() { return m_events; }
  const ManipulationEvents &events() const { return m_events; }

private:
  void updateMetrics();
  // Clicks report every time; external calls only report changes.
  void setSelection(std::optional<std::string> clipId, bool fromClick);
  void beginSession(DragMode mode, const OverlayEntry &entry,
                    const glm::vec2 &pointerComp);
  bool beginScale(ScaleHandle handle, const OverlayEntry &entry,
                  const glm::vec2 &pointerComp);
  void endSession();

  TransformPatch translateTo(const glm::vec2 &pointerComp) const;
  std::optional<TransformPatch> rotateTo(const glm::vec2 &display) const;
  TransformPatch scaleTo(const glm::vec2 &pointerComp) const;

  ManipulationSettings m_settings;
  LayoutHeuristics m_layout;

  float m_compWidth = 0.0f;
  float m_compHeight = 0.0f;
  ViewportRect m_viewport{};
  DisplayMetrics m_metrics{};
  bool m_playing = false;

  std::vector<OverlayEntry> m_overlay;
  ClipSelection m_selection;
  DragSession m_session;
  ManipulationEvents m_events;
};

} // namespace Scrim
