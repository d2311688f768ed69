#include "editor/TransformController.h"

#include "core/Log.h"
#include "editor/HitTest.h"

#include <algorithm>
#include <cmath>

namespace Scrim {

static constexpr float ScaleEpsilon = 1e-6f;

TransformController::TransformController(ManipulationSettings settings,
                                         LayoutHeuristics layout)
    : m_settings(settings), m_layout(layout) {}

void TransformController::setComposition(float width, float height) {
  if (m_compWidth == width && m_compHeight == height)
    return;
  m_compWidth = width;
  m_compHeight = height;
  updateMetrics();
}

void TransformController::setViewport(const ViewportRect &viewport) {
  m_viewport = viewport;
  updateMetrics();
}

void TransformController::updateMetrics() {
  m_metrics = computeDisplayMetrics(m_compWidth, m_compHeight, m_viewport);
  if (!m_metrics.valid())
    Log::Debug("TransformController: degenerate metrics (composition {}x{}, "
               "viewport {}x{})",
               m_compWidth, m_compHeight, m_viewport.size.x,
               m_viewport.size.y);
}

void TransformController::setPlaying(bool playing) {
  m_playing = playing;
  if (m_playing && m_session.active())
    endSession();
}

void TransformController::refresh(const Scene &scene, double frame,
                                  double fps) {
  BoundsQuery q{};
  q.compositionWidth = m_compWidth;
  q.compositionHeight = m_compHeight;
  q.heuristics = m_layout;
  m_overlay = buildOverlay(scene, frame, fps, q);

  if (m_session.active() && !findEntry(m_session.clipId)) {
    Log::Debug("TransformController: clip '{}' left the frame, ending {}",
               m_session.clipId, dragModeName(m_session.mode));
    endSession();
  }
}

const OverlayEntry *
TransformController::findEntry(const std::string &clipId) const {
  for (const OverlayEntry &e : m_overlay)
    if (e.clipId == clipId)
      return &e;
  return nullptr;
}

std::optional<OverlayHandles> TransformController::selectedHandles() const {
  if (!m_selection.clipId || !m_metrics.valid())
    return std::nullopt;
  const OverlayEntry *e = findEntry(*m_selection.clipId);
  if (!e)
    return std::nullopt;
  return overlayHandles(e->box, m_metrics, m_settings);
}

void TransformController::setSelection(std::optional<std::string> clipId,
                                       bool fromClick) {
  if (!m_selection.set(std::move(clipId)) && !fromClick)
    return;

  ManipulationEvent ev{};
  ev.type = ManipulationEventType::SelectionChanged;
  ev.clipId = m_selection.clipId.value_or(std::string());
  m_events.push(std::move(ev));
}

void TransformController::select(std::optional<std::string> clipId) {
  if (m_session.active() && (!clipId || *clipId != m_session.clipId))
    endSession();
  setSelection(std::move(clipId), false);
}

PressResult TransformController::pointerDown(const glm::vec2 &display) {
  if (m_playing || !m_metrics.valid())
    return PressResult::Ignored;
  if (m_session.active()) {
    Log::Debug("TransformController: press rejected, {} session active",
               dragModeName(m_session.mode));
    return PressResult::Rejected;
  }

  const glm::vec2 comp = m_metrics.toComposition(display);

  if (m_selection.clipId) {
    if (const OverlayEntry *sel = findEntry(*m_selection.clipId)) {
      const OverlayHandles handles =
          overlayHandles(sel->box, m_metrics, m_settings);
      const HandlePick pick =
          pickHandle(handles, display, m_settings.handleHitRadiusPx);
      if (pick.hit == HandleHit::Rotate) {
        beginSession(DragMode::Rotate, *sel, comp);
        return PressResult::SessionStarted;
      }
      if (pick.hit == HandleHit::Corner) {
        if (!beginScale(pick.corner, *sel, comp))
          return PressResult::Ignored;
        return PressResult::SessionStarted;
      }
    }
  }

  const auto hit = pickTopMost(m_overlay, comp);
  if (!hit) {
    setSelection(std::nullopt, true);
    return PressResult::Deselected;
  }

  const OverlayEntry &entry = m_overlay[*hit];
  if (m_selection.isSelected(entry.clipId)) {
    setSelection(entry.clipId, true);
    beginSession(DragMode::Translate, entry, comp);
    return PressResult::SessionStarted;
  }

  setSelection(entry.clipId, true);
  return PressResult::Selected;
}

void TransformController::beginSession(DragMode mode, const OverlayEntry &entry,
                                       const glm::vec2 &pointerComp) {
  m_session.reset();
  m_session.mode = mode;
  m_session.clipId = entry.clipId;
  m_session.pointerOrigin = pointerComp;
  m_session.initialTransform = entry.transform;
  m_session.initialCenter = entry.box.center;
  m_session.rotationDeg = entry.transform.rotation;

  Log::Debug("TransformController: {} session on '{}'", dragModeName(mode),
             entry.clipId);

  ManipulationEvent ev{};
  ev.type = ManipulationEventType::SessionBegan;
  ev.clipId = entry.clipId;
  ev.mode = mode;
  m_events.push(std::move(ev));
}

bool TransformController::beginScale(ScaleHandle handle,
                                     const OverlayEntry &entry,
                                     const glm::vec2 &pointerComp) {
  const TransformValues &t = entry.transform;
  const float sx = std::abs(t.scaleX);
  const float sy = std::abs(t.scaleY);
  if (sx < ScaleEpsilon || sy < ScaleEpsilon)
    return false;

  const glm::vec2 base = entry.box.size / glm::vec2(sx, sy);
  if (!(base.x > 0.0f) || !(base.y > 0.0f))
    return false;

  beginSession(DragMode::Scale, entry, pointerComp);
  const glm::vec2 s = handleSigns(handle);
  m_session.handle = handle;
  m_session.baseSize = base;
  m_session.anchor = entry.box.corner(-s.x, -s.y);
  return true;
}

void TransformController::endSession() {
  if (!m_session.active())
    return;

  Log::Debug("TransformController: {} session on '{}' ended",
             dragModeName(m_session.mode), m_session.clipId);

  ManipulationEvent ev{};
  ev.type = ManipulationEventType::SessionEnded;
  ev.clipId = m_session.clipId;
  ev.mode = m_session.mode;
  m_events.push(std::move(ev));

  m_session.reset();
}

std::optional<TransformPatch>
TransformController::pointerMove(const glm::vec2 &display) {
  if (!m_session.active() || !m_metrics.valid())
    return std::nullopt;

  const glm::vec2 comp = m_metrics.toComposition(display);

  std::optional<TransformPatch> patch;
  switch (m_session.mode) {
  case DragMode::Translate:
    patch = translateTo(comp);
    break;
  case DragMode::Rotate:
    patch = rotateTo(display);
    break;
  case DragMode::Scale:
    patch = scaleTo(comp);
    break;
  case DragMode::Idle:
  default:
    break;
  }
  if (!patch)
    return std::nullopt;

  ManipulationEvent ev{};
  ev.type = ManipulationEventType::TransformChanged;
  ev.clipId = m_session.clipId;
  ev.mode = m_session.mode;
  ev.patch = *patch;
  m_events.push(std::move(ev));
  return patch;
}

void TransformController::pointerUp() {
  endSession();
}

TransformPatch
TransformController::translateTo(const glm::vec2 &pointerComp) const {
  const glm::vec2 d = pointerComp - m_session.pointerOrigin;
  TransformPatch p{};
  p.translateX = m_session.initialTransform.translateX + d.x;
  p.translateY = m_session.initialTransform.translateY + d.y;
  return p;
}

std::optional<TransformPatch>
TransformController::rotateTo(const glm::vec2 &display) const {
  const OverlayEntry *e = findEntry(m_session.clipId);
  const glm::vec2 center =
      m_metrics.toDisplay(e ? e->box.center : m_session.initialCenter);
  const glm::vec2 d = display - center;
  if (d.x == 0.0f && d.y == 0.0f)
    return std::nullopt;

  TransformPatch p{};
  p.rotation = glm::degrees(std::atan2(d.y, d.x));
  return p;
}

TransformPatch
TransformController::scaleTo(const glm::vec2 &pointerComp) const {
  const glm::vec2 s = handleSigns(m_session.handle);
  const float minExtent = m_settings.minLocalExtentPx;

  // Dragged corner relative to the fixed anchor, in the unrotated frame.
  glm::vec2 local =
      rotate2D(pointerComp - m_session.anchor, -m_session.rotationDeg);
  if (local.x * s.x < minExtent)
    local.x = s.x * minExtent;
  if (local.y * s.y < minExtent)
    local.y = s.y * minExtent;

  const float scaleX =
      std::max(std::abs(local.x) / m_session.baseSize.x, m_settings.minScale);
  const float scaleY =
      std::max(std::abs(local.y) / m_session.baseSize.y, m_settings.minScale);

  // Re-derive the corner from the floored scale so the anchor stays put.
  local = s * glm::vec2(scaleX * m_session.baseSize.x,
                        scaleY * m_session.baseSize.y);
  const glm::vec2 dragged =
      m_session.anchor + rotate2D(local, m_session.rotationDeg);
  const glm::vec2 center = (m_session.anchor + dragged) * 0.5f;
  const glm::vec2 shift = center - m_session.initialCenter;

  TransformPatch p{};
  p.translateX = m_session.initialTransform.translateX + shift.x;
  p.translateY = m_session.initialTransform.translateY + shift.y;
  p.scaleX = scaleX;
  p.scaleY = scaleY;
  return p;
}

} // namespace Scrim
