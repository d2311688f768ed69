#pragma once

#include "Geometry.h"
#include "SceneTypes.h"
#include "TransformValues.h"

#include <optional>
#include <string_view>
#include <vector>

namespace Scrim {

class ElementTree;

// Constants of the layout emulation (see EngineConfig "layout").
struct LayoutHeuristics final {
  float charWidthFactor = 0.55f;
  float boldCharWidthFactor = 0.65f;
  float lineHeightFactor = 1.3f;
  float defaultFontSizePx = 16.0f;

  // Where content without geometry or layout hints is placed.
  float fallbackAnchorX = 0.25f;
  float fallbackAnchorY = 0.35f;
};

struct BoundsQuery final {
  float compositionWidth = 0.0f;
  float compositionHeight = 0.0f;
  double timeSeconds = 0.0; // samples @animate values
  LayoutHeuristics heuristics{};
};

struct TextFootprint final {
  float width = 0.0f;
  float height = 0.0f;
};

TextFootprint estimateText(std::string_view text, float fontSizePx, bool bold,
                           const LayoutHeuristics &h);

// Smallest box enclosing all of them; zero box for an empty list.
BoundingBox envelope(const std::vector<BoundingBox> &boxes);

// Content size of the subtree under `index`, positioned at the origin.
// nullopt when nothing measurable was found.
std::optional<BoundingBox> contentBounds(const ElementTree &tree, size_t index,
                                         const BoundsQuery &q);

// Selectable rectangle of a clip in composition space, or nullopt for clips
// without root elements or with nothing measurable. Only the translation of
// an element transform is folded in.
std::optional<BoundingBox> clipBounds(const Clip &clip, const BoundsQuery &q);

// Same, over a tree the caller already built. `rootTransform` is the decoded
// transform of the first root; further roots decode their own.
std::optional<BoundingBox> clipBounds(const ElementTree &tree,
                                      const TransformValues &rootTransform,
                                      const BoundsQuery &q);

std::optional<BoundingBox> clipBounds(const Clip &clip, float compositionWidth,
                                      float compositionHeight);

// Bounds as drawn: scaled about the center, then rotated.
OrientedBox transformedBounds(const BoundingBox &bounds,
                              const TransformValues &transform);

} // namespace Scrim
