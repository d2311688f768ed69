#pragma once

#include "SceneTypes.h"
#include "TransformValues.h"

#include <cstddef>

namespace Scrim {

class ElementTree;

inline constexpr const char *TransformKey = "transform";

// Transform of the clip's first root element (identity when it has none).
TransformValues clipTransform(const Clip &clip);
TransformValues rootTransform(const ElementTree &tree);

// Merges the patch into the transform of every root element and re-encodes
// it. Returns the number of elements rewritten.
size_t applyTransformPatch(Clip &clip, const TransformPatch &patch);

} // namespace Scrim
