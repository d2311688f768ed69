#pragma once

#include "SceneTypes.h"

#include <cstdint>
#include <vector>

namespace Scrim {

struct VisibleClip final {
  const Clip *clip = nullptr;
  uint32_t trackIndex = 0;
};

// Clips with start <= frame / fps < end, in track order (bottom first).
// Iterate in reverse for top-most first.
std::vector<VisibleClip> visibleClips(const Scene &tracks, double frame,
                                      double fps);

} // namespace Scrim
