#include "VisibleClips.h"

namespace Scrim {

std::vector<VisibleClip> visibleClips(const Scene &tracks, double frame,
                                      double fps) {
  std::vector<VisibleClip> out;
  if (!(fps > 0.0))
    return out;

  const double t = frame / fps;
  for (size_t ti = 0; ti < tracks.size(); ++ti) {
    for (const Clip &c : tracks[ti].clips) {
      if (t >= c.startTimeInSeconds && t < c.endTimeInSeconds)
        out.push_back({&c, (uint32_t)ti});
    }
  }
  return out;
}

} // namespace Scrim
