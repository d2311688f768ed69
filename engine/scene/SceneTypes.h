#pragma once

#include "ElementRecord.h"

#include <string>
#include <vector>

namespace Scrim {

// Flat element list of one clip, decoded once at the scene boundary.
struct ClipElement final {
  std::vector<ElementRecord> elements;
};

// Owned by the timeline editor; read-only here except element transforms.
struct Clip final {
  std::string id;
  double startTimeInSeconds = 0.0;
  double endTimeInSeconds = 0.0;
  ClipElement element;
};

// Track index is z-order: later tracks draw on top.
struct Track final {
  std::vector<Clip> clips;
};

using Scene = std::vector<Track>;

} // namespace Scrim
