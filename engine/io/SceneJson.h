#pragma once

#include "scene/SceneTypes.h"

#include <string>
#include <string_view>

namespace Scrim::SceneJson {

struct SceneLoadError final {
  std::string message;
};

// {"tracks":[{"clips":[{"id":..,"startTimeInSeconds":..,
//   "endTimeInSeconds":..,"element":{"elements":["Tag;id:..;..."]}}]}]}
// A bare array of tracks is accepted as well. Element strings are decoded
// here, once; any malformed element fails the whole load.
bool parse(std::string_view text, Scene &out, SceneLoadError &err);

bool load(const std::string &path, Scene &out, SceneLoadError &err);

} // namespace Scrim::SceneJson
