#pragma once

#include "core/Log.h"
#include "editor/DragSession.h"
#include "scene/BoundsResolver.h"

#include <optional>
#include <string>
#include <string_view>

namespace Scrim {

// Tunables of the engine. Every key is optional in the JSON form:
// { "log": {"level", "file"},
//   "layout": {"charWidthFactor", ...},
//   "manipulation": {"minScale", ...} }
struct EngineConfig final {
  Log::LogSettings log;
  LayoutHeuristics layout;
  ManipulationSettings manipulation;
};

class EngineConfigIO final {
public:
  // nullopt on unreadable file or invalid JSON.
  static std::optional<EngineConfig> load(const std::string &absPath);
  static std::optional<EngineConfig> parse(std::string_view text);
};

} // namespace Scrim
