#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace Scrim {

// Single-clip selection reported to the editor.
struct ClipSelection {
  std::optional<std::string> clipId;

  bool isSelected(std::string_view id) const {
    return clipId && *clipId == id;
  }

  // False when nothing changed.
  bool set(std::optional<std::string> id) {
    if (clipId == id)
      return false;
    clipId = std::move(id);
    return true;
  }
};

} // namespace Scrim
