#pragma once

#include "editor/DragSession.h"
#include "scene/TransformValues.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Scrim {

enum class ManipulationEventType : uint8_t {
  None = 0,

  SelectionChanged, // clipId: selection after a click, empty for none.
                    // Sent for every non-handle click, changed or not.
  TransformChanged, // clipId + patch, one per pointer move
  SessionBegan,     // clipId + mode
  SessionEnded      // clipId + mode
};

struct ManipulationEvent final {
  ManipulationEventType type = ManipulationEventType::None;
  std::string clipId;
  DragMode mode = DragMode::Idle;
  TransformPatch patch{};
};

// Delivery order is emission order; the consumer drains and clears.
class ManipulationEvents final {
public:
  void clear() { m_events.clear(); }

  void push(ManipulationEvent e) { m_events.push_back(std::move(e)); }

  const std::vector<ManipulationEvent> &events() const { return m_events; }
  bool empty() const { return m_events.empty(); }

private:
  std::vector<ManipulationEvent> m_events;
};

} // namespace Scrim
