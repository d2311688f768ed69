#include "ElementTree.h"

#include "core/Log.h"

#include <algorithm>
#include <cstdint>

namespace Scrim {

bool ElementTree::isSentinel(std::string_view parentId) {
  return parentId.empty() || parentId == "null" || parentId == "root";
}

ElementTree::ElementTree(const std::vector<ElementRecord> &elements)
    : m_elements(&elements) {
  const size_t n = elements.size();
  m_parent.assign(n, std::nullopt);
  m_children.assign(n, {});

  for (size_t i = 0; i < n; ++i) {
    const auto [it, inserted] = m_byId.emplace(elements[i].id, i);
    if (!inserted)
      Log::Debug("ElementTree: duplicate element id '{}' (index {} shadows {})",
                elements[i].id, i, it->second);
  }

  for (size_t i = 0; i < n; ++i) {
    const ElementRecord &e = elements[i];
    auto it = m_byId.find(e.parentId);
    if (it == m_byId.end()) {
      if (!isSentinel(e.parentId)) {
        Log::Debug("ElementTree: element '{}' has dangling parent '{}', "
                  "treating it as a root",
                  e.id, e.parentId);
        m_promoted.push_back(i);
      }
      continue;
    }
    if (it->second == i) {
      Log::Debug("ElementTree: element '{}' is its own parent, treating it as "
                "a root",
                e.id);
      m_promoted.push_back(i);
      continue;
    }
    m_parent[i] = it->second;
  }

  breakCycles();

  for (size_t i = 0; i < n; ++i) {
    if (m_parent[i])
      m_children[*m_parent[i]].push_back(i);
    else
      m_roots.push_back(i);
  }
}

void ElementTree::breakCycles() {
  // 0: unvisited, 1: on current walk, 2: reaches a root
  std::vector<uint8_t> state(m_parent.size(), 0);
  std::vector<size_t> path;

  for (size_t start = 0; start < m_parent.size(); ++start) {
    path.clear();
    size_t j = start;
    while (state[j] == 0) {
      state[j] = 1;
      path.push_back(j);
      if (!m_parent[j])
        break;
      j = *m_parent[j];
    }

    if (state[j] == 1 && m_parent[j]) {
      // Walk closed on itself: every member of the loop becomes a root.
      auto loopBegin = std::find(path.begin(), path.end(), j);
      for (auto it = loopBegin; it != path.end(); ++it) {
        Log::Debug("ElementTree: element '{}' is part of a parent cycle, "
                  "treating it as a root",
                  element(*it).id);
        m_parent[*it].reset();
        m_promoted.push_back(*it);
      }
    }

    for (size_t p : path)
      state[p] = 2;
  }
}

std::optional<size_t> ElementTree::indexOf(std::string_view id) const {
  auto it = m_byId.find(std::string(id));
  if (it == m_byId.end())
    return std::nullopt;
  return it->second;
}

std::optional<size_t> ElementTree::parentOf(size_t i) const {
  return m_parent[i];
}

} // namespace Scrim
