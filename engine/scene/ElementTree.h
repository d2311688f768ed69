#pragma once

#include "ElementRecord.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Scrim {

// Parent/child index over a clip's flat element list.
//
// Root-level: parentId is a sentinel ("null", "root" or empty) that does not
// name an element of the list. Dangling parents and members of parent cycles
// are promoted to roots, so the resulting structure is always a forest.
class ElementTree final {
public:
  explicit ElementTree(const std::vector<ElementRecord> &elements);

  static bool isSentinel(std::string_view parentId);

  size_t size() const { return m_elements->size(); }
  const ElementRecord &element(size_t i) const { return (*m_elements)[i]; }

  // Declaration order.
  const std::vector<size_t> &roots() const { return m_roots; }
  const std::vector<size_t> &children(size_t i) const { return m_children[i]; }

  std::optional<size_t> indexOf(std::string_view id) const;
  std::optional<size_t> parentOf(size_t i) const;

  // Roots promoted because of a dangling or cyclic parent reference.
  const std::vector<size_t> &promotedRoots() const { return m_promoted; }

private:
  void breakCycles();

  const std::vector<ElementRecord> *m_elements = nullptr;
  std::unordered_map<std::string, size_t> m_byId;
  std::vector<std::optional<size_t>> m_parent;
  std::vector<std::vector<size_t>> m_children;
  std::vector<size_t> m_roots;
  std::vector<size_t> m_promoted;
};

} // namespace Scrim
