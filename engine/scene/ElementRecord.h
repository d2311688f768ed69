#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Scrim {

// Ordered key/value bag. Keeps declaration order so encode() is stable.
class PropertyList final {
public:
  using Entry = std::pair<std::string, std::string>;

  const std::string *find(std::string_view key) const {
    for (const Entry &e : m_entries)
      if (e.first == key)
        return &e.second;
    return nullptr;
  }

  bool has(std::string_view key) const { return find(key) != nullptr; }

  // Empty string when absent.
  const std::string &get(std::string_view key) const {
    static const std::string empty{};
    const std::string *v = find(key);
    return v ? *v : empty;
  }

  // Overwrites in place, appends when new. Later duplicates win on decode.
  void set(std::string_view key, std::string value) {
    for (Entry &e : m_entries) {
      if (e.first == key) {
        e.second = std::move(value);
        return;
      }
    }
    m_entries.emplace_back(std::string(key), std::move(value));
  }

  size_t size() const { return m_entries.size(); }
  bool empty() const { return m_entries.empty(); }

  auto begin() const { return m_entries.begin(); }
  auto end() const { return m_entries.end(); }

  bool operator==(const PropertyList &o) const { return m_entries == o.m_entries; }
  bool operator!=(const PropertyList &o) const { return !(*this == o); }

private:
  std::vector<Entry> m_entries;
};

// One decoded "tag;id:..;parentId:..;key:value" line.
struct ElementRecord final {
  std::string tag;
  std::string id;
  std::string parentId;
  PropertyList properties;

  bool operator==(const ElementRecord &o) const {
    return tag == o.tag && id == o.id && parentId == o.parentId &&
           properties == o.properties;
  }
  bool operator!=(const ElementRecord &o) const { return !(*this == o); }
};

} // namespace Scrim
