#pragma once

#include "ElementRecord.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace Scrim::ElementCodec {

inline constexpr char SegmentSeparator = ';';
inline constexpr char KeySeparator = ':';

inline constexpr std::string_view IdKey = "id";
inline constexpr std::string_view ParentIdKey = "parentId";
inline constexpr std::string_view ParentAliasKey = "parent";

struct ElementDecodeError final {
  size_t index = 0; // element index within a list (decodeAll)
  std::string message;
};

// Hard failure on an empty or unparsable tag (one holding ':'), a missing id
// or a missing parentId.
bool decode(std::string_view line, ElementRecord &out, ElementDecodeError &err);

// Stops at the first malformed line; err.index names it.
bool decodeAll(const std::vector<std::string> &lines,
               std::vector<ElementRecord> &out, ElementDecodeError &err);

// "tag;id:X;parentId:Y;key:value;..."
std::string encode(const ElementRecord &record);

} // namespace Scrim::ElementCodec
