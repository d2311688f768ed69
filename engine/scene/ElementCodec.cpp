#include "ElementCodec.h"

#include "core/Log.h"

namespace Scrim::ElementCodec {

static std::string_view trim(std::string_view s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r' || s[b] == '\n'))
    ++b;
  while (e > b &&
         (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r' ||
          s[e - 1] == '\n'))
    --e;
  return s.substr(b, e - b);
}

static bool fail(ElementDecodeError &err, std::string msg) {
  err.message = std::move(msg);
  return false;
}

bool decode(std::string_view line, ElementRecord &out, ElementDecodeError &err) {
  out = ElementRecord{};

  size_t pos = line.find(SegmentSeparator);
  const std::string_view tag = trim(line.substr(0, pos));
  if (tag.empty())
    return fail(err, "missing tag segment");
  if (tag.find(KeySeparator) != std::string_view::npos)
    return fail(err, fmt::format("tag segment looks like a property: '{}'", tag));
  out.tag = std::string(tag);

  bool hasId = false;
  bool hasParent = false;

  while (pos != std::string_view::npos) {
    const size_t start = pos + 1;
    pos = line.find(SegmentSeparator, start);
    const std::string_view seg =
        line.substr(start, pos == std::string_view::npos ? pos : pos - start);
    if (trim(seg).empty())
      continue;

    // Values may contain ':' (rgba(..), urls); only the first one splits.
    const size_t colon = seg.find(KeySeparator);
    if (colon == std::string_view::npos) {
      Log::Warn("ElementCodec: segment without ':' in <{}>: '{}'", out.tag,
                trim(seg));
      continue;
    }

    const std::string_view key = trim(seg.substr(0, colon));
    const std::string_view value = seg.substr(colon + 1);
    if (key.empty()) {
      Log::Warn("ElementCodec: empty key in <{}>: '{}'", out.tag, trim(seg));
      continue;
    }

    if (key == IdKey) {
      out.id = std::string(trim(value));
      hasId = !out.id.empty();
      continue;
    }
    if (key == ParentIdKey || key == ParentAliasKey) {
      out.parentId = std::string(trim(value));
      hasParent = true;
      continue;
    }
    out.properties.set(key, std::string(value));
  }

  if (!hasId)
    return fail(err, fmt::format("missing required 'id' in element <{}>",
                                 out.tag));
  if (!hasParent)
    return fail(err, fmt::format("missing required 'parentId' in element '{}'",
                                 out.id));
  return true;
}

bool decodeAll(const std::vector<std::string> &lines,
               std::vector<ElementRecord> &out, ElementDecodeError &err) {
  out.clear();
  out.reserve(lines.size());
  for (size_t i = 0; i < lines.size(); ++i) {
    ElementRecord rec;
    if (!decode(lines[i], rec, err)) {
      err.index = i;
      return false;
    }
    out.push_back(std::move(rec));
  }
  return true;
}

std::string encode(const ElementRecord &record) {
  std::string s = record.tag;
  s.push_back(SegmentSeparator);
  s.append(IdKey);
  s.push_back(KeySeparator);
  s += record.id;
  s.push_back(SegmentSeparator);
  s.append(ParentIdKey);
  s.push_back(KeySeparator);
  s += record.parentId;
  for (const auto &[key, value] : record.properties) {
    s.push_back(SegmentSeparator);
    s += key;
    s.push_back(KeySeparator);
    s += value;
  }
  return s;
}

} // namespace Scrim::ElementCodec
