#include "BoundsResolver.h"

#include "ClipTransform.h"
#include "Dimension.h"
#include "ElementTree.h"
#include "PropertyValue.h"
#include "TransformCodec.h"
#include "core/Log.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <string>

namespace Scrim {

namespace {

// Property value at the query time. Plain values are viewed in place, only
// @animate values are sampled into a string of their own.
struct Prop final {
  std::string_view raw;
  std::optional<std::string> sampled;

  std::string_view str() const {
    return sampled ? std::string_view(*sampled) : raw;
  }
};

// Absent and unparsable animations are both unset.
std::optional<Prop> prop(const ElementRecord &e, std::string_view key,
                         const BoundsQuery &q) {
  const std::string *raw = e.properties.find(key);
  if (!raw)
    return std::nullopt;
  if (!isAnimatedValue(*raw))
    return Prop{*raw, std::nullopt};
  auto sampled = resolveAtTime(*raw, q.timeSeconds);
  if (!sampled)
    return std::nullopt;
  return Prop{{}, std::move(sampled)};
}

std::optional<float> length(const ElementRecord &e, std::string_view key,
                            Axis axis, const LayoutFrame &frame,
                            const BoundsQuery &q) {
  const auto v = prop(e, key, q);
  if (!v)
    return std::nullopt;
  return resolveLength(v->str(), axis, frame);
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size())
    return false;
  for (size_t i = 0; i < a.size(); ++i)
    if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i]))
      return false;
  return true;
}

bool isBoldWeight(std::string_view w) {
  return w == "bold" || w == "700" || w == "800" || w == "900";
}

// Transparent flex wrapper: a div with display:flex and 100%/100% size.
bool isPositioningContainer(const ElementRecord &e, const BoundsQuery &q) {
  if (!equalsIgnoreCase(e.tag, "div"))
    return false;
  const auto display = prop(e, "display", q);
  const auto w = prop(e, "width", q);
  const auto h = prop(e, "height", q);
  return display && display->str() == "flex" && w &&
         isFullPercent(w->str()) && h && isFullPercent(h->str());
}

bool nearlyEqual(float a, float b) {
  return std::abs(a - b) <= 0.5f;
}

enum class FlexAlign : unsigned char { Start, Center, End };

FlexAlign parseAlign(const std::optional<Prop> &v, FlexAlign def) {
  if (!v)
    return def;
  const std::string_view s = v->str();
  if (s == "center")
    return FlexAlign::Center;
  if (s == "flex-end" || s == "end")
    return FlexAlign::End;
  return FlexAlign::Start;
}

EdgeInsets resolvePadding(const ElementRecord &e, const LayoutFrame &frame,
                          const BoundsQuery &q) {
  EdgeInsets pad{};
  if (const auto shorthand = prop(e, "padding", q))
    pad = resolveInsetShorthand(shorthand->str(), frame);
  if (const auto v = length(e, "paddingTop", Axis::Y, frame, q))
    pad.top = *v;
  if (const auto v = length(e, "paddingRight", Axis::X, frame, q))
    pad.right = *v;
  if (const auto v = length(e, "paddingBottom", Axis::Y, frame, q))
    pad.bottom = *v;
  if (const auto v = length(e, "paddingLeft", Axis::X, frame, q))
    pad.left = *v;
  return pad;
}

std::optional<BoundingBox> rootBounds(const ElementTree &tree, size_t index,
                                      const TransformValues &transform,
                                      const BoundsQuery &q) {
  const ElementRecord &e = tree.element(index);
  const LayoutFrame frame{q.compositionWidth, q.compositionHeight};
  const float W = q.compositionWidth;
  const float H = q.compositionHeight;

  const auto width = length(e, "width", Axis::X, frame, q);
  const auto height = length(e, "height", Axis::Y, frame, q);
  const auto left = length(e, "left", Axis::X, frame, q);
  const auto top = length(e, "top", Axis::Y, frame, q);

  float x = left.value_or(0.0f);
  float y = top.value_or(0.0f);

  const auto rawW = prop(e, "width", q);
  const auto rawH = prop(e, "height", q);
  // AbsoluteFill is full-bleed unless it declares its own size.
  const bool fill = equalsIgnoreCase(e.tag, "AbsoluteFill");
  const bool fullW = (width && nearlyEqual(*width, W)) ||
                     (rawW && isFullPercent(rawW->str())) || (fill && !rawW);
  const bool fullH = (height && nearlyEqual(*height, H)) ||
                     (rawH && isFullPercent(rawH->str())) || (fill && !rawH);

  const std::optional<BoundingBox> content = contentBounds(tree, index, q);

  std::optional<BoundingBox> box;
  if (fullW && fullH) {
    if (!content) {
      box = BoundingBox{0.0f, 0.0f, W, H};
    } else {
      const auto justifyRaw = prop(e, "justifyContent", q);
      const auto alignRaw = prop(e, "alignItems", q);
      // Without any alignment hint the root layout centers its content.
      const FlexAlign fallback =
          (!justifyRaw && !alignRaw) ? FlexAlign::Center : FlexAlign::Start;
      const FlexAlign justify = parseAlign(justifyRaw, fallback);
      const FlexAlign align = parseAlign(alignRaw, fallback);

      if (justify == FlexAlign::Center)
        x = (W - content->width) * 0.5f;
      else if (justify == FlexAlign::End)
        x = W - content->width;

      if (align == FlexAlign::Center)
        y = (H - content->height) * 0.5f;
      else if (align == FlexAlign::End)
        y = H - content->height;

      const EdgeInsets pad = resolvePadding(e, frame, q);
      x += (justify == FlexAlign::End) ? -pad.right : pad.left;
      y += (align == FlexAlign::End) ? -pad.bottom : pad.top;

      box = BoundingBox{x, y, content->width, content->height};
    }
  } else if (width && height) {
    if (!left) {
      if (const auto right = length(e, "right", Axis::X, frame, q))
        x = W - *right - *width;
    }
    if (!top) {
      if (const auto bottom = length(e, "bottom", Axis::Y, frame, q))
        y = H - *bottom - *height;
    }
    box = BoundingBox{x, y, *width, *height};
  } else if (content) {
    box = BoundingBox{left ? x : W * q.heuristics.fallbackAnchorX,
                      top ? y : H * q.heuristics.fallbackAnchorY,
                      content->width, content->height};
  }

  if (box && !TransformCodec::isIdentity(transform)) {
    box->x += transform.translateX;
    box->y += transform.translateY;
  }
  return box;
}

size_t countCodepoints(std::string_view s) {
  size_t n = 0;
  for (char c : s)
    if (((unsigned char)c & 0xC0) != 0x80)
      ++n;
  return n;
}

} // namespace

TextFootprint estimateText(std::string_view text, float fontSizePx, bool bold,
                           const LayoutHeuristics &h) {
  const float charWidth =
      fontSizePx * (bold ? h.boldCharWidthFactor : h.charWidthFactor);

  // Real newlines and the escaped "\n" both break lines.
  size_t lines = 1;
  size_t maxLen = 0;
  size_t lineStart = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    size_t breakLen = 0;
    if (text[i] == '\n')
      breakLen = 1;
    else if (text[i] == '\\' && i + 1 < text.size() && text[i + 1] == 'n')
      breakLen = 2;
    if (breakLen == 0)
      continue;

    maxLen = std::max(maxLen, countCodepoints(text.substr(lineStart, i - lineStart)));
    ++lines;
    i += breakLen - 1;
    lineStart = i + 1;
  }
  maxLen = std::max(maxLen, countCodepoints(text.substr(lineStart)));

  return {float(maxLen) * charWidth,
          float(lines) * fontSizePx * h.lineHeightFactor};
}

BoundingBox envelope(const std::vector<BoundingBox> &boxes) {
  if (boxes.empty())
    return {};
  if (boxes.size() == 1)
    return boxes.front();

  float minX = std::numeric_limits<float>::max();
  float minY = std::numeric_limits<float>::max();
  float maxX = std::numeric_limits<float>::lowest();
  float maxY = std::numeric_limits<float>::lowest();
  for (const BoundingBox &b : boxes) {
    minX = std::min(minX, b.x);
    minY = std::min(minY, b.y);
    maxX = std::max(maxX, b.right());
    maxY = std::max(maxY, b.bottom());
  }
  return {minX, minY, maxX - minX, maxY - minY};
}

std::optional<BoundingBox> contentBounds(const ElementTree &tree, size_t index,
                                         const BoundsQuery &q) {
  const LayoutFrame frame{q.compositionWidth, q.compositionHeight};
  std::vector<BoundingBox> found;

  for (size_t child : tree.children(index)) {
    const ElementRecord &c = tree.element(child);

    if (isPositioningContainer(c, q)) {
      if (auto nested = contentBounds(tree, child, q))
        found.push_back(*nested);
      continue;
    }

    const auto w = length(c, "width", Axis::X, frame, q);
    const auto h = length(c, "height", Axis::Y, frame, q);
    if (w && h && *w > 0.0f && *h > 0.0f && *w < q.compositionWidth &&
        *h < q.compositionHeight) {
      found.push_back({0.0f, 0.0f, *w, *h});
      continue;
    }

    const auto text = prop(c, "text", q);
    if (text && !text->str().empty()) {
      const float fontSize = length(c, "fontSize", Axis::X, frame, q)
                                 .value_or(q.heuristics.defaultFontSizePx);
      const auto weight = prop(c, "fontWeight", q);
      const TextFootprint fp = estimateText(
          text->str(), fontSize, weight && isBoldWeight(weight->str()),
          q.heuristics);
      found.push_back({0.0f, 0.0f, fp.width, fp.height});
      continue;
    }

    if (auto nested = contentBounds(tree, child, q))
      found.push_back(*nested);
  }

  if (found.empty())
    return std::nullopt;
  return envelope(found);
}

std::optional<BoundingBox> clipBounds(const ElementTree &tree,
                                      const TransformValues &rootTransform,
                                      const BoundsQuery &q) {
  if (!(q.compositionWidth > 0.0f) || !(q.compositionHeight > 0.0f))
    return std::nullopt;
  if (tree.roots().empty())
    return std::nullopt;

  std::vector<BoundingBox> boxes;
  for (size_t r : tree.roots()) {
    std::optional<BoundingBox> b;
    if (r == tree.roots().front()) {
      b = rootBounds(tree, r, rootTransform, q);
    } else {
      const TransformValues t = TransformCodec::parse(
          tree.element(r).properties.get(TransformKey));
      b = rootBounds(tree, r, t, q);
    }
    if (b)
      boxes.push_back(*b);
  }

  if (boxes.empty())
    return std::nullopt;
  return envelope(boxes);
}

std::optional<BoundingBox> clipBounds(const Clip &clip, const BoundsQuery &q) {
  const ElementTree tree(clip.element.elements);
  const auto out = clipBounds(tree, rootTransform(tree), q);
  if (out)
    Log::Debug("BoundsResolver: clip '{}' -> x={} y={} w={} h={}", clip.id,
               out->x, out->y, out->width, out->height);
  else
    Log::Debug("BoundsResolver: clip '{}' has no selectable area", clip.id);
  return out;
}

std::optional<BoundingBox> clipBounds(const Clip &clip, float compositionWidth,
                                      float compositionHeight) {
  BoundsQuery q{};
  q.compositionWidth = compositionWidth;
  q.compositionHeight = compositionHeight;
  return clipBounds(clip, q);
}

OrientedBox transformedBounds(const BoundingBox &bounds,
                              const TransformValues &transform) {
  OrientedBox ob{};
  ob.center = bounds.center();
  ob.size = {bounds.width * std::abs(transform.scaleX),
             bounds.height * std::abs(transform.scaleY)};
  ob.rotationDeg = transform.rotation;
  return ob;
}

} // namespace Scrim
