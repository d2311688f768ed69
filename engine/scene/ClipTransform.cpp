#include "ClipTransform.h"

#include "ElementTree.h"
#include "TransformCodec.h"
#include "core/Log.h"

namespace Scrim {

TransformValues rootTransform(const ElementTree &tree) {
  if (tree.roots().empty())
    return {};
  const ElementRecord &root = tree.element(tree.roots().front());
  return TransformCodec::parse(root.properties.get(TransformKey));
}

TransformValues clipTransform(const Clip &clip) {
  return rootTransform(ElementTree(clip.element.elements));
}

size_t applyTransformPatch(Clip &clip, const TransformPatch &patch) {
  if (patch.empty())
    return 0;

  std::vector<size_t> roots;
  {
    const ElementTree tree(clip.element.elements);
    roots = tree.roots();
  }

  for (size_t i : roots) {
    ElementRecord &e = clip.element.elements[i];
    const TransformValues current =
        TransformCodec::parse(e.properties.get(TransformKey));
    const TransformValues next = TransformCodec::merge(current, patch);
    e.properties.set(TransformKey, TransformCodec::format(next));
  }

  Log::Debug("ClipTransform: clip '{}' updated {} root element(s)", clip.id,
             roots.size());
  return roots.size();
}

} // namespace Scrim
