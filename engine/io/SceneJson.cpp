#include "SceneJson.h"

#include "FileUtil.h"
#include "core/Log.h"
#include "scene/ElementCodec.h"
#include "scene/ElementTree.h"

#include <nlohmann/json.hpp>

namespace Scrim::SceneJson {

using json = nlohmann::json;

static bool fail(SceneLoadError &err, std::string msg) {
  err.message = std::move(msg);
  return false;
}

static void warnPromotedRoots(const Clip &clip) {
  const ElementTree tree(clip.element.elements);
  for (size_t i : tree.promotedRoots())
    Log::Warn("SceneJson: clip '{}': element '{}' has a dangling or cyclic "
              "parent '{}', treated as a root",
              clip.id, tree.element(i).id, tree.element(i).parentId);
}

static bool parseClip(const json &jc, size_t trackIndex, size_t clipIndex,
                      Clip &out, SceneLoadError &err) {
  if (!jc.is_object())
    return fail(err, fmt::format("track {} clip {}: not an object", trackIndex,
                                 clipIndex));

  const auto id = jc.find("id");
  const auto start = jc.find("startTimeInSeconds");
  const auto end = jc.find("endTimeInSeconds");
  if (id == jc.end() || !id->is_string())
    return fail(err, fmt::format("track {} clip {}: missing string 'id'",
                                 trackIndex, clipIndex));
  out.id = id->get<std::string>();

  if (start == jc.end() || !start->is_number() || end == jc.end() ||
      !end->is_number())
    return fail(err, fmt::format("clip '{}': missing numeric start/end time",
                                 out.id));
  out.startTimeInSeconds = start->get<double>();
  out.endTimeInSeconds = end->get<double>();
  if (!(out.startTimeInSeconds < out.endTimeInSeconds))
    return fail(err, fmt::format("clip '{}': start ({}) must be before end ({})",
                                 out.id, out.startTimeInSeconds,
                                 out.endTimeInSeconds));

  std::vector<std::string> lines;
  const auto element = jc.find("element");
  if (element != jc.end() && element->is_object()) {
    const auto elements = element->find("elements");
    if (elements != element->end()) {
      if (!elements->is_array())
        return fail(err, fmt::format("clip '{}': 'elements' is not an array",
                                     out.id));
      for (const json &je : *elements) {
        if (!je.is_string())
          return fail(err, fmt::format(
                               "clip '{}': element {} is not a string", out.id,
                               lines.size()));
        lines.push_back(je.get<std::string>());
      }
    }
  }

  ElementCodec::ElementDecodeError derr;
  if (!ElementCodec::decodeAll(lines, out.element.elements, derr))
    return fail(err, fmt::format("clip '{}': element {}: {} (\"{}\")", out.id,
                                 derr.index, derr.message, lines[derr.index]));

  warnPromotedRoots(out);
  return true;
}

bool parse(std::string_view text, Scene &out, SceneLoadError &err) {
  out.clear();

  const json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded())
    return fail(err, "scene is not valid JSON");

  const json *tracks = nullptr;
  if (j.is_array()) {
    tracks = &j;
  } else if (j.is_object()) {
    const auto it = j.find("tracks");
    if (it != j.end() && it->is_array())
      tracks = &*it;
  }
  if (!tracks)
    return fail(err, "scene has no 'tracks' array");

  for (size_t ti = 0; ti < tracks->size(); ++ti) {
    const json &jt = (*tracks)[ti];
    Track track;
    const auto clips = jt.is_object() ? jt.find("clips") : jt.end();
    if (!jt.is_object() || clips == jt.end() || !clips->is_array())
      return fail(err, fmt::format("track {}: missing 'clips' array", ti));

    for (size_t ci = 0; ci < clips->size(); ++ci) {
      Clip clip;
      if (!parseClip((*clips)[ci], ti, ci, clip, err))
        return false;
      track.clips.push_back(std::move(clip));
    }
    out.push_back(std::move(track));
  }

  Log::Debug("SceneJson: loaded {} track(s)", out.size());
  return true;
}

bool load(const std::string &path, Scene &out, SceneLoadError &err) {
  std::string text;
  if (!FileUtil::readTextFile(path, text))
    return fail(err, fmt::format("cannot read scene file '{}'", path));
  return parse(text, out, err);
}

} // namespace Scrim::SceneJson
