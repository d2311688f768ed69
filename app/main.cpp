#include "core/Log.h"

#include "editor/TransformController.h"
#include "io/SceneJson.h"
#include "project/EngineConfig.h"
#include "scene/ClipTransform.h"
#include "scene/TransformCodec.h"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>

namespace {

struct ProbeArgs final {
  std::string scenePath;
  std::string configPath;
  double frame = 0.0;
  double fps = 30.0;
  float width = 1920.0f;
  float height = 1080.0f;
  float viewportW = 0.0f; // 0: same as composition
  float viewportH = 0.0f;
  bool drag = false;
  glm::vec2 dragFrom{0.0f};
  glm::vec2 dragTo{0.0f};
};

void usage() {
  std::fprintf(stderr,
               "usage: scrim_probe <scene.json> [--frame N] [--fps F] "
               "[--size WxH] [--viewport WxH] [--config file.json] "
               "[--drag X0,Y0:X1,Y1]\n");
}

bool parsePair(std::string_view s, char sep, float &a, float &b) {
  const size_t at = s.find(sep);
  if (at == std::string_view::npos)
    return false;
  const std::string first(s.substr(0, at));
  const std::string second(s.substr(at + 1));
  char *end = nullptr;
  a = std::strtof(first.c_str(), &end);
  if (end == first.c_str())
    return false;
  b = std::strtof(second.c_str(), &end);
  return end != second.c_str();
}

bool parseArgs(int argc, char **argv, ProbeArgs &out) {
  for (int i = 1; i < argc; ++i) {
    const std::string_view a = argv[i];
    const bool hasValue = i + 1 < argc;
    if (a == "--frame" && hasValue) {
      out.frame = std::strtod(argv[++i], nullptr);
    } else if (a == "--fps" && hasValue) {
      out.fps = std::strtod(argv[++i], nullptr);
    } else if (a == "--size" && hasValue) {
      if (!parsePair(argv[++i], 'x', out.width, out.height))
        return false;
    } else if (a == "--viewport" && hasValue) {
      if (!parsePair(argv[++i], 'x', out.viewportW, out.viewportH))
        return false;
    } else if (a == "--config" && hasValue) {
      out.configPath = argv[++i];
    } else if (a == "--drag" && hasValue) {
      const std::string_view v = argv[++i];
      const size_t colon = v.find(':');
      if (colon == std::string_view::npos ||
          !parsePair(v.substr(0, colon), ',', out.dragFrom.x, out.dragFrom.y) ||
          !parsePair(v.substr(colon + 1), ',', out.dragTo.x, out.dragTo.y))
        return false;
      out.drag = true;
    } else if (!a.empty() && a[0] != '-' && out.scenePath.empty()) {
      out.scenePath = std::string(a);
    } else {
      return false;
    }
  }
  return !out.scenePath.empty();
}

void printOverlay(const Scrim::TransformController &ctl) {
  const auto &overlay = ctl.overlay();
  if (overlay.empty()) {
    fmt::print("no selectable clips at this frame\n");
    return;
  }
  for (const Scrim::OverlayEntry &e : overlay) {
    const Scrim::BoundingBox d = ctl.metrics().toDisplay(e.bounds);
    fmt::print("{} (track {}): bounds x={} y={} w={} h={} | display x={} "
               "y={} w={} h={} | {}\n",
               e.clipId, e.trackIndex, e.bounds.x, e.bounds.y,
               e.bounds.width, e.bounds.height, d.x, d.y, d.width, d.height,
               Scrim::TransformCodec::format(e.transform));
  }
}

Scrim::Clip *findClip(Scrim::Scene &scene, const std::string &id) {
  for (Scrim::Track &t : scene)
    for (Scrim::Clip &c : t.clips)
      if (c.id == id)
        return &c;
  return nullptr;
}

// Click to select, then press-move-release, feeding every patch back into
// the scene the way the editor does.
int runDrag(Scrim::TransformController &ctl, Scrim::Scene &scene,
            const ProbeArgs &args) {
  ctl.pointerDown(args.dragFrom);
  ctl.pointerUp();

  if (ctl.pointerDown(args.dragFrom) != Scrim::PressResult::SessionStarted) {
    Scrim::Log::Warn("probe: nothing to drag at {},{}", args.dragFrom.x,
                     args.dragFrom.y);
    return 1;
  }

  const std::string clipId = ctl.session().clipId;
  const auto patch = ctl.pointerMove(args.dragTo);
  ctl.pointerUp();

  Scrim::Clip *clip = findClip(scene, clipId);
  if (patch && clip) {
    Scrim::applyTransformPatch(*clip, *patch);
    ctl.refresh(scene, args.frame, args.fps);
  }

  for (const Scrim::ManipulationEvent &ev : ctl.events().events()) {
    switch (ev.type) {
    case Scrim::ManipulationEventType::SelectionChanged:
      fmt::print("select: {}\n", ev.clipId.empty() ? "<none>" : ev.clipId);
      break;
    case Scrim::ManipulationEventType::SessionBegan:
      fmt::print("begin {} on {}\n", Scrim::dragModeName(ev.mode), ev.clipId);
      break;
    case Scrim::ManipulationEventType::SessionEnded:
      fmt::print("end {} on {}\n", Scrim::dragModeName(ev.mode), ev.clipId);
      break;
    case Scrim::ManipulationEventType::TransformChanged:
      fmt::print("patch {}: {}\n", ev.clipId,
                 Scrim::TransformCodec::format(Scrim::TransformCodec::merge(
                     Scrim::TransformValues{}, ev.patch)));
      break;
    case Scrim::ManipulationEventType::None:
    default:
      break;
    }
  }
  ctl.events().clear();

  if (clip)
    fmt::print("result {}: {}\n", clipId,
               Scrim::TransformCodec::format(Scrim::clipTransform(*clip)));
  printOverlay(ctl);
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  ProbeArgs args;
  if (!parseArgs(argc, argv, args)) {
    usage();
    return 2;
  }

  Scrim::EngineConfig cfg{};
  if (!args.configPath.empty()) {
    auto loaded = Scrim::EngineConfigIO::load(args.configPath);
    if (!loaded) {
      std::fprintf(stderr, "cannot load config '%s'\n", args.configPath.c_str());
      return 2;
    }
    cfg = *loaded;
  }
  Scrim::Log::Init(cfg.log);

  Scrim::Scene scene;
  Scrim::SceneJson::SceneLoadError err;
  if (!Scrim::SceneJson::load(args.scenePath, scene, err)) {
    Scrim::Log::Error("probe: {}", err.message);
    return 1;
  }

  Scrim::TransformController ctl(cfg.manipulation, cfg.layout);
  ctl.setComposition(args.width, args.height);
  Scrim::ViewportRect vp{};
  vp.size = {args.viewportW > 0.0f ? args.viewportW : args.width,
             args.viewportH > 0.0f ? args.viewportH : args.height};
  ctl.setViewport(vp);
  ctl.refresh(scene, args.frame, args.fps);

  if (args.drag)
    return runDrag(ctl, scene, args);

  printOverlay(ctl);
  return 0;
}
