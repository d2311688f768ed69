#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "SceneFixtures.h"
#include "editor/TransformController.h"
#include "scene/ClipTransform.h"
#include "scene/TransformCodec.h"

using namespace Scrim;
using Catch::Approx;
using Test::makeClip;

namespace {

constexpr double Fps = 30.0;

// 1000x1000 composition shown 1:1, one 100x100 box at the origin.
struct Fixture {
  Scene scene;
  TransformController ctl;

  explicit Fixture(std::string transform = {}) {
    std::string line = "div;id:a;parentId:null;width:100px;height:100px";
    if (!transform.empty())
      line += ";transform:" + transform;
    scene.resize(1);
    scene[0].clips.push_back(makeClip("a", {line}, 0.0, 1.0));

    ctl.setComposition(1000.0f, 1000.0f);
    ctl.setViewport({{0.0f, 0.0f}, {1000.0f, 1000.0f}});
    ctl.refresh(scene, 0.0, Fps);
  }

  Clip &clip() { return scene[0].clips[0]; }

  void apply(const TransformPatch &p) {
    applyTransformPatch(clip(), p);
    ctl.refresh(scene, 0.0, Fps);
  }

  void selectByClick() {
    REQUIRE(ctl.pointerDown({50.0f, 50.0f}) == PressResult::Selected);
    ctl.pointerUp();
    ctl.events().clear();
  }
};

} // namespace

TEST_CASE("Clicking selects and deselects", "[TransformController]") {
  Fixture f;

  REQUIRE(f.ctl.pointerDown({50.0f, 50.0f}) == PressResult::Selected);
  REQUIRE(f.ctl.selectedClipId() == std::optional<std::string>("a"));
  REQUIRE(f.ctl.mode() == DragMode::Idle);
  REQUIRE(f.ctl.events().events().size() == 1);
  REQUIRE(f.ctl.events().events()[0].type ==
          ManipulationEventType::SelectionChanged);
  REQUIRE(f.ctl.events().events()[0].clipId == "a");
  f.ctl.pointerUp();
  f.ctl.events().clear();

  REQUIRE(f.ctl.pointerDown({500.0f, 500.0f}) == PressResult::Deselected);
  REQUIRE_FALSE(f.ctl.selectedClipId().has_value());
  REQUIRE(f.ctl.events().events().size() == 1);
  REQUIRE(f.ctl.events().events()[0].clipId.empty());
}

TEST_CASE("Every click on empty space reports the selection",
          "[TransformController]") {
  Fixture f;

  REQUIRE(f.ctl.pointerDown({500.0f, 500.0f}) == PressResult::Deselected);
  f.ctl.pointerUp();
  REQUIRE(f.ctl.pointerDown({600.0f, 600.0f}) == PressResult::Deselected);
  f.ctl.pointerUp();

  const auto &evs = f.ctl.events().events();
  REQUIRE(evs.size() == 2);
  for (const ManipulationEvent &e : evs) {
    REQUIRE(e.type == ManipulationEventType::SelectionChanged);
    REQUIRE(e.clipId.empty());
  }
}

TEST_CASE("External selection only reports changes", "[TransformController]") {
  Fixture f;
  f.ctl.select(std::string("a"));
  f.ctl.select(std::string("a"));
  REQUIRE(f.ctl.events().events().size() == 1);
  f.ctl.deselect();
  f.ctl.deselect();
  REQUIRE(f.ctl.events().events().size() == 2);
}

TEST_CASE("The top-most clip is selected", "[TransformController]") {
  Fixture f;
  f.scene.resize(2);
  f.scene[1].clips.push_back(makeClip(
      "b", {"div;id:b;parentId:null;width:100px;height:100px"}, 0.0, 1.0));
  f.ctl.refresh(f.scene, 0.0, Fps);

  REQUIRE(f.ctl.pointerDown({50.0f, 50.0f}) == PressResult::Selected);
  REQUIRE(f.ctl.selectedClipId() == std::optional<std::string>("b"));
}

TEST_CASE("Translating follows the pointer from the press point",
          "[TransformController]") {
  Fixture f;
  f.selectByClick();

  REQUIRE(f.ctl.pointerDown({50.0f, 50.0f}) == PressResult::SessionStarted);
  REQUIRE(f.ctl.mode() == DragMode::Translate);

  auto p = f.ctl.pointerMove({80.0f, 70.0f});
  REQUIRE(p.has_value());
  REQUIRE(*p->translateX == Approx(30.0f));
  REQUIRE(*p->translateY == Approx(20.0f));
  REQUIRE_FALSE(p->scaleX.has_value());
  REQUIRE_FALSE(p->rotation.has_value());

  p = f.ctl.pointerMove({90.0f, 90.0f});
  REQUIRE(*p->translateX == Approx(40.0f));
  REQUIRE(*p->translateY == Approx(40.0f));

  f.ctl.pointerUp();
  REQUIRE(f.ctl.mode() == DragMode::Idle);

  // The body click re-reports the selection before the session starts.
  const auto &evs = f.ctl.events().events();
  REQUIRE(evs.size() == 5);
  REQUIRE(evs[0].type == ManipulationEventType::SelectionChanged);
  REQUIRE(evs[0].clipId == "a");
  REQUIRE(evs[1].type == ManipulationEventType::SessionBegan);
  REQUIRE(evs[2].type == ManipulationEventType::TransformChanged);
  REQUIRE(evs[3].type == ManipulationEventType::TransformChanged);
  REQUIRE(evs[4].type == ManipulationEventType::SessionEnded);
  REQUIRE(evs[4].mode == DragMode::Translate);
}

TEST_CASE("Zero-movement drags leave the transform unchanged",
          "[TransformController]") {
  Fixture f("translate(12px, -4px) scale(1, 1) rotate(0deg)");
  f.ctl.pointerDown({60.0f, 50.0f});
  f.ctl.pointerUp();
  const TransformValues before = clipTransform(f.clip());

  for (int i = 0; i < 2; ++i) {
    REQUIRE(f.ctl.pointerDown({60.0f, 50.0f}) == PressResult::SessionStarted);
    const auto p = f.ctl.pointerMove({60.0f, 50.0f});
    REQUIRE(p.has_value());
    f.apply(*p);
    f.ctl.pointerUp();
  }

  REQUIRE(clipTransform(f.clip()) == before);
}

TEST_CASE("A second press during a session is rejected", "[TransformController]") {
  Fixture f;
  f.selectByClick();

  REQUIRE(f.ctl.pointerDown({50.0f, 50.0f}) == PressResult::SessionStarted);
  REQUIRE(f.ctl.pointerDown({10.0f, 10.0f}) == PressResult::Rejected);
  REQUIRE(f.ctl.mode() == DragMode::Translate);
  REQUIRE(f.ctl.session().clipId == "a");
}

TEST_CASE("Corner drags scale about the opposite corner",
          "[TransformController]") {
  SECTION("Unrotated box") {
    Fixture f;
    f.selectByClick();

    REQUIRE(f.ctl.pointerDown({100.0f, 100.0f}) == PressResult::SessionStarted);
    REQUIRE(f.ctl.mode() == DragMode::Scale);
    REQUIRE(f.ctl.session().handle == ScaleHandle::BottomRight);

    const auto p = f.ctl.pointerMove({150.0f, 150.0f});
    REQUIRE(p.has_value());
    REQUIRE(*p->scaleX == Approx(1.5f));
    REQUIRE(*p->scaleY == Approx(1.5f));
    REQUIRE(*p->translateX == Approx(25.0f));
    REQUIRE(*p->translateY == Approx(25.0f));

    f.apply(*p);
    const OverlayEntry *e = f.ctl.findEntry("a");
    REQUIRE(e != nullptr);
    const glm::vec2 tl = e->box.corner(-1.0f, -1.0f);
    const glm::vec2 br = e->box.corner(1.0f, 1.0f);
    REQUIRE(tl.x == Approx(0.0f).margin(1e-3));
    REQUIRE(tl.y == Approx(0.0f).margin(1e-3));
    REQUIRE(br.x == Approx(150.0f));
    REQUIRE(br.y == Approx(150.0f));
  }

  SECTION("Rotated box") {
    Fixture f("translate(0px, 0px) scale(1, 1) rotate(90deg)");
    f.selectByClick();

    // Bottom-right of the rotated box sits at (0, 100); its anchor at (100, 0).
    REQUIRE(f.ctl.pointerDown({0.0f, 100.0f}) == PressResult::SessionStarted);
    REQUIRE(f.ctl.session().handle == ScaleHandle::BottomRight);

    const auto p = f.ctl.pointerMove({-50.0f, 150.0f});
    REQUIRE(p.has_value());
    REQUIRE(*p->scaleX == Approx(1.5f));
    REQUIRE(*p->scaleY == Approx(1.5f));
    REQUIRE(*p->translateX == Approx(-25.0f));
    REQUIRE(*p->translateY == Approx(25.0f));

    f.apply(*p);
    const glm::vec2 anchor = f.ctl.findEntry("a")->box.corner(-1.0f, -1.0f);
    REQUIRE(anchor.x == Approx(100.0f));
    REQUIRE(anchor.y == Approx(0.0f).margin(1e-3));
  }

  SECTION("Dragging across the anchor clamps instead of flipping") {
    Fixture f;
    f.selectByClick();

    REQUIRE(f.ctl.pointerDown({100.0f, 100.0f}) == PressResult::SessionStarted);
    const auto p = f.ctl.pointerMove({-50.0f, -50.0f});
    REQUIRE(p.has_value());
    REQUIRE(*p->scaleX == Approx(0.01f));
    REQUIRE(*p->scaleY == Approx(0.01f));
    REQUIRE(*p->translateX == Approx(-49.5f));
    REQUIRE(*p->translateY == Approx(-49.5f));
  }
}

TEST_CASE("Rotation follows the pointer angle around the center",
          "[TransformController]") {
  Fixture f;
  f.selectByClick();

  const auto handles = f.ctl.selectedHandles();
  REQUIRE(handles.has_value());
  REQUIRE(handles->rotate.x == Approx(124.0f));
  REQUIRE(handles->rotate.y == Approx(50.0f));

  REQUIRE(f.ctl.pointerDown({124.0f, 50.0f}) == PressResult::SessionStarted);
  REQUIRE(f.ctl.mode() == DragMode::Rotate);

  auto p = f.ctl.pointerMove({50.0f, 150.0f});
  REQUIRE(p.has_value());
  REQUIRE(*p->rotation == Approx(90.0f));
  REQUIRE_FALSE(p->translateX.has_value());
  REQUIRE_FALSE(p->scaleX.has_value());

  p = f.ctl.pointerMove({150.0f, 50.0f});
  REQUIRE(*p->rotation == Approx(0.0f).margin(1e-4));

  // Pointer on the center has no angle.
  REQUIRE_FALSE(f.ctl.pointerMove({50.0f, 50.0f}).has_value());
}

TEST_CASE("Letterboxed viewports map the pointer into the composition",
          "[TransformController]") {
  Fixture f;
  f.ctl.setViewport({{0.0f, 0.0f}, {2000.0f, 1000.0f}});

  REQUIRE(f.ctl.metrics().offsetX == Approx(500.0f));
  REQUIRE(f.ctl.pointerDown({40.0f, 50.0f}) == PressResult::Deselected);
  REQUIRE(f.ctl.pointerDown({550.0f, 50.0f}) == PressResult::Selected);
}

TEST_CASE("Sessions end when the context changes", "[TransformController]") {
  SECTION("Playback ignores presses and ends an active session") {
    Fixture f;
    f.selectByClick();
    REQUIRE(f.ctl.pointerDown({50.0f, 50.0f}) == PressResult::SessionStarted);

    f.ctl.setPlaying(true);
    REQUIRE(f.ctl.mode() == DragMode::Idle);
    REQUIRE(f.ctl.pointerDown({50.0f, 50.0f}) == PressResult::Ignored);
    REQUIRE_FALSE(f.ctl.pointerMove({60.0f, 60.0f}).has_value());
  }

  SECTION("External deselect cancels the session") {
    Fixture f;
    f.selectByClick();
    REQUIRE(f.ctl.pointerDown({50.0f, 50.0f}) == PressResult::SessionStarted);

    f.ctl.deselect();
    REQUIRE(f.ctl.mode() == DragMode::Idle);
    const auto &evs = f.ctl.events().events();
    REQUIRE(evs.size() == 4);
    REQUIRE(evs[2].type == ManipulationEventType::SessionEnded);
    REQUIRE(evs[3].type == ManipulationEventType::SelectionChanged);
    REQUIRE(evs[3].clipId.empty());
  }

  SECTION("Clip leaving the frame ends the session") {
    Fixture f;
    f.selectByClick();
    REQUIRE(f.ctl.pointerDown({50.0f, 50.0f}) == PressResult::SessionStarted);

    f.ctl.refresh(f.scene, 2.0 * Fps, Fps);
    REQUIRE(f.ctl.mode() == DragMode::Idle);
    REQUIRE(f.ctl.overlay().empty());
    REQUIRE_FALSE(f.ctl.pointerMove({60.0f, 60.0f}).has_value());
  }
}
