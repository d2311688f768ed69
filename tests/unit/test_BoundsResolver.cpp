#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "SceneFixtures.h"
#include "scene/BoundsResolver.h"
#include "scene/ClipTransform.h"
#include "scene/ElementTree.h"

using namespace Scrim;
using Catch::Approx;
using Test::makeClip;

static BoundsQuery hd() {
  BoundsQuery q{};
  q.compositionWidth = 1920.0f;
  q.compositionHeight = 1080.0f;
  return q;
}

TEST_CASE("Full-bleed roots", "[BoundsResolver]") {
  SECTION("Background without content covers the composition") {
    const Clip c = makeClip(
        "bg", {"div;id:bg;parentId:null;width:100%;height:100%;"
               "backgroundColor:#123"});
    const auto b = clipBounds(c, hd());
    REQUIRE(b.has_value());
    REQUIRE(*b == BoundingBox{0.0f, 0.0f, 1920.0f, 1080.0f});
  }

  SECTION("Pixel size equal to the composition counts as full-bleed") {
    const Clip c =
        makeClip("bg", {"div;id:bg;parentId:null;width:1920px;height:1080px"});
    REQUIRE(*clipBounds(c, hd()) == BoundingBox{0.0f, 0.0f, 1920.0f, 1080.0f});
  }

  SECTION("AbsoluteFill with a heading selects the heading, not the frame") {
    const Clip c = makeClip("title", {"AbsoluteFill;id:root;parentId:null",
                                      "h1;id:t;parentId:root;text:Hi;fontSize:48px"});
    const auto b = clipBounds(c, hd());
    REQUIRE(b.has_value());
    REQUIRE(b->width == Approx(52.8f));
    REQUIRE(b->height == Approx(62.4f));
    REQUIRE(b->x == Approx(933.6f));
    REQUIRE(b->y == Approx(508.8f));
    REQUIRE(b->width < 1920.0f);
  }

  SECTION("Sized AbsoluteFill background with a heading") {
    const Clip c = makeClip(
        "title", {"AbsoluteFill;id:root;parentId:null;width:100%;height:100%;"
                  "backgroundColor:#000",
                  "h1;id:t;parentId:root;text:Hi;fontSize:48px"});
    const auto b = clipBounds(c, 1920.0f, 1080.0f);
    REQUIRE(b.has_value());
    REQUIRE(b->width < 200.0f);
    REQUIRE(b->height < 200.0f);
    REQUIRE(b->center().x == Approx(960.0f));
    REQUIRE(b->center().y == Approx(540.0f));
  }

  SECTION("Flex centering") {
    const Clip c = makeClip(
        "c", {"div;id:c;parentId:null;width:100%;height:100%;display:flex;"
              "justifyContent:center;alignItems:center",
              "h1;id:t;parentId:c;text:Hello;fontSize:40px"});
    const auto b = clipBounds(c, hd());
    REQUIRE(b.has_value());
    REQUIRE(b->width == Approx(110.0f));
    REQUIRE(b->height == Approx(52.0f));
    REQUIRE(b->x == Approx(905.0f));
    REQUIRE(b->y == Approx(514.0f));
  }

  SECTION("Flex end with padding") {
    const Clip c = makeClip(
        "c", {"div;id:c;parentId:null;width:100%;height:100%;display:flex;"
              "justifyContent:flex-end;alignItems:flex-end;paddingRight:40px;"
              "paddingBottom:60px",
              "div;id:card;parentId:c;width:300px;height:100px"});
    const auto b = clipBounds(c, hd());
    REQUIRE(b.has_value());
    REQUIRE(b->x == Approx(1580.0f));
    REQUIRE(b->y == Approx(920.0f));
    REQUIRE(b->width == Approx(300.0f));
    REQUIRE(b->height == Approx(100.0f));
  }

  SECTION("Flex start with shorthand padding") {
    const Clip c = makeClip(
        "c", {"div;id:c;parentId:null;width:100%;height:100%;display:flex;"
              "justifyContent:flex-start;alignItems:flex-start;padding:20px 10px",
              "div;id:card;parentId:c;width:300px;height:100px"});
    const auto b = clipBounds(c, hd());
    REQUIRE(b.has_value());
    REQUIRE(b->x == Approx(10.0f));
    REQUIRE(b->y == Approx(20.0f));
  }

  SECTION("Positioning containers are looked through") {
    const Clip direct = makeClip(
        "a", {"div;id:r;parentId:null;width:100%;height:100%",
              "p;id:t;parentId:r;text:abcd"});
    const Clip wrapped = makeClip(
        "b", {"div;id:r;parentId:null;width:100%;height:100%",
              "div;id:pc;parentId:r;display:flex;width:100%;height:100%",
              "p;id:t;parentId:pc;text:abcd"});
    const auto a = clipBounds(direct, hd());
    const auto b = clipBounds(wrapped, hd());
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(b->x == Approx(a->x));
    REQUIRE(b->y == Approx(a->y));
    REQUIRE(b->width == Approx(35.2f));
    REQUIRE(b->height == Approx(20.8f));
  }
}

TEST_CASE("Explicitly sized roots", "[BoundsResolver]") {
  SECTION("Left and top") {
    const Clip c = makeClip(
        "b", {"div;id:b;parentId:null;width:200px;height:100px;left:50px;top:60px"});
    REQUIRE(*clipBounds(c, hd()) == BoundingBox{50.0f, 60.0f, 200.0f, 100.0f});
  }

  SECTION("Right and bottom") {
    const Clip c = makeClip(
        "b",
        {"div;id:b;parentId:null;width:200px;height:100px;right:20px;bottom:30px"});
    REQUIRE(*clipBounds(c, hd()) ==
            BoundingBox{1700.0f, 950.0f, 200.0f, 100.0f});
  }

  SECTION("Percent sizes") {
    const Clip c =
        makeClip("b", {"div;id:b;parentId:null;width:50%;height:25%"});
    const auto b = clipBounds(c, hd());
    REQUIRE(b->width == Approx(960.0f));
    REQUIRE(b->height == Approx(270.0f));
  }

  SECTION("Only the translation of the transform moves the box") {
    const Clip c = makeClip(
        "b", {"div;id:b;parentId:null;width:200px;height:100px;left:50px;top:60px;"
              "transform:translate(10px, 20px) scale(2, 2) rotate(30deg)"});
    REQUIRE(*clipBounds(c, hd()) == BoundingBox{60.0f, 80.0f, 200.0f, 100.0f});
  }

  SECTION("Animated width is sampled at the query time") {
    const Clip c = makeClip(
        "b", {"div;id:b;parentId:null;width:@animate[0,1]:[100px,300px];"
              "height:50px"});
    BoundsQuery q = hd();
    q.timeSeconds = 0.0;
    REQUIRE(clipBounds(c, q)->width == Approx(100.0f));
    q.timeSeconds = 1.0;
    REQUIRE(clipBounds(c, q)->width == Approx(300.0f));
  }
}

TEST_CASE("Content without layout hints uses the fallback anchor",
          "[BoundsResolver]") {
  const Clip c = makeClip(
      "w", {"div;id:w;parentId:root", "p;id:p;parentId:w;text:abc"});
  const auto b = clipBounds(c, hd());
  REQUIRE(b.has_value());
  REQUIRE(b->x == Approx(480.0f));
  REQUIRE(b->y == Approx(378.0f));
  REQUIRE(b->width == Approx(26.4f));
  REQUIRE(b->height == Approx(20.8f));
}

TEST_CASE("Several roots combine into one envelope", "[BoundsResolver]") {
  const Clip c = makeClip(
      "m", {"div;id:a;parentId:null;width:100px;height:100px",
            "div;id:b;parentId:null;width:50px;height:50px;left:200px;top:300px"});
  REQUIRE(*clipBounds(c, hd()) == BoundingBox{0.0f, 0.0f, 250.0f, 350.0f});
}

TEST_CASE("Bounds over a prebuilt tree", "[BoundsResolver]") {
  const Clip c = makeClip(
      "m", {"div;id:a;parentId:null;width:100px;height:100px;"
            "transform:translate(10px, 20px) scale(1, 1) rotate(0deg)",
            "div;id:b;parentId:null;width:50px;height:50px;left:200px;top:300px;"
            "transform:translate(5px, 5px) scale(1, 1) rotate(0deg)"});
  const ElementTree tree(c.element.elements);

  SECTION("Matches the clip overload") {
    const TransformValues t = rootTransform(tree);
    REQUIRE(t.translateX == 10.0f);
    REQUIRE(clipBounds(tree, t, hd()) == clipBounds(c, hd()));
    REQUIRE(*clipBounds(tree, t, hd()) ==
            BoundingBox{10.0f, 20.0f, 245.0f, 335.0f});
  }

  SECTION("The supplied transform is used for the first root") {
    TransformValues t;
    t.translateX = 100.0f;
    const auto b = clipBounds(tree, t, hd());
    REQUIRE(b.has_value());
    REQUIRE(b->x == 100.0f);
    REQUIRE(b->y == 0.0f);
    REQUIRE(b->right() == 255.0f);
  }
}

TEST_CASE("Clips without a selectable area", "[BoundsResolver]") {
  SECTION("No elements") {
    Clip c;
    c.id = "empty";
    REQUIRE_FALSE(clipBounds(c, hd()).has_value());
  }

  SECTION("Nothing measurable") {
    const Clip c = makeClip("n", {"div;id:a;parentId:null;width:100px"});
    REQUIRE_FALSE(clipBounds(c, hd()).has_value());
  }

  SECTION("Degenerate composition") {
    const Clip c = makeClip("b", {"div;id:b;parentId:null;width:10px;height:10px"});
    REQUIRE_FALSE(clipBounds(c, 0.0f, 1080.0f).has_value());
  }
}

TEST_CASE("Text footprint estimate", "[BoundsResolver]") {
  const LayoutHeuristics h{};

  const TextFootprint plain = estimateText("Hello", 20.0f, false, h);
  REQUIRE(plain.width == Approx(55.0f));
  REQUIRE(plain.height == Approx(26.0f));

  const TextFootprint bold = estimateText("Hello", 20.0f, true, h);
  REQUIRE(bold.width == Approx(65.0f));

  const TextFootprint escaped = estimateText("ab\\ncde", 10.0f, false, h);
  REQUIRE(escaped.width == Approx(16.5f));
  REQUIRE(escaped.height == Approx(26.0f));

  const TextFootprint real = estimateText("abcd\nx", 10.0f, false, h);
  REQUIRE(real.width == Approx(22.0f));
  REQUIRE(real.height == Approx(26.0f));

  // Codepoints, not bytes.
  const TextFootprint utf8 = estimateText("h\xC3\xA9llo", 10.0f, false, h);
  REQUIRE(utf8.width == Approx(27.5f));
}

TEST_CASE("Transformed bounds scale about the center", "[BoundsResolver]") {
  TransformValues t;
  t.scaleX = 2.0f;
  t.scaleY = -0.5f;
  t.rotation = 30.0f;
  const OrientedBox ob =
      transformedBounds(BoundingBox{100.0f, 100.0f, 200.0f, 100.0f}, t);
  REQUIRE(ob.center.x == Approx(200.0f));
  REQUIRE(ob.center.y == Approx(150.0f));
  REQUIRE(ob.size.x == Approx(400.0f));
  REQUIRE(ob.size.y == Approx(50.0f));
  REQUIRE(ob.rotationDeg == 30.0f);
}
