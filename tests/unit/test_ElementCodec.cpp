#include <catch2/catch_test_macros.hpp>

#include "scene/ElementCodec.h"

using namespace Scrim;

TEST_CASE("ElementCodec decodes tag, reserved keys and properties", "[ElementCodec]") {
  ElementRecord rec;
  ElementCodec::ElementDecodeError err;

  SECTION("Basic element") {
    REQUIRE(ElementCodec::decode(
        "div;id:box;parentId:root;width:100px;backgroundColor:rgba(0,0,0,0.5)",
        rec, err));
    REQUIRE(rec.tag == "div");
    REQUIRE(rec.id == "box");
    REQUIRE(rec.parentId == "root");
    REQUIRE(rec.properties.size() == 2);
    REQUIRE(rec.properties.get("width") == "100px");
    REQUIRE(rec.properties.get("backgroundColor") == "rgba(0,0,0,0.5)");
    REQUIRE_FALSE(rec.properties.has("id"));
    REQUIRE_FALSE(rec.properties.has("parentId"));
  }

  SECTION("Values split on the first colon only") {
    REQUIRE(ElementCodec::decode(
        "Img;id:i;parentId:root;src:https://example.com/a.png", rec, err));
    REQUIRE(rec.properties.get("src") == "https://example.com/a.png");
  }

  SECTION("Transform value keeps its inner spacing") {
    REQUIRE(ElementCodec::decode(
        "div;id:a;parentId:root;transform:translate(10px, 20px) scale(1, 1) "
        "rotate(0deg)",
        rec, err));
    REQUIRE(rec.properties.get("transform") ==
            "translate(10px, 20px) scale(1, 1) rotate(0deg)");
  }

  SECTION("Legacy 'parent' key is an alias of parentId") {
    REQUIRE(ElementCodec::decode("div;id:a;parent:root", rec, err));
    REQUIRE(rec.parentId == "root");
  }

  SECTION("Segments without a colon and empty segments are skipped") {
    REQUIRE(ElementCodec::decode("p;id:a;;parentId:null;bogus;text:hi", rec, err));
    REQUIRE(rec.properties.size() == 1);
    REQUIRE(rec.properties.get("text") == "hi");
  }
}

TEST_CASE("ElementCodec rejects structurally broken elements", "[ElementCodec]") {
  ElementRecord rec;
  ElementCodec::ElementDecodeError err;

  SECTION("Missing id") {
    REQUIRE_FALSE(ElementCodec::decode("div;parentId:root;width:10px", rec, err));
    REQUIRE(err.message.find("id") != std::string::npos);
  }

  SECTION("Missing parentId") {
    REQUIRE_FALSE(ElementCodec::decode("div;id:a;width:10px", rec, err));
    REQUIRE(err.message.find("parentId") != std::string::npos);
  }

  SECTION("Empty tag") {
    REQUIRE_FALSE(ElementCodec::decode(";id:a;parentId:root", rec, err));
  }

  SECTION("Tag segment that reads as a property") {
    REQUIRE_FALSE(ElementCodec::decode("width:200px;id:a;parentId:root;height:50px",
                                       rec, err));
    REQUIRE(err.message.find("tag segment") != std::string::npos);
  }

  SECTION("decodeAll reports the failing index") {
    std::vector<ElementRecord> out;
    const std::vector<std::string> lines = {"div;id:a;parentId:root",
                                            "div;id:b;parentId:a",
                                            "div;parentId:a"};
    REQUIRE_FALSE(ElementCodec::decodeAll(lines, out, err));
    REQUIRE(err.index == 2);
  }
}

TEST_CASE("ElementCodec round trips", "[ElementCodec]") {
  ElementCodec::ElementDecodeError err;

  SECTION("encode(decode(s)) == s") {
    const std::vector<std::string> lines = {
        "h1;id:t;parentId:root;text:Hi;fontSize:48px",
        "AbsoluteFill;id:root;parentId:null;width:100%;height:100%;"
        "backgroundColor:#000",
        "div;id:b;parentId:root;transform:translate(1.5px, -2px) scale(2, 2) "
        "rotate(45deg)",
        "Video;id:v;parentId:root;src:https://cdn.example.com/v.mp4;volume:0.8"};
    for (const std::string &s : lines) {
      ElementRecord rec;
      REQUIRE(ElementCodec::decode(s, rec, err));
      REQUIRE(ElementCodec::encode(rec) == s);
    }
  }

  SECTION("decode(encode(r)) == r") {
    ElementRecord r;
    r.tag = "span";
    r.id = "label";
    r.parentId = "card";
    r.properties.set("color", "rgba(255, 0, 0, 1)");
    r.properties.set("text", "a:b:c");
    r.properties.set("empty", "");

    ElementRecord back;
    REQUIRE(ElementCodec::decode(ElementCodec::encode(r), back, err));
    REQUIRE(back == r);
  }
}
