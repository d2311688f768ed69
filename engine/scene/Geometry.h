#pragma once

#include <cmath>
#include <glm/glm.hpp>

namespace Scrim {

// Axis-aligned box in composition pixels.
struct BoundingBox final {
  float x = 0.0f;
  float y = 0.0f;
  float width = 0.0f;
  float height = 0.0f;

  float right() const { return x + width; }
  float bottom() const { return y + height; }
  glm::vec2 center() const { return {x + width * 0.5f, y + height * 0.5f}; }

  bool operator==(const BoundingBox &o) const {
    return x == o.x && y == o.y && width == o.width && height == o.height;
  }
};

// Rotates v by deg degrees (screen space, y down: positive is clockwise).
inline glm::vec2 rotate2D(const glm::vec2 &v, float deg) {
  const float r = glm::radians(deg);
  const float c = std::cos(r);
  const float s = std::sin(r);
  return {v.x * c - v.y * s, v.x * s + v.y * c};
}

// Box after the element transform: scaled about its center, then rotated.
struct OrientedBox final {
  glm::vec2 center{0.0f};
  glm::vec2 size{0.0f};
  float rotationDeg = 0.0f;

  glm::vec2 halfExtents() const { return size * 0.5f; }

  // sx, sy in {-1, +1}: (-1,-1) top-left ... (+1,+1) bottom-right.
  glm::vec2 corner(float sx, float sy) const {
    return center + rotate2D({sx * size.x * 0.5f, sy * size.y * 0.5f},
                             rotationDeg);
  }

  // World point into the box' unrotated, center-relative frame.
  glm::vec2 toLocal(const glm::vec2 &p) const {
    return rotate2D(p - center, -rotationDeg);
  }

  // Edges count as inside; eps absorbs rotation round-off on corners.
  bool contains(const glm::vec2 &p, float eps = 1e-3f) const {
    const glm::vec2 l = toLocal(p);
    const glm::vec2 h = halfExtents();
    return std::abs(l.x) <= h.x + eps && std::abs(l.y) <= h.y + eps;
  }
};

} // namespace Scrim
