#pragma once

namespace facelens::core {

/// Width/height pair in pixels (image space) or logical units (render space).
struct Size {
  float width{0.f};
  float height{0.f};

  [[nodiscard]] bool empty() const noexcept { return width <= 0.f || height <= 0.f; }

  friend bool operator==(const Size&, const Size&) = default;
};

struct Point {
  float x{0.f};
  float y{0.f};

  friend bool operator==(const Point&, const Point&) = default;
};

/// Axis-aligned rectangle stored as edges (left, top, right, bottom).
/// Edges are not reordered: a mirrored rect may have left > right.
struct Rect {
  float left{0.f};
  float top{0.f};
  float right{0.f};
  float bottom{0.f};

  [[nodiscard]] float width() const noexcept { return right - left; }
  [[nodiscard]] float height() const noexcept { return bottom - top; }

  friend bool operator==(const Rect&, const Rect&) = default;
};

/// Intersection-over-union of two rects with left <= right and top <= bottom; 0 when disjoint.
[[nodiscard]] float iou(const Rect& a, const Rect& b) noexcept;

}  // namespace facelens::core
