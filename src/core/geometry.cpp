#include <facelens/core/geometry.hpp>
#include <algorithm>

namespace facelens::core {

float iou(const Rect& a, const Rect& b) noexcept {
  const float x1 = std::max(a.left, b.left);
  const float y1 = std::max(a.top, b.top);
  const float x2 = std::min(a.right, b.right);
  const float y2 = std::min(a.bottom, b.bottom);
  const float inter = std::max(0.f, x2 - x1) * std::max(0.f, y2 - y1);
  const float area_a = std::max(0.f, a.width()) * std::max(0.f, a.height());
  const float area_b = std::max(0.f, b.width()) * std::max(0.f, b.height());
  const float uni = area_a + area_b - inter;
  return uni > 0.f ? inter / uni : 0.f;
}

}  // namespace facelens::core
