#include <facelens/render/coordinate_transform.hpp>
#include <algorithm>

namespace facelens::render {

std::expected<core::Rect, core::PipelineError> map_rect(const core::Rect& box,
                                                        const core::Size& image_size,
                                                        const core::Size& render_size,
                                                        core::LensDirection lens) {
  if (image_size.width <= 0.f || image_size.height <= 0.f) {
    return std::unexpected(core::PipelineError::DegenerateGeometry);
  }

  const float scale_x = render_size.width / image_size.height;
  const float scale_y = render_size.height / image_size.width;

  core::Rect out;
  out.top = box.left * scale_y;
  out.bottom = box.right * scale_y;
  if (lens == core::LensDirection::Front) {
    out.left = render_size.width - box.top * scale_x;
    out.right = render_size.width - box.bottom * scale_x;
  } else {
    out.left = box.top * scale_x;
    out.right = box.bottom * scale_x;
  }
  return out;
}

core::Rect normalized(const core::Rect& rect) noexcept {
  return core::Rect{std::min(rect.left, rect.right), std::min(rect.top, rect.bottom),
                    std::max(rect.left, rect.right), std::max(rect.top, rect.bottom)};
}

}  // namespace facelens::render
