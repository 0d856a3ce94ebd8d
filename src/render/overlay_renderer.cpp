#include <facelens/render/overlay_renderer.hpp>
#include <facelens/core/logger.hpp>
#include <facelens/render/coordinate_transform.hpp>
#include <stdexcept>
#include <vector>

namespace facelens::render {

namespace {

// Rough advance of one glyph relative to the font size, for centring the badge.
constexpr float kGlyphAdvance = 0.55f;

}  // namespace

std::string tracking_label(std::int32_t tracking_id) {
  return "ID: " + std::to_string(tracking_id);
}

OverlayRenderer::OverlayRenderer(OverlayStyle style)
    : style_(std::move(style)), owner_(std::this_thread::get_id()) {}

void OverlayRenderer::check_thread() const {
  if (!on_owner_thread()) {
    throw std::logic_error("OverlayRenderer: render called off the UI thread");
  }
}

std::expected<void, core::PipelineError> OverlayRenderer::render(IRenderSurface& surface,
                                                                 const core::DetectionSet& set) {
  check_thread();
  const core::Size render_size = surface.size();

  std::vector<core::Rect> mapped;
  mapped.reserve(set.detections.size());
  for (const auto& detection : set.detections) {
    auto rect = map_rect(detection.bounding_box, set.image_size, render_size, set.lens_direction);
    if (!rect) {
      core::Logger::warn("OverlayRenderer: skipping overlay for frame #", set.sequence, " (",
                         core::to_string(rect.error()), ")");
      return std::unexpected(rect.error());
    }
    mapped.push_back(*rect);
  }

  surface.clear();
  for (std::size_t i = 0; i < mapped.size(); ++i) {
    surface.draw_rect(mapped[i], style_.box);
    if (const auto& id = set.detections[i].tracking_id) {
      surface.draw_text(tracking_label(*id),
                        core::Point{mapped[i].left, mapped[i].top - style_.label_offset},
                        style_.label);
    }
  }

  if (style_.show_face_count) {
    const std::string badge = "Faces detected: " + std::to_string(set.detections.size());
    const float text_width =
        static_cast<float>(badge.size()) * style_.face_count.font_size * kGlyphAdvance;
    const core::Point origin{(render_size.width - text_width) / 2.f,
                             render_size.height - style_.face_count_margin -
                                 style_.face_count.font_size};
    surface.draw_text(badge, origin, style_.face_count);
  }

  ++render_count_;
  return {};
}

bool OverlayRenderer::render_if_needed(IRenderSurface& surface,
                                       const pipeline::DetectionPublisher& publisher) {
  check_thread();
  const pipeline::PublicationPtr publication = publisher.current();
  const core::Size size = surface.size();

  if (has_rendered_ && publication->generation == last_generation_ &&
      publication->set.sensor_epoch == last_epoch_ && size == last_size_) {
    return false;
  }

  has_rendered_ = true;
  last_generation_ = publication->generation;
  last_epoch_ = publication->set.sensor_epoch;
  last_size_ = size;
  return render(surface, publication->set).has_value();
}

}  // namespace facelens::render
