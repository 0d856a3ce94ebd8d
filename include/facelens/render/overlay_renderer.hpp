#pragma once

#include <facelens/core/detection_set.hpp>
#include <facelens/core/error.hpp>
#include <facelens/core/geometry.hpp>
#include <facelens/pipeline/detection_publisher.hpp>
#include <facelens/render/render_surface.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <thread>

namespace facelens::render {

struct OverlayStyle {
  RectStyle box{Color{105, 240, 174, 255}, 3.f};
  TextStyle label{Color{105, 240, 174, 255}, 16.f, true, std::nullopt};
  float label_offset{20.f};  // label sits this far above the box
  bool show_face_count{true};
  TextStyle face_count{Color{255, 255, 255, 255}, 18.f, true, Color{0, 0, 0, 138}};
  float face_count_margin{20.f};  // distance of the badge from the bottom edge
};

/// "ID: <n>" label text for a tracking id.
[[nodiscard]] std::string tracking_label(std::int32_t tracking_id);

/// Draws DetectionSets onto a render surface.
///
/// Bound to the thread that constructs it (the UI thread); drawing from any other thread
/// throws std::logic_error. Every render starts with surface.clear(), so drawing the same
/// set twice leaves the same output.
class OverlayRenderer {
 public:
  explicit OverlayRenderer(OverlayStyle style = {});

  /// Clears the overlay and draws one rect per detection, a label above each tracked face
  /// and the face-count badge. If any box cannot be mapped (zero image dimension) nothing is
  /// touched and DegenerateGeometry is returned, so the previous overlay stays on screen.
  [[nodiscard]] std::expected<void, core::PipelineError> render(IRenderSurface& surface,
                                                                const core::DetectionSet& set);

  /// Redraws only when the published generation, the sensor epoch or the surface size changed
  /// since the last draw. Returns true if it drew.
  bool render_if_needed(IRenderSurface& surface, const pipeline::DetectionPublisher& publisher);

  /// Forces the next render_if_needed() to draw.
  void invalidate() noexcept { has_rendered_ = false; }

  [[nodiscard]] bool on_owner_thread() const noexcept {
    return std::this_thread::get_id() == owner_;
  }

  [[nodiscard]] const OverlayStyle& style() const noexcept { return style_; }
  [[nodiscard]] std::uint64_t render_count() const noexcept { return render_count_; }

 private:
  void check_thread() const;

  OverlayStyle style_;
  std::thread::id owner_;
  bool has_rendered_{false};
  std::uint64_t last_generation_{0};
  std::uint64_t last_epoch_{0};
  core::Size last_size_{};
  std::uint64_t render_count_{0};
};

}  // namespace facelens::render
