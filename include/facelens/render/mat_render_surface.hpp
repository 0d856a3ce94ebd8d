#pragma once

#include <facelens/render/render_surface.hpp>
#include <opencv2/core/mat.hpp>

namespace facelens::render {

/// OpenCV raster surface: a BGR canvas composed of a background (the camera preview)
/// and the overlay drawn on top of it. One logical unit is one pixel.
class MatRenderSurface : public IRenderSurface {
 public:
  MatRenderSurface(int width, int height);

  [[nodiscard]] core::Size size() const override;

  /// Resizes the canvas; the background is rescaled to match.
  void resize(int width, int height);

  /// Sets the preview image drawn under the overlay (any size, BGR or gray). Empty clears it.
  void set_background(const cv::Mat& bgr);

  void clear() override;
  void draw_rect(const core::Rect& rect, const RectStyle& style) override;
  void draw_text(std::string_view text, const core::Point& origin, const TextStyle& style) override;

  [[nodiscard]] const cv::Mat& image() const noexcept { return canvas_; }

 private:
  cv::Mat background_;
  cv::Mat canvas_;
};

}  // namespace facelens::render
