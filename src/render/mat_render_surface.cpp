#include <facelens/render/mat_render_surface.hpp>
#include <facelens/render/coordinate_transform.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace facelens::render {

namespace {

cv::Scalar to_scalar(const Color& c) { return cv::Scalar(c.b, c.g, c.r); }

// Hershey simplex is ~22 px tall at scale 1.
constexpr double kHersheyPixelHeight = 22.0;

}  // namespace

MatRenderSurface::MatRenderSurface(int width, int height)
    : background_(height, width, CV_8UC3, cv::Scalar::all(0)),
      canvas_(height, width, CV_8UC3, cv::Scalar::all(0)) {}

core::Size MatRenderSurface::size() const {
  return core::Size{static_cast<float>(canvas_.cols), static_cast<float>(canvas_.rows)};
}

void MatRenderSurface::resize(int width, int height) {
  if (width == canvas_.cols && height == canvas_.rows) return;
  cv::Mat scaled;
  cv::resize(background_, scaled, cv::Size(width, height), 0, 0, cv::INTER_LINEAR);
  background_ = scaled;
  canvas_ = background_.clone();
}

void MatRenderSurface::set_background(const cv::Mat& bgr) {
  if (bgr.empty()) {
    background_ = cv::Mat(canvas_.rows, canvas_.cols, CV_8UC3, cv::Scalar::all(0));
    return;
  }
  cv::Mat color;
  if (bgr.channels() == 1) {
    cv::cvtColor(bgr, color, cv::COLOR_GRAY2BGR);
  } else if (bgr.channels() == 4) {
    cv::cvtColor(bgr, color, cv::COLOR_BGRA2BGR);
  } else {
    color = bgr;
  }
  cv::resize(color, background_, canvas_.size(), 0, 0, cv::INTER_LINEAR);
}

void MatRenderSurface::clear() { background_.copyTo(canvas_); }

void MatRenderSurface::draw_rect(const core::Rect& rect, const RectStyle& style) {
  const core::Rect r = normalized(rect);
  const int thickness = std::max(1, static_cast<int>(std::lround(style.stroke_width)));
  cv::rectangle(canvas_,
                cv::Point(static_cast<int>(std::lround(r.left)), static_cast<int>(std::lround(r.top))),
                cv::Point(static_cast<int>(std::lround(r.right)),
                          static_cast<int>(std::lround(r.bottom))),
                to_scalar(style.color), thickness, cv::LINE_AA);
}

void MatRenderSurface::draw_text(std::string_view text,
                                 const core::Point& origin,
                                 const TextStyle& style) {
  const std::string label(text);
  const double scale = style.font_size / kHersheyPixelHeight;
  const int thickness = style.bold ? 2 : 1;
  int baseline = 0;
  const cv::Size extent =
      cv::getTextSize(label, cv::FONT_HERSHEY_SIMPLEX, scale, thickness, &baseline);
  // putText anchors at the baseline; origin is the top-left corner.
  const cv::Point anchor(static_cast<int>(std::lround(origin.x)),
                         static_cast<int>(std::lround(origin.y)) + extent.height);
  if (style.background) {
    cv::rectangle(canvas_, cv::Point(anchor.x, anchor.y - extent.height),
                  cv::Point(anchor.x + extent.width, anchor.y + baseline),
                  to_scalar(*style.background), cv::FILLED);
  }
  cv::putText(canvas_, label, anchor, cv::FONT_HERSHEY_SIMPLEX, scale, to_scalar(style.color),
              thickness, cv::LINE_AA);
}

}  // namespace facelens::render
