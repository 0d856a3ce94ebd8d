#include <facelens/app/synthetic_camera_source.hpp>
#include <facelens/core/logger.hpp>
#include <facelens/vision/image_convert.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>

namespace facelens::app {

std::vector<core::SensorDescriptor> default_phone_sensors() {
  return {
      core::SensorDescriptor{0, "back", core::LensDirection::Back, 90},
      core::SensorDescriptor{1, "front", core::LensDirection::Front, 270},
  };
}

SyntheticCameraSource::SyntheticCameraSource(SyntheticCameraOptions options)
    : options_(std::move(options)) {}

SyntheticCameraSource::~SyntheticCameraSource() { stop(); }

std::vector<core::SensorDescriptor> SyntheticCameraSource::available_sensors() {
  return options_.sensors;
}

std::optional<core::SensorDescriptor> SyntheticCameraSource::active_sensor() const {
  std::lock_guard lock(mutex_);
  return active_;
}

std::expected<void, core::PipelineError> SyntheticCameraSource::start(
    const core::SensorDescriptor& sensor,
    FrameCallback callback) {
  stop();
  if (fail_next_start_.exchange(false)) {
    core::Logger::error("SyntheticCameraSource: sensor ", sensor.index, " unavailable");
    return std::unexpected(core::PipelineError::ResourceUnavailable);
  }
  {
    std::lock_guard lock(mutex_);
    callback_ = std::move(callback);
    active_ = sensor;
  }
  running_.store(true);
  start_count_.fetch_add(1);
  if (options_.frame_rate > 0) {
    thread_ = std::thread(&SyntheticCameraSource::run, this);
  }
  core::Logger::info("SyntheticCameraSource: started sensor ", sensor.index, " '", sensor.name,
                     "' ", options_.width, "x", options_.height);
  return {};
}

void SyntheticCameraSource::stop() {
  const bool was_running = running_.exchange(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  std::lock_guard lock(mutex_);
  callback_ = nullptr;
  active_.reset();
  if (was_running) {
    core::Logger::debug("SyntheticCameraSource: stopped");
  }
}

bool SyntheticCameraSource::deliver(core::CameraFrame frame) {
  if (!running_.load()) return false;
  FrameCallback callback;
  {
    std::lock_guard lock(mutex_);
    callback = callback_;
  }
  if (!callback) return false;
  callback(std::move(frame));
  return true;
}

core::CameraFrame SyntheticCameraSource::generate_frame() {
  const std::uint64_t seq = sequence_.fetch_add(1) + 1;
  const int w = static_cast<int>(options_.width);
  const int h = static_cast<int>(options_.height);
  cv::Mat bgr(h, w, CV_8UC3, cv::Scalar(90, 90, 90));

  const double phase = static_cast<double>(seq % 240) / 240.0 * 2.0 * CV_PI;
  const cv::Point center(static_cast<int>(w / 2 + std::sin(phase) * w / 4), h / 2);
  const cv::Size axes(w / 10, h / 6);
  cv::ellipse(bgr, center, axes, 0, 0, 360, cv::Scalar(150, 180, 220), cv::FILLED);
  cv::circle(bgr, center + cv::Point(-axes.width / 3, -axes.height / 4), axes.width / 6,
             cv::Scalar(40, 40, 40), cv::FILLED);
  cv::circle(bgr, center + cv::Point(axes.width / 3, -axes.height / 4), axes.width / 6,
             cv::Scalar(40, 40, 40), cv::FILLED);

  if (options_.format == core::PixelFormat::Bgra8888) {
    return vision::bgr_to_bgra_frame(bgr, seq);
  }
  return vision::bgr_to_nv21_frame(bgr, seq);
}

void SyntheticCameraSource::run() {
  constexpr std::uint32_t kMaxFrameRate = 1000;
  const auto period =
      std::chrono::microseconds(1'000'000 / std::min(options_.frame_rate, kMaxFrameRate));
  auto next = std::chrono::steady_clock::now();
  while (running_.load()) {
    deliver(generate_frame());
    next += period;
    std::this_thread::sleep_until(next);
  }
}

}  // namespace facelens::app
