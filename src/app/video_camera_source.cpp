#include <facelens/app/video_camera_source.hpp>
#include <facelens/core/logger.hpp>
#include <facelens/vision/image_convert.hpp>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <algorithm>
#include <cctype>

namespace facelens::app {

struct VideoCameraSource::Capture {
  cv::VideoCapture video;
};

namespace {

bool is_index(const std::string& device) {
  return !device.empty() &&
         std::all_of(device.begin(), device.end(), [](unsigned char c) { return std::isdigit(c); });
}

}  // namespace

VideoCameraSource::VideoCameraSource(std::string device, std::uint32_t width, std::uint32_t height)
    : device_(std::move(device)), width_(width), height_(height) {}

VideoCameraSource::~VideoCameraSource() { stop(); }

std::vector<core::SensorDescriptor> VideoCameraSource::available_sensors() {
  return {core::SensorDescriptor{0, device_, core::LensDirection::External, 0}};
}

std::expected<void, core::PipelineError> VideoCameraSource::start(
    const core::SensorDescriptor& sensor,
    FrameCallback callback) {
  stop();
  auto capture = std::make_unique<Capture>();
  const bool opened = is_index(device_) ? capture->video.open(std::stoi(device_))
                                        : capture->video.open(device_);
  if (!opened || !capture->video.isOpened()) {
    core::Logger::error("VideoCameraSource: cannot open '", device_, "'");
    return std::unexpected(core::PipelineError::ResourceUnavailable);
  }
  if (width_ > 0 && height_ > 0) {
    capture->video.set(cv::CAP_PROP_FRAME_WIDTH, static_cast<double>(width_));
    capture->video.set(cv::CAP_PROP_FRAME_HEIGHT, static_cast<double>(height_));
  }

  capture_ = std::move(capture);
  callback_ = std::move(callback);
  running_.store(true);
  thread_ = std::thread(&VideoCameraSource::run, this);
  core::Logger::info("VideoCameraSource: started '", device_, "' as sensor ", sensor.index);
  return {};
}

void VideoCameraSource::stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  if (capture_) {
    capture_->video.release();
    capture_.reset();
    core::Logger::debug("VideoCameraSource: released '", device_, "'");
  }
  callback_ = nullptr;
}

void VideoCameraSource::run() {
  std::uint64_t sequence = 0;
  cv::Mat bgr;
  while (running_.load()) {
    if (!capture_->video.read(bgr) || bgr.empty()) {
      core::Logger::info("VideoCameraSource: end of stream on '", device_, "'");
      running_.store(false);
      break;
    }
    callback_(vision::bgr_to_bgra_frame(bgr, ++sequence));
  }
}

}  // namespace facelens::app
