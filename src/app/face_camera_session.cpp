#include <facelens/app/face_camera_session.hpp>
#include <facelens/core/logger.hpp>
#include <algorithm>
#include <exception>
#include <utility>

namespace facelens::app {

namespace {

/// Runs f when the scope ends, including during stack unwinding. An exception from f is
/// logged so the remaining teardown steps still run.
template <typename F>
class ScopeExit {
 public:
  explicit ScopeExit(F f) : f_(std::move(f)) {}
  ~ScopeExit() {
    try {
      f_();
    } catch (const std::exception& e) {
      core::Logger::error("FaceCameraSession: teardown step failed: ", e.what());
    }
  }
  ScopeExit(const ScopeExit&) = delete;
  ScopeExit& operator=(const ScopeExit&) = delete;

 private:
  F f_;
};

}  // namespace

FaceCameraSession::FaceCameraSession(std::unique_ptr<ICameraSource> camera,
                                     std::unique_ptr<vision::IFaceDetector> detector,
                                     SessionOptions options)
    : options_(options),
      publisher_(state_),
      pipeline_(std::move(detector), publisher_, options.pipeline),
      processor_(state_, pipeline_),
      camera_(std::move(camera)) {}

FaceCameraSession::~FaceCameraSession() { shutdown(); }

std::expected<void, core::PipelineError> FaceCameraSession::initialize() {
  std::lock_guard lock(control_mutex_);
  if (shut_down_ || !camera_ || !pipeline_.detector()) {
    return std::unexpected(core::PipelineError::ResourceUnavailable);
  }
  sensors_ = camera_->available_sensors();
  if (sensors_.empty()) {
    core::Logger::error("FaceCameraSession: no cameras found on this device");
    return std::unexpected(core::PipelineError::ResourceUnavailable);
  }
  pipeline_.detector()->warmup();

  const auto front = std::find_if(sensors_.begin(), sensors_.end(), [](const auto& s) {
    return s.lens_direction == core::LensDirection::Front;
  });
  const std::size_t index =
      front == sensors_.end() ? 0 : static_cast<std::size_t>(front - sensors_.begin());
  return switch_to_locked(index);
}

void FaceCameraSession::stop_delivery() {
  camera_->stop();
  processor_.stop();
}

std::expected<void, core::PipelineError> FaceCameraSession::switch_to(std::size_t index) {
  std::lock_guard lock(control_mutex_);
  return switch_to_locked(index);
}

std::expected<void, core::PipelineError> FaceCameraSession::switch_to_locked(std::size_t index) {
  if (shut_down_) {
    return std::unexpected(core::PipelineError::ResourceUnavailable);
  }
  if (index >= sensors_.size()) {
    return std::unexpected(core::PipelineError::InvalidConfig);
  }

  stop_delivery();
  pipeline_.reset_tracking();

  const core::SensorDescriptor& sensor = sensors_[index];
  const core::ImageRotation rotation = pipeline::effective_rotation(sensor, options_.rotation);
  state_.reset(sensor, rotation);
  publisher_.clear();
  selected_ = index;

  processor_.start();
  auto started = camera_->start(sensor, [this](core::CameraFrame frame) { on_frame(std::move(frame)); });
  if (!started) {
    processor_.stop();
    state_.clear();
    selected_.reset();
    core::Logger::error("FaceCameraSession: cannot start sensor ", sensor.index, " (",
                        core::to_string(started.error()), ")");
    return std::unexpected(started.error());
  }

  core::Logger::info("FaceCameraSession: active sensor ", sensor.index, " '", sensor.name,
                     "' rotation ", core::degrees(rotation));
  return {};
}

std::expected<void, core::PipelineError> FaceCameraSession::toggle_camera() {
  std::lock_guard lock(control_mutex_);
  if (shut_down_) {
    return std::unexpected(core::PipelineError::ResourceUnavailable);
  }
  if (sensors_.size() < 2) {
    core::Logger::info("FaceCameraSession: only one camera found");
    return {};
  }
  const std::size_t next = selected_ ? (*selected_ + 1) % sensors_.size() : 0;
  return switch_to_locked(next);
}

void FaceCameraSession::shutdown() {
  std::lock_guard lock(control_mutex_);
  if (shut_down_) return;
  shut_down_ = true;

  ScopeExit clear_state([this]() { state_.clear(); });
  ScopeExit release_detector([this]() { pipeline_.close(); });
  ScopeExit join_worker([this]() { processor_.stop(); });
  if (camera_) {
    camera_->stop();
  }
  core::Logger::info("FaceCameraSession: shut down");
}

void FaceCameraSession::set_preview_callback(PreviewCallback callback) {
  std::lock_guard lock(preview_mutex_);
  preview_ = std::move(callback);
}

std::vector<core::SensorDescriptor> FaceCameraSession::sensors() const {
  std::lock_guard lock(control_mutex_);
  return sensors_;
}

std::optional<std::size_t> FaceCameraSession::selected_index() const {
  std::lock_guard lock(control_mutex_);
  return selected_;
}

std::size_t FaceCameraSession::face_count() const {
  return publisher_.current()->set.detections.size();
}

void FaceCameraSession::on_frame(core::CameraFrame frame) {
  {
    std::lock_guard lock(preview_mutex_);
    if (preview_) {
      preview_(frame);
    }
  }
  processor_.on_frame(std::move(frame));
}

}  // namespace facelens::app
