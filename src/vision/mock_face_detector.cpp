#include <facelens/vision/mock_face_detector.hpp>
#include <stdexcept>
#include <thread>

namespace facelens::vision {

namespace {

class ActiveCall {
 public:
  ActiveCall(std::atomic<int>& active, std::atomic<int>& peak) : active_(active) {
    const int now = active_.fetch_add(1) + 1;
    int seen = peak.load();
    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
    }
  }
  ~ActiveCall() { active_.fetch_sub(1); }

 private:
  std::atomic<int>& active_;
};

}  // namespace

void MockFaceDetector::set_detections(std::vector<core::Detection> detections) {
  std::lock_guard lock(mutex_);
  detections_ = std::move(detections);
}

void MockFaceDetector::fail_with(std::optional<core::PipelineError> error) {
  std::lock_guard lock(mutex_);
  error_ = error;
}

void MockFaceDetector::throw_on_detect(bool enabled) {
  std::lock_guard lock(mutex_);
  throw_ = enabled;
}

void MockFaceDetector::set_latency(std::chrono::milliseconds latency) {
  std::lock_guard lock(mutex_);
  latency_ = latency;
}

std::optional<core::ImageDescriptor> MockFaceDetector::last_descriptor() const {
  std::lock_guard lock(mutex_);
  return last_descriptor_;
}

std::expected<std::vector<core::Detection>, core::PipelineError> MockFaceDetector::detect(
    const core::InputImage& input) {
  ActiveCall active(active_, peak_);
  calls_.fetch_add(1);
  if (closed_.load()) {
    return std::unexpected(core::PipelineError::ResourceUnavailable);
  }

  std::vector<core::Detection> detections;
  std::optional<core::PipelineError> error;
  bool should_throw = false;
  std::chrono::milliseconds latency{0};
  {
    std::lock_guard lock(mutex_);
    detections = detections_;
    error = error_;
    should_throw = throw_;
    latency = latency_;
    last_descriptor_ = input.descriptor();
  }

  if (latency.count() > 0) {
    std::this_thread::sleep_for(latency);
  }
  if (should_throw) {
    throw std::runtime_error("MockFaceDetector: simulated engine crash");
  }
  if (error) {
    return std::unexpected(*error);
  }
  return detections;
}

}  // namespace facelens::vision
