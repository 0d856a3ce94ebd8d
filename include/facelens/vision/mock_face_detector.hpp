#pragma once

#include <facelens/vision/face_detector.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace facelens::vision {

/// Detector that returns configurable synthetic faces (for tests/demo).
/// Configuration setters are thread-safe; detect() records call and concurrency counts.
class MockFaceDetector : public IFaceDetector {
 public:
  /// Detections to return from subsequent detect() calls.
  void set_detections(std::vector<core::Detection> detections);

  /// Make detect() return this error (nullopt restores success).
  void fail_with(std::optional<core::PipelineError> error);

  /// Make detect() throw std::runtime_error.
  void throw_on_detect(bool enabled);

  /// Sleep inside detect() to simulate model latency.
  void set_latency(std::chrono::milliseconds latency);

  [[nodiscard]] std::expected<std::vector<core::Detection>, core::PipelineError>
  detect(const core::InputImage& input) override;

  void reset_tracking() override { tracking_resets_.fetch_add(1); }
  void close() override { closed_.store(true); }

  [[nodiscard]] std::string_view name() const noexcept override { return "mock"; }

  [[nodiscard]] std::uint64_t calls() const noexcept { return calls_.load(); }
  [[nodiscard]] int peak_concurrency() const noexcept { return peak_.load(); }
  [[nodiscard]] bool closed() const noexcept { return closed_.load(); }
  [[nodiscard]] std::uint64_t tracking_resets() const noexcept { return tracking_resets_.load(); }
  [[nodiscard]] std::optional<core::ImageDescriptor> last_descriptor() const;

 private:
  mutable std::mutex mutex_;
  std::vector<core::Detection> detections_;
  std::optional<core::PipelineError> error_;
  bool throw_{false};
  std::chrono::milliseconds latency_{0};
  std::optional<core::ImageDescriptor> last_descriptor_;

  std::atomic<std::uint64_t> calls_{0};
  std::atomic<int> active_{0};
  std::atomic<int> peak_{0};
  std::atomic<bool> closed_{false};
  std::atomic<std::uint64_t> tracking_resets_{0};
};

}  // namespace facelens::vision
