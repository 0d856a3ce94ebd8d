#pragma once

#include <facelens/core/frame.hpp>
#include <facelens/core/pipeline_state.hpp>
#include <facelens/pipeline/backpressure_gate.hpp>
#include <facelens/pipeline/detection_pipeline.hpp>
#include <facelens/pipeline/frame_slot.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <thread>

namespace facelens::pipeline {

/// Counters for one processor lifetime.
struct PipelineStats {
  std::uint64_t frames_delivered{0};
  std::uint64_t frames_dropped{0};
  std::uint64_t frames_processed{0};
  std::uint64_t invalid_frames{0};
  std::uint64_t inference_failures{0};
  double last_inference_ms{0.0};
};

/// Connects camera delivery to the detection worker.
///
/// on_frame() runs on the delivery thread: it asks the BackpressureGate for admission and
/// drops the frame when an inference is in flight; an admitted frame is handed over through a
/// FrameSlot together with its sensor context and its InflightGuard. One worker thread assembles
/// and detects; the guard releases the gate when the cycle ends, however it ends.
class FrameProcessor {
 public:
  FrameProcessor(core::PipelineState& state, DetectionPipeline& pipeline);
  ~FrameProcessor();

  FrameProcessor(const FrameProcessor&) = delete;
  FrameProcessor& operator=(const FrameProcessor&) = delete;

  /// Spawns the worker. No-op if already running.
  void start();

  /// Stops accepting frames, waits for the in-flight inference to finish and joins the worker.
  void stop();

  [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

  /// Delivery-thread entry point. Returns true if the frame was admitted for detection.
  bool on_frame(core::CameraFrame frame);

  [[nodiscard]] PipelineStats stats() const;

  [[nodiscard]] const BackpressureGate& gate() const noexcept { return gate_; }

 private:
  struct AdmittedFrame {
    core::CameraFrame frame;
    core::SensorContext context;
    InflightGuard guard;
  };

  void worker_loop();

  core::PipelineState& state_;
  DetectionPipeline& pipeline_;
  BackpressureGate gate_;
  FrameSlot<AdmittedFrame> slot_;
  std::mutex lifecycle_mutex_;
  std::thread worker_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> delivered_{0};
  std::atomic<std::uint64_t> not_running_drops_{0};
  std::atomic<std::uint64_t> invalid_{0};
};

}  // namespace facelens::pipeline
