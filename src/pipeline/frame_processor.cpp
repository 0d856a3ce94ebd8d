#include <facelens/pipeline/frame_processor.hpp>
#include <facelens/core/logger.hpp>
#include <facelens/pipeline/frame_assembler.hpp>

namespace facelens::pipeline {

FrameProcessor::FrameProcessor(core::PipelineState& state, DetectionPipeline& pipeline)
    : state_(state), pipeline_(pipeline), gate_(state) {}

FrameProcessor::~FrameProcessor() { stop(); }

void FrameProcessor::start() {
  std::lock_guard lock(lifecycle_mutex_);
  if (running_.load(std::memory_order_acquire)) return;
  slot_.reopen();
  running_.store(true, std::memory_order_release);
  worker_ = std::thread(&FrameProcessor::worker_loop, this);
  core::Logger::debug("FrameProcessor: worker started");
}

void FrameProcessor::stop() {
  std::lock_guard lock(lifecycle_mutex_);
  if (!running_.exchange(false, std::memory_order_acq_rel)) return;
  slot_.close();
  if (worker_.joinable()) {
    worker_.join();
  }
  core::Logger::debug("FrameProcessor: worker stopped");
}

bool FrameProcessor::on_frame(core::CameraFrame frame) {
  delivered_.fetch_add(1, std::memory_order_relaxed);
  if (!running_.load(std::memory_order_acquire)) {
    not_running_drops_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }

  InflightGuard guard = gate_.admit();
  if (!guard) {
    core::Logger::debug("FrameProcessor: dropped frame #", frame.sequence(), " (busy)");
    return false;
  }

  core::SensorContext context = state_.context();
  if (!context.sensor) {
    not_running_drops_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }
  slot_.offer(AdmittedFrame{std::move(frame), std::move(context), std::move(guard)});
  return true;
}

void FrameProcessor::worker_loop() {
  while (auto item = slot_.take()) {
    auto image = assemble_frame(item->frame, item->context.rotation);
    if (!image) {
      invalid_.fetch_add(1, std::memory_order_relaxed);
      core::Logger::warn("FrameProcessor: skipping frame #", item->frame.sequence(), " (",
                         core::to_string(image.error()), ")");
      continue;
    }
    auto result = pipeline_.process(*image, item->context);
    if (!result && result.error() == core::PipelineError::InvalidFrame) {
      invalid_.fetch_add(1, std::memory_order_relaxed);
    }
  }
}

PipelineStats FrameProcessor::stats() const {
  PipelineStats s;
  s.frames_delivered = delivered_.load(std::memory_order_relaxed);
  s.frames_dropped =
      gate_.dropped_count() + not_running_drops_.load(std::memory_order_relaxed);
  s.frames_processed = pipeline_.processed_count();
  s.invalid_frames = invalid_.load(std::memory_order_relaxed);
  s.inference_failures = pipeline_.failure_count();
  s.last_inference_ms = pipeline_.last_inference_ms();
  return s;
}

}  // namespace facelens::pipeline
