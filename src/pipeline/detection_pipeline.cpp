#include <facelens/pipeline/detection_pipeline.hpp>
#include <facelens/core/logger.hpp>
#include <chrono>
#include <cmath>
#include <exception>

namespace facelens::pipeline {

bool well_formed(const std::vector<core::Detection>& detections) noexcept {
  for (const auto& d : detections) {
    const core::Rect& r = d.bounding_box;
    if (!std::isfinite(r.left) || !std::isfinite(r.top) || !std::isfinite(r.right) ||
        !std::isfinite(r.bottom)) {
      return false;
    }
    if (r.right < r.left || r.bottom < r.top) {
      return false;
    }
  }
  return true;
}

DetectionPipeline::DetectionPipeline(std::unique_ptr<vision::IFaceDetector> detector,
                                     DetectionPublisher& publisher,
                                     DetectionPipelineOptions options)
    : detector_(std::move(detector)), publisher_(publisher), options_(options) {}

void DetectionPipeline::close() {
  if (closed_) return;
  closed_ = true;
  if (detector_) {
    detector_->close();
    core::Logger::info("DetectionPipeline: closed detector '", detector_->name(), "'");
  }
}

void DetectionPipeline::reset_tracking() {
  if (detector_ && !closed_) {
    detector_->reset_tracking();
  }
}

std::expected<std::vector<core::Detection>, core::PipelineError>
DetectionPipeline::run_detector(const core::InputImage& image) {
  auto valid = detector_->validate_input(image);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  try {
    return detector_->detect(image);
  } catch (const std::exception& e) {
    core::Logger::warn("DetectionPipeline: detector '", detector_->name(), "' threw on frame #",
                       image.descriptor().sequence, ": ", e.what());
    return std::unexpected(core::PipelineError::InferenceFailure);
  }
}

std::expected<core::DetectionSet, core::PipelineError> DetectionPipeline::process(
    const core::InputImage& image,
    const core::SensorContext& context) {
  if (closed_ || !detector_) {
    return std::unexpected(core::PipelineError::ResourceUnavailable);
  }
  const auto& descriptor = image.descriptor();

  const auto start = std::chrono::steady_clock::now();
  auto detections = run_detector(image);
  const auto elapsed = std::chrono::steady_clock::now() - start;
  const double ms = 1e-3 * static_cast<double>(
      std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
  last_inference_ms_.store(ms, std::memory_order_relaxed);
  if (timing_cb_) {
    timing_cb_(descriptor.sequence, ms);
  }

  if (!detections) {
    if (detections.error() == core::PipelineError::InvalidFrame) {
      core::Logger::warn("DetectionPipeline: frame #", descriptor.sequence,
                         " rejected by detector input validation");
      return std::unexpected(core::PipelineError::InvalidFrame);
    }
    failures_.fetch_add(1, std::memory_order_relaxed);
    core::Logger::warn("DetectionPipeline: inference failed on frame #", descriptor.sequence,
                       " (", core::to_string(detections.error()), ")");
    return std::unexpected(core::PipelineError::InferenceFailure);
  }
  if (options_.inference_timeout.count() > 0 && elapsed > options_.inference_timeout) {
    failures_.fetch_add(1, std::memory_order_relaxed);
    core::Logger::warn("DetectionPipeline: inference on frame #", descriptor.sequence, " took ",
                       ms, " ms (timeout ", options_.inference_timeout.count(), " ms)");
    return std::unexpected(core::PipelineError::InferenceFailure);
  }
  if (!well_formed(*detections)) {
    failures_.fetch_add(1, std::memory_order_relaxed);
    core::Logger::warn("DetectionPipeline: malformed detector output on frame #",
                       descriptor.sequence);
    return std::unexpected(core::PipelineError::InferenceFailure);
  }

  core::DetectionSet set;
  set.detections = std::move(*detections);
  set.image_size = descriptor.size();
  set.rotation = descriptor.rotation;
  set.lens_direction =
      context.sensor ? context.sensor->lens_direction : core::LensDirection::Back;
  set.sequence = descriptor.sequence;
  set.sensor_epoch = context.epoch;

  if (!publisher_.publish(set)) {
    core::Logger::debug("DetectionPipeline: frame #", descriptor.sequence,
                        " belongs to a previous sensor; result discarded");
    return std::unexpected(core::PipelineError::StaleResult);
  }
  processed_.fetch_add(1, std::memory_order_relaxed);
  return set;
}

}  // namespace facelens::pipeline
