#include <facelens/core/pipeline_state.hpp>

namespace facelens::core {

void PipelineState::reset(const SensorDescriptor& sensor, ImageRotation effective_rotation) {
  std::lock_guard lock(mutex_);
  sensor_ = sensor;
  rotation_ = effective_rotation;
  in_flight_.store(false, std::memory_order_release);
  epoch_.fetch_add(1, std::memory_order_acq_rel);
}

void PipelineState::clear() {
  std::lock_guard lock(mutex_);
  sensor_.reset();
  rotation_ = ImageRotation::Rotation0;
  in_flight_.store(false, std::memory_order_release);
  epoch_.fetch_add(1, std::memory_order_acq_rel);
}

SensorContext PipelineState::context() const {
  std::lock_guard lock(mutex_);
  return SensorContext{sensor_, rotation_, epoch_.load(std::memory_order_acquire)};
}

}  // namespace facelens::core
