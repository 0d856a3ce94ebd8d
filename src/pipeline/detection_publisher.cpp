#include <facelens/pipeline/detection_publisher.hpp>
#include <facelens/core/logger.hpp>

namespace facelens::pipeline {

DetectionPublisher::DetectionPublisher(const core::PipelineState& state)
    : state_(state), current_(std::make_shared<const Publication>()) {}

bool DetectionPublisher::publish(core::DetectionSet set) {
  const std::uint64_t epoch = state_.epoch();
  if (set.sensor_epoch != epoch) {
    core::Logger::debug("DetectionPublisher: dropping set for frame #", set.sequence,
                        " from sensor epoch ", set.sensor_epoch, " (current ", epoch, ")");
    return false;
  }
  store(std::move(set));
  return true;
}

void DetectionPublisher::clear() {
  core::DetectionSet empty;
  empty.sensor_epoch = state_.epoch();
  store(std::move(empty));
}

PublicationPtr DetectionPublisher::current() const {
  return current_.load(std::memory_order_acquire);
}

void DetectionPublisher::set_listener(Listener listener) {
  std::lock_guard lock(listener_mutex_);
  listener_ = std::move(listener);
}

void DetectionPublisher::store(core::DetectionSet set) {
  PublicationPtr published;
  {
    std::lock_guard lock(write_mutex_);
    auto next = std::make_shared<Publication>();
    next->generation = current_.load(std::memory_order_acquire)->generation + 1;
    next->set = std::move(set);
    published = std::move(next);
    current_.store(published, std::memory_order_release);
  }

  Listener listener;
  {
    std::lock_guard lock(listener_mutex_);
    listener = listener_;
  }
  if (listener) {
    listener(published);
  }
}

}  // namespace facelens::pipeline
