#pragma once

#include <facelens/core/detection_set.hpp>
#include <facelens/core/pipeline_state.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

namespace facelens::pipeline {

/// One published DetectionSet and the generation it was published as.
/// Immutable once published; readers hold it by shared_ptr.
struct Publication {
  std::uint64_t generation{0};
  core::DetectionSet set;
};

using PublicationPtr = std::shared_ptr<const Publication>;

/// Hands DetectionSets from the detection worker to the render thread.
///
/// publish() replaces the current Publication with a single atomic pointer store
/// (last-write-wins, never mutated in place), so a reader always sees a complete set.
/// Sets captured under an older sensor epoch than PipelineState's are rejected.
class DetectionPublisher {
 public:
  /// Invoked on the publishing thread after each successful publish or clear.
  using Listener = std::function<void(const PublicationPtr&)>;

  explicit DetectionPublisher(const core::PipelineState& state);

  DetectionPublisher(const DetectionPublisher&) = delete;
  DetectionPublisher& operator=(const DetectionPublisher&) = delete;

  /// Returns false (nothing published) when set.sensor_epoch is stale.
  bool publish(core::DetectionSet set);

  /// Publishes an empty set for the current epoch (sensor switch).
  void clear();

  /// Latest publication; never null (generation 0 is the initial empty set).
  [[nodiscard]] PublicationPtr current() const;

  [[nodiscard]] std::uint64_t generation() const { return current()->generation; }

  void set_listener(Listener listener);

 private:
  void store(core::DetectionSet set);

  const core::PipelineState& state_;
  std::atomic<PublicationPtr> current_;
  std::mutex write_mutex_;  // serialises generation numbering between writers
  mutable std::mutex listener_mutex_;
  Listener listener_;
};

}  // namespace facelens::pipeline
