#pragma once

#include <facelens/core/frame.hpp>
#include <facelens/core/sensor.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>

namespace facelens::core {

/// Sensor context captured together, so a frame is never paired with a newer sensor.
struct SensorContext {
  std::optional<SensorDescriptor> sensor;
  ImageRotation rotation{ImageRotation::Rotation0};
  std::uint64_t epoch{0};
};

/// Shared state between frame delivery and the detection worker.
///
/// The in-flight flag is lock-free (compare-exchange). The sensor, its cached effective
/// rotation and the epoch change together under a mutex and only through reset().
/// Owned by the session object and passed by reference; never global.
class PipelineState {
 public:
  PipelineState() = default;
  PipelineState(const PipelineState&) = delete;
  PipelineState& operator=(const PipelineState&) = delete;

  /// Select a new sensor: clears the in-flight flag, caches rotation, bumps the epoch.
  void reset(const SensorDescriptor& sensor, ImageRotation effective_rotation);

  /// Forget the sensor (shutdown). Clears the in-flight flag and bumps the epoch.
  void clear();

  [[nodiscard]] SensorContext context() const;

  [[nodiscard]] std::uint64_t epoch() const noexcept {
    return epoch_.load(std::memory_order_acquire);
  }

  /// Returns true and sets the flag if it was clear; false if an inference is in flight.
  [[nodiscard]] bool try_mark_in_flight() noexcept {
    bool expected = false;
    return in_flight_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
  }

  void clear_in_flight() noexcept { in_flight_.store(false, std::memory_order_release); }

  [[nodiscard]] bool in_flight() const noexcept {
    return in_flight_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> in_flight_{false};
  std::atomic<std::uint64_t> epoch_{0};
  mutable std::mutex mutex_;
  std::optional<SensorDescriptor> sensor_;
  ImageRotation rotation_{ImageRotation::Rotation0};
};

}  // namespace facelens::core
