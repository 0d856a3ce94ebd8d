#pragma once

#include <facelens/core/pipeline_state.hpp>
#include <atomic>
#include <cstdint>

namespace facelens::pipeline {

class BackpressureGate;

/// Move-only admission ticket. Releases the gate exactly once when destroyed,
/// whether the inference it guards returned normally or threw.
class InflightGuard {
 public:
  InflightGuard() = default;
  explicit InflightGuard(BackpressureGate* gate) noexcept : gate_(gate) {}
  ~InflightGuard() { release(); }

  InflightGuard(InflightGuard&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
  InflightGuard& operator=(InflightGuard&& other) noexcept;
  InflightGuard(const InflightGuard&) = delete;
  InflightGuard& operator=(const InflightGuard&) = delete;

  [[nodiscard]] bool admitted() const noexcept { return gate_ != nullptr; }
  explicit operator bool() const noexcept { return admitted(); }

  void release() noexcept;

 private:
  BackpressureGate* gate_{nullptr};
};

/// Admits at most one inference at a time. Frames offered while busy are dropped,
/// never queued: the pipeline follows the live feed instead of a backlog.
class BackpressureGate {
 public:
  explicit BackpressureGate(core::PipelineState& state) : state_(state) {}

  BackpressureGate(const BackpressureGate&) = delete;
  BackpressureGate& operator=(const BackpressureGate&) = delete;

  /// False (and the caller drops the frame) if an inference is in flight; otherwise marks
  /// in flight and returns true. Pair every true with exactly one release().
  [[nodiscard]] bool try_admit() noexcept;

  /// Scoped form of try_admit(): an empty guard when busy.
  [[nodiscard]] InflightGuard admit() noexcept;

  /// Clears the in-flight flag unconditionally.
  void release() noexcept { state_.clear_in_flight(); }

  [[nodiscard]] bool busy() const noexcept { return state_.in_flight(); }

  [[nodiscard]] std::uint64_t admitted_count() const noexcept {
    return admitted_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] std::uint64_t dropped_count() const noexcept {
    return dropped_.load(std::memory_order_relaxed);
  }

 private:
  core::PipelineState& state_;
  std::atomic<std::uint64_t> admitted_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace facelens::pipeline
