#include <facelens/pipeline/backpressure_gate.hpp>

namespace facelens::pipeline {

InflightGuard& InflightGuard::operator=(InflightGuard&& other) noexcept {
  if (this != &other) {
    release();
    gate_ = other.gate_;
    other.gate_ = nullptr;
  }
  return *this;
}

void InflightGuard::release() noexcept {
  if (gate_) {
    gate_->release();
    gate_ = nullptr;
  }
}

bool BackpressureGate::try_admit() noexcept {
  if (state_.try_mark_in_flight()) {
    admitted_.fetch_add(1, std::memory_order_relaxed);
    return true;
  }
  dropped_.fetch_add(1, std::memory_order_relaxed);
  return false;
}

InflightGuard BackpressureGate::admit() noexcept {
  if (try_admit()) {
    return InflightGuard(this);
  }
  return InflightGuard();
}

}  // namespace facelens::pipeline
