#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

namespace facelens::pipeline {

/// Single-slot channel between frame delivery and the detection worker.
///
/// Capacity 1, overwrite-on-full: offer() never blocks and replaces an unconsumed item.
/// take() blocks until an item arrives or the slot is closed.
/// Thread-safety: any number of producers and consumers.
///
/// @tparam T Move-constructible item (usually an admitted frame).
template <typename T>
class FrameSlot {
 public:
  FrameSlot() = default;
  FrameSlot(const FrameSlot&) = delete;
  FrameSlot& operator=(const FrameSlot&) = delete;

  /// Stores item. Returns true if it replaced one that was never taken.
  /// Items offered after close() are discarded and false is returned.
  bool offer(T item) {
    std::optional<T> replaced;
    {
      std::lock_guard lock(mutex_);
      if (closed_) return false;
      if (item_) {
        replaced = std::move(item_);
        ++overwritten_;
      }
      item_.emplace(std::move(item));
    }
    cv_.notify_one();
    return replaced.has_value();
  }

  /// Waits for an item; nullopt once closed (a pending item is discarded on close).
  [[nodiscard]] std::optional<T> take() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this]() { return closed_ || item_.has_value(); });
    return pop_locked();
  }

  [[nodiscard]] std::optional<T> try_take() {
    std::lock_guard lock(mutex_);
    return pop_locked();
  }

  /// Wakes all waiters; further offers are discarded until reopen().
  void close() {
    std::optional<T> dropped;
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
      dropped = std::move(item_);
      item_.reset();
    }
    cv_.notify_all();
  }

  void reopen() {
    std::lock_guard lock(mutex_);
    closed_ = false;
  }

  [[nodiscard]] bool closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  [[nodiscard]] bool has_value() const {
    std::lock_guard lock(mutex_);
    return item_.has_value();
  }

  [[nodiscard]] std::uint64_t overwritten() const {
    std::lock_guard lock(mutex_);
    return overwritten_;
  }

 private:
  std::optional<T> pop_locked() {
    if (closed_ || !item_) return std::nullopt;
    std::optional<T> out = std::move(item_);
    item_.reset();
    return out;
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::optional<T> item_;
  bool closed_{false};
  std::uint64_t overwritten_{0};
};

}  // namespace facelens::pipeline
