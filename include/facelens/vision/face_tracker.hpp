#pragma once

#include <facelens/core/detection.hpp>
#include <cstdint>
#include <vector>

namespace facelens::vision {

/// Assigns stable tracking ids across consecutive frames by greedy IoU matching.
/// A track unmatched for more than max_missed frames is dropped; ids are never reused.
class FaceTracker {
 public:
  explicit FaceTracker(float min_iou = 0.3f, std::uint32_t max_missed = 5);

  /// Sets tracking_id on every detection (in place), matching against live tracks.
  void update(std::vector<core::Detection>& detections);

  void reset();

  [[nodiscard]] std::size_t active_tracks() const noexcept { return tracks_.size(); }

 private:
  struct Track {
    std::int32_t id{0};
    core::Rect box{};
    std::uint32_t missed{0};
  };

  float min_iou_;
  std::uint32_t max_missed_;
  std::int32_t next_id_{1};
  std::vector<Track> tracks_;
};

}  // namespace facelens::vision
