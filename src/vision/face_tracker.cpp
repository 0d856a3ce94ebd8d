#include <facelens/vision/face_tracker.hpp>
#include <algorithm>

namespace facelens::vision {

FaceTracker::FaceTracker(float min_iou, std::uint32_t max_missed)
    : min_iou_(min_iou), max_missed_(max_missed) {}

void FaceTracker::reset() {
  tracks_.clear();
  next_id_ = 1;
}

void FaceTracker::update(std::vector<core::Detection>& detections) {
  std::vector<char> track_used(tracks_.size(), 0);

  for (auto& detection : detections) {
    float best_iou = min_iou_;
    std::size_t best = tracks_.size();
    for (std::size_t t = 0; t < tracks_.size(); ++t) {
      if (track_used[t]) continue;
      const float overlap = core::iou(tracks_[t].box, detection.bounding_box);
      if (overlap >= best_iou) {
        best_iou = overlap;
        best = t;
      }
    }

    if (best < tracks_.size()) {
      track_used[best] = 1;
      tracks_[best].box = detection.bounding_box;
      tracks_[best].missed = 0;
      detection.tracking_id = tracks_[best].id;
    } else {
      Track track;
      track.id = next_id_++;
      track.box = detection.bounding_box;
      tracks_.push_back(track);
      track_used.push_back(1);
      detection.tracking_id = track.id;
    }
  }

  for (std::size_t t = 0; t < tracks_.size(); ++t) {
    if (!track_used[t]) ++tracks_[t].missed;
  }
  tracks_.erase(std::remove_if(tracks_.begin(), tracks_.end(),
                               [this](const Track& t) { return t.missed > max_missed_; }),
                tracks_.end());
}

}  // namespace facelens::vision
