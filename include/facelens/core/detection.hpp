#pragma once

#include <facelens/core/geometry.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace facelens::core {

enum class LandmarkType : std::uint8_t {
  LeftEye,
  RightEye,
  NoseBase,
  MouthLeft,
  MouthRight,
  MouthBottom,
  LeftCheek,
  RightCheek,
  LeftEar,
  RightEar,
};

struct FaceLandmark {
  LandmarkType type{LandmarkType::NoseBase};
  Point position{};
};

/// Per-face classification probabilities (0..1) when the engine provides them.
struct FaceClassification {
  std::optional<float> smiling;
  std::optional<float> left_eye_open;
  std::optional<float> right_eye_open;
};

/// Single detected face. The bounding box is in frame pixels (sensor space);
/// everything except the box is engine output passed through untouched.
struct Detection {
  Rect bounding_box{};
  std::optional<std::int32_t> tracking_id;
  float confidence{1.f};
  std::optional<FaceClassification> classification;
  std::vector<FaceLandmark> landmarks;
  std::optional<float> head_euler_y;
  std::optional<float> head_euler_z;
};

}  // namespace facelens::core
