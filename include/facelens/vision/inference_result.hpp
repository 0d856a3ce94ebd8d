#pragma once

#include <cstdint>
#include <vector>

namespace facelens::vision {

/// Raw model output before decoding to Detections.
struct InferenceResult {
  std::vector<float> boxes;  // [x1,y1,x2,y2] per candidate, normalised 0..1 to the model input
  std::vector<float> scores;  // face probability per candidate
  std::uint32_t num_detections{0};
};

}  // namespace facelens::vision
