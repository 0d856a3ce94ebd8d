#pragma once

#include <cstdint>

namespace facelens::core {

enum class PerformanceMode : std::uint8_t {
  Fast,
  Accurate,
};

/// Immutable detector configuration, built once at startup.
struct DetectorOptions {
  bool classification{true};
  bool landmarks{true};
  bool tracking{true};
  PerformanceMode performance_mode{PerformanceMode::Fast};
  float min_face_size{0.1f};  // smallest face, as a fraction of the image's shorter side
  float confidence_threshold{0.7f};
};

}  // namespace facelens::core
