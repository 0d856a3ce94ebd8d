#pragma once

#include <cstdint>
#include <string>

namespace facelens::core {

enum class LensDirection : std::uint8_t {
  Back,
  Front,
  External,
};

/// Host platform family; decides how delivered images are already rotated.
enum class Platform : std::uint8_t {
  Android,
  Ios,
  Desktop,
};

/// Camera sensor as enumerated by the camera source.
struct SensorDescriptor {
  std::uint32_t index{0};
  std::string name;
  LensDirection lens_direction{LensDirection::Back};
  int sensor_orientation{0};  // fixed mounting rotation in degrees

  friend bool operator==(const SensorDescriptor&, const SensorDescriptor&) = default;
};

}  // namespace facelens::core
