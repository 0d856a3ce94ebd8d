#pragma once

#include <string_view>

namespace facelens::core {

/// Pipeline error codes; used with std::expected for recoverable failures.
/// InvalidFrame, InferenceFailure and DegenerateGeometry are per-frame and never fatal.
/// ResourceUnavailable is surfaced to the caller (camera or model cannot be opened).
/// StaleResult marks a detection computed for a sensor that has since been replaced.
enum class PipelineError {
  None = 0,
  InvalidFrame,
  InferenceFailure,
  DegenerateGeometry,
  ResourceUnavailable,
  InvalidConfig,
  StaleResult,
};

[[nodiscard]] std::string_view to_string(PipelineError error) noexcept;

}  // namespace facelens::core
