#include <facelens/core/error.hpp>

namespace facelens::core {

std::string_view to_string(PipelineError error) noexcept {
  switch (error) {
    case PipelineError::None:
      return "None";
    case PipelineError::InvalidFrame:
      return "InvalidFrame";
    case PipelineError::InferenceFailure:
      return "InferenceFailure";
    case PipelineError::DegenerateGeometry:
      return "DegenerateGeometry";
    case PipelineError::ResourceUnavailable:
      return "ResourceUnavailable";
    case PipelineError::InvalidConfig:
      return "InvalidConfig";
    case PipelineError::StaleResult:
      return "StaleResult";
  }
  return "Unknown";
}

}  // namespace facelens::core
