#include <facelens/vision/face_detector.hpp>
#include <facelens/core/frame.hpp>

namespace facelens::vision {

std::expected<void, core::PipelineError> IFaceDetector::validate_input(
    const core::InputImage& input) const {
  const auto& d = input.descriptor();
  if (input.empty() || d.width == 0 || d.height == 0) {
    return std::unexpected(core::PipelineError::InvalidFrame);
  }
  if (d.format == core::PixelFormat::Unknown) {
    return std::unexpected(core::PipelineError::InvalidFrame);
  }
  if (input.size_bytes() < core::CameraFrame::min_bytes(d.width, d.height, d.format)) {
    return std::unexpected(core::PipelineError::InvalidFrame);
  }
  return {};
}

std::expected<std::vector<std::vector<core::Detection>>, core::PipelineError>
IFaceDetector::detect_batch(std::span<const core::InputImage> inputs) {
  std::vector<std::vector<core::Detection>> results;
  results.reserve(inputs.size());
  for (const auto& image : inputs) {
    auto single = detect(image);
    if (!single) {
      return std::unexpected(single.error());
    }
    results.push_back(std::move(*single));
  }
  return results;
}

}  // namespace facelens::vision
