#include <facelens/app/batch_runner.hpp>
#include <facelens/core/logger.hpp>
#include <exception>

namespace facelens::app {

BatchResult detect_one(vision::IFaceDetector& detector, const core::InputImage& image) {
  if (auto valid = detector.validate_input(image); !valid) {
    return std::unexpected(valid.error());
  }
  try {
    return detector.detect(image);
  } catch (const std::exception& e) {
    core::Logger::warn("Batch: detector ", detector.name(), " threw on image ",
                       image.descriptor().sequence, ": ", e.what());
    return std::unexpected(core::PipelineError::InferenceFailure);
  }
}

void run_offline_batch(const std::vector<core::InputImage>& images,
                       vision::IFaceDetector& detector,
                       const BatchResultCallback& callback) {
  if (!callback) return;
  for (std::size_t i = 0; i < images.size(); ++i) {
    callback(i, detect_one(detector, images[i]));
  }
}

}  // namespace facelens::app
