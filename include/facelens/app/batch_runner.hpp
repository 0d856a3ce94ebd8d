#pragma once

#include <facelens/core/detection.hpp>
#include <facelens/core/error.hpp>
#include <facelens/core/input_image.hpp>
#include <facelens/vision/face_detector.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace facelens::app {

using BatchResult = std::expected<std::vector<core::Detection>, core::PipelineError>;

/// Receives the result for images[index]. The TBB runner calls it from worker threads;
/// it must be thread-safe there.
using BatchResultCallback = std::function<void(std::size_t index, const BatchResult& result)>;

/// Creates one detector per worker thread. Returning nullptr fails that thread's images
/// with ResourceUnavailable.
using DetectorFactory = std::function<std::unique_ptr<vision::IFaceDetector>()>;

/// Detects faces in each image in order with one detector. Validation errors, detector
/// errors and exceptions are reported per image; the batch always runs to the end.
void run_offline_batch(const std::vector<core::InputImage>& images,
                       vision::IFaceDetector& detector,
                       const BatchResultCallback& callback);

/// Validate + detect one image, converting exceptions to InferenceFailure.
[[nodiscard]] BatchResult detect_one(vision::IFaceDetector& detector, const core::InputImage& image);

}  // namespace facelens::app

#ifdef FACELENS_HAS_TBB

namespace facelens::app {

/// Runs detection over a batch of still images in parallel using TBB.
///
/// Detectors are not thread-safe, so each TBB worker lazily creates its own through
/// \p factory and reuses it for every image it picks up. Results arrive in completion order
/// with the index of the image they belong to.
///
/// \param images Inputs; read only.
/// \param factory Builds a detector for a worker thread.
/// \param callback Invoked once per image. Must be thread-safe.
void run_offline_batch_tbb(const std::vector<core::InputImage>& images,
                           const DetectorFactory& factory,
                           const BatchResultCallback& callback);

}  // namespace facelens::app

#endif  // FACELENS_HAS_TBB
