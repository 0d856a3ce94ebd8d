#include <facelens/app/batch_runner.hpp>

#ifdef FACELENS_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/enumerable_thread_specific.h>
#include <tbb/parallel_for.h>

namespace facelens::app {

void run_offline_batch_tbb(const std::vector<core::InputImage>& images,
                           const DetectorFactory& factory,
                           const BatchResultCallback& callback) {
  if (images.empty() || !callback || !factory) return;

  tbb::enumerable_thread_specific<std::unique_ptr<vision::IFaceDetector>> detectors(
      [&factory]() { return factory(); });

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, images.size()),
      [&images, &detectors, &callback](const tbb::blocked_range<std::size_t>& range) {
        std::unique_ptr<vision::IFaceDetector>& detector = detectors.local();
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          if (!detector) {
            callback(i, std::unexpected(core::PipelineError::ResourceUnavailable));
            continue;
          }
          callback(i, detect_one(*detector, images[i]));
        }
      });

  for (auto& detector : detectors) {
    if (detector) detector->close();
  }
}

}  // namespace facelens::app

#endif  // FACELENS_HAS_TBB
