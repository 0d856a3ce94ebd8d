#include <facelens/app/batch_runner.hpp>
#include <facelens/core/detection.hpp>
#include <facelens/core/input_image.hpp>
#include <facelens/vision/mock_face_detector.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace fa = facelens::app;
namespace fc = facelens::core;
namespace fv = facelens::vision;

namespace {

fc::InputImage gray_image(std::uint64_t sequence, std::size_t bytes = 64) {
  fc::ImageDescriptor d;
  d.width = 8;
  d.height = 8;
  d.format = fc::PixelFormat::Gray8;
  d.bytes_per_row = 8;
  d.sequence = sequence;
  return fc::InputImage(std::vector<std::byte>(bytes), d);
}

std::unique_ptr<fv::IFaceDetector> make_mock() {
  auto mock = std::make_unique<fv::MockFaceDetector>();
  fc::Detection d;
  d.bounding_box = {1.f, 1.f, 4.f, 4.f};
  mock->set_detections({d});
  return mock;
}

}  // namespace

TEST(BatchRunner, SequentialReportsEveryImage) {
  std::vector<fc::InputImage> images;
  images.push_back(gray_image(0));
  images.push_back(gray_image(1, 10));  // truncated
  images.push_back(gray_image(2));

  auto detector = make_mock();
  std::vector<fa::BatchResult> results(images.size(), std::unexpected(fc::PipelineError::None));
  fa::run_offline_batch(images, *detector,
                        [&](std::size_t i, const fa::BatchResult& r) { results[i] = r; });

  ASSERT_TRUE(results[0].has_value());
  EXPECT_EQ(results[0]->size(), 1u);
  ASSERT_FALSE(results[1].has_value());
  EXPECT_EQ(results[1].error(), fc::PipelineError::InvalidFrame);
  EXPECT_TRUE(results[2].has_value());
}

TEST(BatchRunner, DetectOneConvertsExceptions) {
  fv::MockFaceDetector mock;
  mock.throw_on_detect(true);
  auto result = fa::detect_one(mock, gray_image(0));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), fc::PipelineError::InferenceFailure);
}

#ifdef FACELENS_HAS_TBB

TEST(BatchRunnerTbb, RunsCallbackPerImage) {
  std::vector<fc::InputImage> images;
  for (std::uint64_t i = 0; i < 32; ++i) images.push_back(gray_image(i));

  std::atomic<int> factories{0};
  std::mutex mutex;
  std::vector<int> seen(images.size(), 0);
  fa::run_offline_batch_tbb(
      images,
      [&]() {
        ++factories;
        return make_mock();
      },
      [&](std::size_t i, const fa::BatchResult& r) {
        std::lock_guard lock(mutex);
        EXPECT_TRUE(r.has_value());
        ++seen[i];
      });

  for (int count : seen) EXPECT_EQ(count, 1);
  EXPECT_GE(factories.load(), 1);
}

TEST(BatchRunnerTbb, NullDetectorFailsImages) {
  std::vector<fc::InputImage> images;
  images.push_back(gray_image(0));
  std::vector<fa::BatchResult> results(1, std::unexpected(fc::PipelineError::None));
  fa::run_offline_batch_tbb(
      images, []() { return std::unique_ptr<fv::IFaceDetector>(); },
      [&](std::size_t i, const fa::BatchResult& r) { results[i] = r; });
  ASSERT_FALSE(results[0].has_value());
  EXPECT_EQ(results[0].error(), fc::PipelineError::ResourceUnavailable);
}

TEST(BatchRunnerTbb, EmptyInputNoCallback) {
  int calls = 0;
  fa::run_offline_batch_tbb({}, make_mock, [&](std::size_t, const fa::BatchResult&) { ++calls; });
  EXPECT_EQ(calls, 0);
}

#endif  // FACELENS_HAS_TBB
