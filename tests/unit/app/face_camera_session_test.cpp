#include <facelens/app/face_camera_session.hpp>
#include <facelens/app/synthetic_camera_source.hpp>
#include <facelens/core/detection.hpp>
#include <facelens/vision/mock_face_detector.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace fa = facelens::app;
namespace fc = facelens::core;
namespace fv = facelens::vision;

namespace {

bool wait_until(const std::function<bool()>& done,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!done()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return true;
}

fc::Detection face() {
  fc::Detection d;
  d.bounding_box = {10.f, 10.f, 30.f, 30.f};
  d.tracking_id = 1;
  return d;
}

class ThrowingCloseDetector : public fv::MockFaceDetector {
 public:
  void close() override {
    fv::MockFaceDetector::close();
    throw std::runtime_error("close failed");
  }
};

/// Session over a manually driven synthetic camera (frame_rate 0) and a mock detector.
class FaceCameraSessionTest : public ::testing::Test {
 protected:
  void build(std::vector<fc::SensorDescriptor> sensors) {
    fa::SyntheticCameraOptions options;
    options.sensors = std::move(sensors);
    options.width = 64;
    options.height = 48;
    options.frame_rate = 0;
    auto camera = std::make_unique<fa::SyntheticCameraSource>(options);
    camera_ = camera.get();
    auto mock = std::make_unique<fv::MockFaceDetector>();
    mock_ = mock.get();
    mock_->set_detections({face()});
    session_ = std::make_unique<fa::FaceCameraSession>(std::move(camera), std::move(mock));
  }

  bool deliver() { return camera_->deliver(camera_->generate_frame()); }

  fa::SyntheticCameraSource* camera_{nullptr};
  fv::MockFaceDetector* mock_{nullptr};
  std::unique_ptr<fa::FaceCameraSession> session_;
};

}  // namespace

TEST_F(FaceCameraSessionTest, InitializePrefersFrontSensor) {
  build(fa::default_phone_sensors());
  ASSERT_TRUE(session_->initialize().has_value());
  ASSERT_EQ(session_->selected_index(), 1u);
  auto ctx = session_->state().context();
  ASSERT_TRUE(ctx.sensor.has_value());
  EXPECT_EQ(ctx.sensor->lens_direction, fc::LensDirection::Front);
  EXPECT_EQ(ctx.rotation, fc::ImageRotation::Rotation0);  // 270 + 90
  EXPECT_TRUE(session_->active());
  EXPECT_EQ(camera_->start_count(), 1u);
}

TEST_F(FaceCameraSessionTest, InitializeFallsBackToFirstSensor) {
  build({fc::SensorDescriptor{0, "back", fc::LensDirection::Back, 90},
         fc::SensorDescriptor{1, "usb", fc::LensDirection::External, 0}});
  ASSERT_TRUE(session_->initialize().has_value());
  EXPECT_EQ(session_->selected_index(), 0u);
  EXPECT_EQ(session_->state().context().rotation, fc::ImageRotation::Rotation90);
}

TEST_F(FaceCameraSessionTest, NoSensorsIsResourceUnavailable) {
  build({});
  auto result = session_->initialize();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), fc::PipelineError::ResourceUnavailable);
  EXPECT_FALSE(session_->active());
}

TEST_F(FaceCameraSessionTest, CameraStartFailureIsResourceUnavailable) {
  build(fa::default_phone_sensors());
  camera_->fail_next_start(true);
  auto result = session_->initialize();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), fc::PipelineError::ResourceUnavailable);
  EXPECT_FALSE(session_->active());
  EXPECT_FALSE(session_->selected_index().has_value());
}

TEST_F(FaceCameraSessionTest, DeliveredFrameIsDetectedAndPublished) {
  build(fa::default_phone_sensors());
  std::atomic<int> previews{0};
  session_->set_preview_callback([&](const fc::CameraFrame&) { ++previews; });
  ASSERT_TRUE(session_->initialize().has_value());

  ASSERT_TRUE(deliver());
  ASSERT_TRUE(wait_until([&]() { return session_->face_count() == 1u; }));
  EXPECT_EQ(previews.load(), 1);

  auto published = session_->publisher().current();
  EXPECT_EQ(published->set.lens_direction, fc::LensDirection::Front);
  EXPECT_EQ(published->set.image_size, (fc::Size{64.f, 48.f}));
  EXPECT_EQ(published->set.sensor_epoch, session_->state().epoch());
  EXPECT_EQ(session_->stats().frames_processed, 1u);
}

TEST_F(FaceCameraSessionTest, ToggleResetsStateAndClearsSet) {
  build(fa::default_phone_sensors());
  ASSERT_TRUE(session_->initialize().has_value());
  ASSERT_TRUE(deliver());
  ASSERT_TRUE(wait_until([&]() { return session_->face_count() == 1u; }));
  const auto epoch_before = session_->state().epoch();

  ASSERT_TRUE(session_->toggle_camera().has_value());
  EXPECT_EQ(session_->selected_index(), 0u);
  EXPECT_EQ(session_->state().epoch(), epoch_before + 1);
  EXPECT_FALSE(session_->state().in_flight());
  EXPECT_EQ(session_->face_count(), 0u);
  auto ctx = session_->state().context();
  EXPECT_EQ(ctx.sensor->lens_direction, fc::LensDirection::Back);
  EXPECT_EQ(ctx.rotation, fc::ImageRotation::Rotation90);
  EXPECT_EQ(camera_->start_count(), 2u);

  ASSERT_TRUE(deliver());
  ASSERT_TRUE(wait_until([&]() { return session_->face_count() == 1u; }));
  EXPECT_EQ(session_->publisher().current()->set.lens_direction, fc::LensDirection::Back);
}

TEST_F(FaceCameraSessionTest, SwitchDuringInferenceDoesNotLeakOldResult) {
  build(fa::default_phone_sensors());
  ASSERT_TRUE(session_->initialize().has_value());
  mock_->set_latency(std::chrono::milliseconds(80));
  ASSERT_TRUE(deliver());
  ASSERT_TRUE(wait_until([&]() { return mock_->calls() == 1u; }));

  ASSERT_TRUE(session_->toggle_camera().has_value());
  auto published = session_->publisher().current();
  EXPECT_TRUE(published->set.detections.empty());
  EXPECT_EQ(published->set.sensor_epoch, session_->state().epoch());
  EXPECT_EQ(mock_->peak_concurrency(), 1);
}

TEST_F(FaceCameraSessionTest, SwitchResetsDetectorTracking) {
  build(fa::default_phone_sensors());
  ASSERT_TRUE(session_->initialize().has_value());
  const auto resets = mock_->tracking_resets();
  ASSERT_TRUE(session_->toggle_camera().has_value());
  EXPECT_EQ(mock_->tracking_resets(), resets + 1);
}

TEST_F(FaceCameraSessionTest, ConcurrentToggleAndSwitchStayConsistent) {
  build(fa::default_phone_sensors());
  ASSERT_TRUE(session_->initialize().has_value());
  const auto epoch_before = session_->state().epoch();

  std::thread toggler([&]() {
    for (int i = 0; i < 100; ++i) {
      EXPECT_TRUE(session_->toggle_camera().has_value());
    }
  });
  std::thread switcher([&]() {
    for (std::size_t i = 0; i < 100; ++i) {
      EXPECT_TRUE(session_->switch_to(i % 2).has_value());
    }
  });
  toggler.join();
  switcher.join();

  EXPECT_EQ(session_->state().epoch(), epoch_before + 200);
  EXPECT_EQ(camera_->start_count(), 201u);
  const auto selected = session_->selected_index();
  ASSERT_TRUE(selected.has_value());
  EXPECT_EQ(session_->state().context().sensor->index, session_->sensors()[*selected].index);
  EXPECT_TRUE(session_->active());
}

TEST_F(FaceCameraSessionTest, ToggleWithSingleSensorIsNoOp) {
  build({fc::SensorDescriptor{0, "back", fc::LensDirection::Back, 90}});
  ASSERT_TRUE(session_->initialize().has_value());
  const auto epoch = session_->state().epoch();
  ASSERT_TRUE(session_->toggle_camera().has_value());
  EXPECT_EQ(session_->state().epoch(), epoch);
  EXPECT_EQ(camera_->start_count(), 1u);
}

TEST_F(FaceCameraSessionTest, SwitchToOutOfRange) {
  build(fa::default_phone_sensors());
  ASSERT_TRUE(session_->initialize().has_value());
  auto result = session_->switch_to(5);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), fc::PipelineError::InvalidConfig);
  EXPECT_EQ(session_->selected_index(), 1u);
}

TEST_F(FaceCameraSessionTest, ShutdownReleasesEverything) {
  build(fa::default_phone_sensors());
  ASSERT_TRUE(session_->initialize().has_value());
  session_->shutdown();
  EXPECT_FALSE(session_->active());
  EXPECT_TRUE(mock_->closed());
  EXPECT_FALSE(session_->state().context().sensor.has_value());
  EXPECT_FALSE(deliver());

  session_->shutdown();
  auto again = session_->initialize();
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), fc::PipelineError::ResourceUnavailable);
}

TEST_F(FaceCameraSessionTest, DestructorShutsDown) {
  build(fa::default_phone_sensors());
  ASSERT_TRUE(session_->initialize().has_value());
  mock_->set_latency(std::chrono::milliseconds(30));
  ASSERT_TRUE(deliver());
  EXPECT_NO_THROW(session_.reset());
}

TEST(FaceCameraSessionTeardown, ThrowingDetectorCloseStillCompletesShutdown) {
  fa::SyntheticCameraOptions options;
  options.sensors = fa::default_phone_sensors();
  options.frame_rate = 0;
  auto camera = std::make_unique<fa::SyntheticCameraSource>(options);
  auto* camera_ptr = camera.get();
  auto detector = std::make_unique<ThrowingCloseDetector>();
  auto* detector_ptr = detector.get();
  fa::FaceCameraSession session(std::move(camera), std::move(detector));
  ASSERT_TRUE(session.initialize().has_value());

  EXPECT_NO_THROW(session.shutdown());
  EXPECT_TRUE(detector_ptr->closed());
  EXPECT_FALSE(camera_ptr->running());
  EXPECT_FALSE(session.state().context().sensor.has_value());
}
