// End-to-end: synthetic camera -> back-pressure -> detection -> publish -> overlay on this thread.
#include <facelens/app/face_camera_session.hpp>
#include <facelens/app/synthetic_camera_source.hpp>
#include <facelens/core/detection.hpp>
#include <facelens/render/draw_list_surface.hpp>
#include <facelens/render/mat_render_surface.hpp>
#include <facelens/render/overlay_renderer.hpp>
#include <facelens/vision/mock_face_detector.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <thread>
#include <variant>

namespace fa = facelens::app;
namespace fc = facelens::core;
namespace fr = facelens::render;
namespace fv = facelens::vision;

namespace {

constexpr std::uint32_t kWidth = 160;
constexpr std::uint32_t kHeight = 120;

struct LiveRig {
  LiveRig() {
    fa::SyntheticCameraOptions options;
    options.sensors = fa::default_phone_sensors();
    options.width = kWidth;
    options.height = kHeight;
    options.frame_rate = 120;
    auto camera = std::make_unique<fa::SyntheticCameraSource>(options);

    auto mock = std::make_unique<fv::MockFaceDetector>();
    mock_ = mock.get();
    fc::Detection face;
    face.bounding_box = {40.f, 30.f, 100.f, 90.f};
    face.tracking_id = 3;
    mock_->set_detections({face});
    mock_->set_latency(std::chrono::milliseconds(25));

    session = std::make_unique<fa::FaceCameraSession>(std::move(camera), std::move(mock));
  }

  /// Renders on the calling thread for duration; returns the number of redraws.
  int pump(fr::OverlayRenderer& renderer, fr::IRenderSurface& surface,
           std::chrono::milliseconds duration) {
    int redraws = 0;
    const auto end = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < end) {
      if (renderer.render_if_needed(surface, session->publisher())) ++redraws;
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return redraws;
  }

  fv::MockFaceDetector* mock_{nullptr};
  std::unique_ptr<fa::FaceCameraSession> session;
};

}  // namespace

TEST(LivePipeline, DropsFramesAndRendersLatestSet) {
  LiveRig rig;
  ASSERT_TRUE(rig.session->initialize().has_value());

  fr::DrawListSurface surface({kHeight * 3.f, kWidth * 3.f});
  fr::OverlayRenderer renderer;
  const int redraws = rig.pump(renderer, surface, std::chrono::milliseconds(400));

  const auto stats = rig.session->stats();
  EXPECT_EQ(rig.mock_->peak_concurrency(), 1);
  EXPECT_GT(stats.frames_processed, 0u);
  EXPECT_GT(stats.frames_dropped, 0u);
  EXPECT_EQ(stats.inference_failures, 0u);
  EXPECT_GT(redraws, 1);
  EXPECT_LE(static_cast<std::uint64_t>(redraws), stats.frames_processed + 1);

  // Front sensor: scale 3 on both axes, mirrored about the surface centre.
  bool found = false;
  for (const auto& command : surface.commands()) {
    if (const auto* rect = std::get_if<fr::RectCommand>(&command)) {
      EXPECT_FLOAT_EQ(rect->rect.left, kHeight * 3.f - 30.f * 3.f);
      EXPECT_FLOAT_EQ(rect->rect.top, 40.f * 3.f);
      found = true;
    }
  }
  EXPECT_TRUE(found);
}

TEST(LivePipeline, SensorSwitchMidStream) {
  LiveRig rig;
  ASSERT_TRUE(rig.session->initialize().has_value());
  fr::MatRenderSurface surface(static_cast<int>(kHeight), static_cast<int>(kWidth));
  fr::OverlayRenderer renderer;
  rig.pump(renderer, surface, std::chrono::milliseconds(150));

  ASSERT_TRUE(rig.session->toggle_camera().has_value());
  EXPECT_EQ(rig.session->face_count(), 0u);
  EXPECT_TRUE(renderer.render_if_needed(surface, rig.session->publisher()));

  rig.pump(renderer, surface, std::chrono::milliseconds(150));
  auto published = rig.session->publisher().current();
  EXPECT_EQ(published->set.lens_direction, fc::LensDirection::Back);
  EXPECT_EQ(published->set.rotation, fc::ImageRotation::Rotation90);
  EXPECT_EQ(published->set.sensor_epoch, rig.session->state().epoch());
  EXPECT_EQ(rig.mock_->peak_concurrency(), 1);

  rig.session->shutdown();
  EXPECT_TRUE(rig.mock_->closed());
}
