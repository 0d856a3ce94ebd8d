#include <facelens/core/detection_set.hpp>
#include <facelens/core/pipeline_state.hpp>
#include <facelens/pipeline/detection_publisher.hpp>
#include <facelens/render/draw_list_surface.hpp>
#include <facelens/render/overlay_renderer.hpp>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

namespace fc = facelens::core;
namespace fp = facelens::pipeline;
namespace fr = facelens::render;

namespace {

const fc::SensorDescriptor kBack{0, "back", fc::LensDirection::Back, 90};

fc::Detection face(fc::Rect box, std::optional<std::int32_t> id) {
  fc::Detection d;
  d.bounding_box = box;
  d.tracking_id = id;
  return d;
}

fc::DetectionSet scenario_set(std::uint64_t epoch = 0) {
  fc::DetectionSet set;
  set.image_size = {1280.f, 720.f};
  set.lens_direction = fc::LensDirection::Back;
  set.sensor_epoch = epoch;
  set.detections = {face({100.f, 50.f, 300.f, 250.f}, 7), face({400.f, 100.f, 500.f, 200.f}, {})};
  return set;
}

std::vector<fr::RectCommand> rects(const fr::DrawListSurface& surface) {
  std::vector<fr::RectCommand> out;
  for (const auto& c : surface.commands()) {
    if (auto r = std::get_if<fr::RectCommand>(&c)) out.push_back(*r);
  }
  return out;
}

std::vector<fr::TextCommand> texts(const fr::DrawListSurface& surface) {
  std::vector<fr::TextCommand> out;
  for (const auto& c : surface.commands()) {
    if (auto t = std::get_if<fr::TextCommand>(&c)) out.push_back(*t);
  }
  return out;
}

fr::OverlayStyle no_badge() {
  fr::OverlayStyle style;
  style.show_face_count = false;
  return style;
}

}  // namespace

TEST(OverlayRenderer, DrawsOneRectPerDetection) {
  fr::DrawListSurface surface({720.f, 1280.f});
  fr::OverlayRenderer renderer(no_badge());
  ASSERT_TRUE(renderer.render(surface, scenario_set()).has_value());

  auto drawn = rects(surface);
  ASSERT_EQ(drawn.size(), 2u);
  EXPECT_EQ(drawn[0].rect, (fc::Rect{50.f, 100.f, 250.f, 300.f}));
  EXPECT_EQ(drawn[0].style, renderer.style().box);
}

TEST(OverlayRenderer, LabelsTrackedFacesAboveBox) {
  fr::DrawListSurface surface({720.f, 1280.f});
  fr::OverlayRenderer renderer(no_badge());
  ASSERT_TRUE(renderer.render(surface, scenario_set()).has_value());

  auto labels = texts(surface);
  ASSERT_EQ(labels.size(), 1u);  // the second face has no tracking id
  EXPECT_EQ(labels[0].text, "ID: 7");
  EXPECT_FLOAT_EQ(labels[0].origin.x, 50.f);
  EXPECT_FLOAT_EQ(labels[0].origin.y, 100.f - 20.f);
}

TEST(OverlayRenderer, RenderingTwiceIsIdempotent) {
  fr::DrawListSurface surface({720.f, 1280.f});
  fr::OverlayRenderer renderer;
  const auto set = scenario_set();
  ASSERT_TRUE(renderer.render(surface, set).has_value());
  const auto first = surface.commands();
  ASSERT_TRUE(renderer.render(surface, set).has_value());
  EXPECT_EQ(surface.commands(), first);
  EXPECT_EQ(surface.clear_count(), 2u);
}

TEST(OverlayRenderer, FaceCountBadge) {
  fr::DrawListSurface surface({720.f, 1280.f});
  fr::OverlayRenderer renderer;
  ASSERT_TRUE(renderer.render(surface, scenario_set()).has_value());
  auto labels = texts(surface);
  ASSERT_FALSE(labels.empty());
  EXPECT_EQ(labels.back().text, "Faces detected: 2");
  EXPECT_LT(labels.back().origin.y, 1280.f - 20.f);
}

TEST(OverlayRenderer, EmptySetClearsOverlay) {
  fr::DrawListSurface surface({720.f, 1280.f});
  fr::OverlayRenderer renderer(no_badge());
  ASSERT_TRUE(renderer.render(surface, scenario_set()).has_value());
  ASSERT_TRUE(renderer.render(surface, fc::DetectionSet{}).has_value());
  EXPECT_TRUE(surface.commands().empty());
}

TEST(OverlayRenderer, DegenerateSetKeepsPreviousOverlay) {
  fr::DrawListSurface surface({720.f, 1280.f});
  fr::OverlayRenderer renderer;
  ASSERT_TRUE(renderer.render(surface, scenario_set()).has_value());
  const auto before = surface.commands();

  auto bad = scenario_set();
  bad.image_size = {0.f, 720.f};
  auto result = renderer.render(surface, bad);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), fc::PipelineError::DegenerateGeometry);
  EXPECT_EQ(surface.commands(), before);
  EXPECT_EQ(surface.clear_count(), 1u);
}

TEST(OverlayRenderer, RedrawsOnlyOnTrigger) {
  fc::PipelineState state;
  state.reset(kBack, fc::ImageRotation::Rotation90);
  fp::DetectionPublisher publisher(state);
  fr::DrawListSurface surface({720.f, 1280.f});
  fr::OverlayRenderer renderer;

  EXPECT_TRUE(renderer.render_if_needed(surface, publisher));  // first draw
  EXPECT_FALSE(renderer.render_if_needed(surface, publisher));

  ASSERT_TRUE(publisher.publish(scenario_set(state.epoch())));
  EXPECT_TRUE(renderer.render_if_needed(surface, publisher));  // new set
  EXPECT_FALSE(renderer.render_if_needed(surface, publisher));

  surface.resize({1080.f, 1920.f});
  EXPECT_TRUE(renderer.render_if_needed(surface, publisher));  // resize
  EXPECT_FALSE(renderer.render_if_needed(surface, publisher));

  state.reset(kBack, fc::ImageRotation::Rotation90);
  publisher.clear();
  EXPECT_TRUE(renderer.render_if_needed(surface, publisher));  // sensor change
  EXPECT_EQ(rects(surface).size(), 0u);

  renderer.invalidate();
  EXPECT_TRUE(renderer.render_if_needed(surface, publisher));
  EXPECT_EQ(renderer.render_count(), 5u);
}

TEST(OverlayRenderer, RefusesOtherThreads) {
  fr::DrawListSurface surface({720.f, 1280.f});
  fr::OverlayRenderer renderer;
  bool threw = false;
  std::thread worker([&]() {
    try {
      (void)renderer.render(surface, scenario_set());
    } catch (const std::logic_error&) {
      threw = true;
    }
  });
  worker.join();
  EXPECT_TRUE(threw);
  EXPECT_TRUE(surface.commands().empty());
  EXPECT_TRUE(renderer.on_owner_thread());
}

TEST(TrackingLabel, Format) {
  EXPECT_EQ(fr::tracking_label(0), "ID: 0");
  EXPECT_EQ(fr::tracking_label(123), "ID: 123");
}
