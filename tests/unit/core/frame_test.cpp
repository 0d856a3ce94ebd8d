#include <facelens/core/frame.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace fc = facelens::core;

namespace {

fc::Plane make_plane(std::size_t bytes, std::uint32_t stride) {
  return fc::Plane{std::vector<std::byte>(bytes, std::byte{0}), stride, std::nullopt};
}

}  // namespace

TEST(CameraFrame, DefaultEmpty) {
  fc::CameraFrame f;
  EXPECT_EQ(f.width(), 0u);
  EXPECT_EQ(f.height(), 0u);
  EXPECT_EQ(f.format(), fc::PixelFormat::Unknown);
  EXPECT_EQ(f.plane_count(), 0u);
  EXPECT_EQ(f.total_bytes(), 0u);
}

TEST(CameraFrame, ConstructFromPlanes) {
  std::vector<fc::Plane> planes;
  planes.push_back(make_plane(8 * 4, 8));
  planes.push_back(make_plane(8 * 2, 8));
  fc::CameraFrame f(8, 4, fc::PixelFormat::Nv21, std::move(planes), 42);
  EXPECT_EQ(f.width(), 8u);
  EXPECT_EQ(f.height(), 4u);
  EXPECT_EQ(f.format(), fc::PixelFormat::Nv21);
  EXPECT_EQ(f.sequence(), 42u);
  ASSERT_EQ(f.plane_count(), 2u);
  EXPECT_EQ(f.planes()[0].bytes_per_row, 8u);
  EXPECT_EQ(f.total_bytes(), 48u);
}

TEST(CameraFrame, MoveTransfersPlanes) {
  std::vector<fc::Plane> planes;
  planes.push_back(make_plane(16, 4));
  fc::CameraFrame a(4, 4, fc::PixelFormat::Gray8, std::move(planes));
  fc::CameraFrame b(std::move(a));
  EXPECT_EQ(b.total_bytes(), 16u);
  EXPECT_EQ(b.plane_count(), 1u);
}

TEST(CameraFrame, ExpectedPlanes) {
  EXPECT_EQ(fc::CameraFrame::expected_planes(fc::PixelFormat::Nv21), 2u);
  EXPECT_EQ(fc::CameraFrame::expected_planes(fc::PixelFormat::Yuv420), 3u);
  EXPECT_EQ(fc::CameraFrame::expected_planes(fc::PixelFormat::Bgra8888), 1u);
  EXPECT_EQ(fc::CameraFrame::expected_planes(fc::PixelFormat::Gray8), 1u);
  EXPECT_EQ(fc::CameraFrame::expected_planes(fc::PixelFormat::Unknown), 0u);
}

TEST(CameraFrame, MinBytes) {
  EXPECT_EQ(fc::CameraFrame::min_bytes(10, 10, fc::PixelFormat::Gray8), 100u);
  EXPECT_EQ(fc::CameraFrame::min_bytes(10, 10, fc::PixelFormat::Nv21), 150u);
  EXPECT_EQ(fc::CameraFrame::min_bytes(10, 10, fc::PixelFormat::Yuv420), 150u);
  EXPECT_EQ(fc::CameraFrame::min_bytes(10, 10, fc::PixelFormat::Bgra8888), 400u);
  EXPECT_EQ(fc::CameraFrame::min_bytes(10, 10, fc::PixelFormat::Unknown), 0u);
}

TEST(ImageRotation, FromDegrees) {
  EXPECT_EQ(fc::rotation_from_degrees(0), fc::ImageRotation::Rotation0);
  EXPECT_EQ(fc::rotation_from_degrees(90), fc::ImageRotation::Rotation90);
  EXPECT_EQ(fc::rotation_from_degrees(270), fc::ImageRotation::Rotation270);
  EXPECT_EQ(fc::rotation_from_degrees(360), fc::ImageRotation::Rotation0);
  EXPECT_EQ(fc::rotation_from_degrees(450), fc::ImageRotation::Rotation90);
  EXPECT_EQ(fc::rotation_from_degrees(-90), fc::ImageRotation::Rotation270);
  EXPECT_FALSE(fc::rotation_from_degrees(45).has_value());
}

TEST(ImageRotation, SwapsAxes) {
  EXPECT_FALSE(fc::swaps_axes(fc::ImageRotation::Rotation0));
  EXPECT_TRUE(fc::swaps_axes(fc::ImageRotation::Rotation90));
  EXPECT_FALSE(fc::swaps_axes(fc::ImageRotation::Rotation180));
  EXPECT_TRUE(fc::swaps_axes(fc::ImageRotation::Rotation270));
  EXPECT_EQ(fc::degrees(fc::ImageRotation::Rotation180), 180);
}
