#include <facelens/core/frame.hpp>
#include <facelens/core/sensor.hpp>
#include <facelens/pipeline/frame_assembler.hpp>
#include <gtest/gtest.h>
#include <cstdint>
#include <vector>

namespace fc = facelens::core;
namespace fp = facelens::pipeline;

namespace {

fc::Plane filled_plane(std::size_t bytes, std::uint8_t value, std::uint32_t stride) {
  return fc::Plane{std::vector<std::byte>(bytes, std::byte{value}), stride, std::nullopt};
}

}  // namespace

TEST(AssembleFrame, ConcatenatesPlanesInOrder) {
  std::vector<fc::Plane> planes;
  planes.push_back(filled_plane(8 * 4, 1, 8));  // Y
  planes.push_back(filled_plane(8 * 2, 2, 8));  // VU
  fc::CameraFrame frame(8, 4, fc::PixelFormat::Nv21, std::move(planes), 7);

  auto image = fp::assemble_frame(frame, fc::ImageRotation::Rotation90);
  ASSERT_TRUE(image.has_value());
  ASSERT_EQ(image->size_bytes(), 48u);
  auto data = image->data();
  EXPECT_EQ(data[0], std::byte{1});
  EXPECT_EQ(data[31], std::byte{1});
  EXPECT_EQ(data[32], std::byte{2});
  EXPECT_EQ(data[47], std::byte{2});

  const auto& d = image->descriptor();
  EXPECT_EQ(d.width, 8u);
  EXPECT_EQ(d.height, 4u);
  EXPECT_EQ(d.format, fc::PixelFormat::Nv21);
  EXPECT_EQ(d.rotation, fc::ImageRotation::Rotation90);
  EXPECT_EQ(d.bytes_per_row, 8u);
  EXPECT_EQ(d.sequence, 7u);
}

TEST(AssembleFrame, KeepsRowPaddingAndUsesPrimaryStride) {
  // 12-pixel rows padded to a 16-byte stride; chroma planes use their own stride.
  std::vector<fc::Plane> planes;
  planes.push_back(filled_plane(16 * 4, 1, 16));
  planes.push_back(filled_plane(8 * 2, 2, 8));
  planes.push_back(filled_plane(8 * 2, 3, 8));
  fc::CameraFrame frame(12, 4, fc::PixelFormat::Yuv420, std::move(planes));

  auto image = fp::assemble_frame(frame, fc::ImageRotation::Rotation0);
  ASSERT_TRUE(image.has_value());
  EXPECT_EQ(image->size_bytes(), 64u + 16u + 16u);
  EXPECT_EQ(image->descriptor().bytes_per_row, 16u);
  EXPECT_EQ(image->data()[64 + 16], std::byte{3});
}

TEST(AssembleFrame, ZeroPlanesIsInvalid) {
  fc::CameraFrame frame(8, 4, fc::PixelFormat::Nv21, {});
  auto image = fp::assemble_frame(frame, fc::ImageRotation::Rotation0);
  ASSERT_FALSE(image.has_value());
  EXPECT_EQ(image.error(), fc::PipelineError::InvalidFrame);
}

TEST(AssembleFrame, ZeroDimensionIsInvalid) {
  std::vector<fc::Plane> planes;
  planes.push_back(filled_plane(16, 0, 4));
  fc::CameraFrame frame(0, 4, fc::PixelFormat::Gray8, std::move(planes));
  auto image = fp::assemble_frame(frame, fc::ImageRotation::Rotation0);
  ASSERT_FALSE(image.has_value());
  EXPECT_EQ(image.error(), fc::PipelineError::InvalidFrame);
}

TEST(EffectiveRotation, AndroidBackUsesSensorOrientation) {
  fc::SensorDescriptor back{0, "back", fc::LensDirection::Back, 90};
  EXPECT_EQ(fp::effective_rotation(back, {}), fc::ImageRotation::Rotation90);
}

TEST(EffectiveRotation, AndroidFrontAddsNinetyWhenCompensating) {
  fc::SensorDescriptor front{1, "front", fc::LensDirection::Front, 270};
  EXPECT_EQ(fp::effective_rotation(front, {fc::Platform::Android, true}),
            fc::ImageRotation::Rotation0);
  EXPECT_EQ(fp::effective_rotation(front, {fc::Platform::Android, false}),
            fc::ImageRotation::Rotation270);
}

TEST(EffectiveRotation, IosUsesSensorOrientation) {
  fc::SensorDescriptor front{1, "front", fc::LensDirection::Front, 270};
  EXPECT_EQ(fp::effective_rotation(front, {fc::Platform::Ios, true}),
            fc::ImageRotation::Rotation270);
}

TEST(EffectiveRotation, DesktopIsZero) {
  fc::SensorDescriptor cam{0, "usb", fc::LensDirection::External, 90};
  EXPECT_EQ(fp::effective_rotation(cam, {fc::Platform::Desktop, true}),
            fc::ImageRotation::Rotation0);
}

TEST(EffectiveRotation, OddOrientationFallsBackToZero) {
  fc::SensorDescriptor cam{0, "odd", fc::LensDirection::Back, 45};
  EXPECT_EQ(fp::effective_rotation(cam, {}), fc::ImageRotation::Rotation0);
}
