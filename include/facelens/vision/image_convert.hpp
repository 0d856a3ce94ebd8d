#pragma once

#include <facelens/core/frame.hpp>
#include <facelens/core/input_image.hpp>
#include <opencv2/core/mat.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace facelens::vision {

/// Decode an assembled image (NV21, YUV420, BGRA8888, Gray8) to a BGR cv::Mat in sensor
/// orientation. Returns nullopt for unknown formats or buffers too small for the descriptor.
[[nodiscard]] std::optional<cv::Mat> to_bgr(const core::InputImage& image);

/// Luma / grayscale view of the image in sensor orientation (deep copy).
[[nodiscard]] std::optional<cv::Mat> to_gray(const core::InputImage& image);

/// Rotate clockwise by rotation so the image is upright.
[[nodiscard]] cv::Mat rotate_upright(const cv::Mat& image, core::ImageRotation rotation);

/// Pack a BGR image as an NV21 camera frame (two planes: Y, interleaved VU).
/// Width and height must be even; odd sizes are cropped by one pixel.
[[nodiscard]] core::CameraFrame bgr_to_nv21_frame(const cv::Mat& bgr, std::uint64_t sequence);

/// Pack a BGR image as a single-plane BGRA8888 camera frame.
[[nodiscard]] core::CameraFrame bgr_to_bgra_frame(const cv::Mat& bgr, std::uint64_t sequence);

/// Load an image file as a BGRA8888 InputImage with rotation 0. nullopt on failure.
[[nodiscard]] std::optional<core::InputImage> load_input_image(const std::string& path,
                                                               std::uint64_t sequence = 0);

}  // namespace facelens::vision
