#include <facelens/vision/image_convert.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

namespace facelens::vision {

namespace {

// Stride of the luma plane. NV21 chroma rows share it; I420 U and V rows use half of it.
std::optional<std::size_t> yuv420_step(const core::InputImage& image) {
  const auto& d = image.descriptor();
  const std::size_t rows = static_cast<std::size_t>(d.height) + d.height / 2;
  if (d.bytes_per_row >= d.width && image.size_bytes() >= rows * d.bytes_per_row) {
    return d.bytes_per_row;
  }
  if (image.size_bytes() >= rows * d.width) {
    return d.width;
  }
  return std::nullopt;
}

std::optional<std::size_t> packed_step(const core::InputImage& image, std::size_t pixel_bytes) {
  const auto& d = image.descriptor();
  const std::size_t tight = static_cast<std::size_t>(d.width) * pixel_bytes;
  const std::size_t step = d.bytes_per_row >= tight ? d.bytes_per_row : tight;
  if (image.size_bytes() < step * d.height) {
    return std::nullopt;
  }
  return step;
}

void* mutable_data(const core::InputImage& image) {
  // cv::Mat has no const-data constructor; the wrapping Mats below are only read.
  return const_cast<std::byte*>(image.data().data());
}

// Copies a padded I420 buffer (Y at step, U and V at step / 2) into the continuous
// (h + h/2) x w layout cvtColor expects.
cv::Mat pack_i420(const core::InputImage& image, std::size_t step) {
  const auto& d = image.descriptor();
  const std::size_t w = d.width;
  const std::size_t h = d.height;
  const std::size_t chroma_step = step / 2;
  const std::size_t chroma_width = w / 2;
  const std::size_t chroma_rows = h / 2;

  cv::Mat packed(static_cast<int>(h + chroma_rows), static_cast<int>(w), CV_8UC1);
  const auto* src = reinterpret_cast<const std::uint8_t*>(image.data().data());
  std::uint8_t* dst = packed.ptr<std::uint8_t>();

  for (std::size_t row = 0; row < h; ++row) {
    std::memcpy(dst + row * w, src + row * step, w);
  }
  dst += w * h;
  src += step * h;
  for (int plane = 0; plane < 2; ++plane) {
    for (std::size_t row = 0; row < chroma_rows; ++row) {
      std::memcpy(dst + row * chroma_width, src + row * chroma_step, chroma_width);
    }
    dst += chroma_width * chroma_rows;
    src += chroma_step * chroma_rows;
  }
  return packed;
}

}  // namespace

std::optional<cv::Mat> to_bgr(const core::InputImage& image) {
  const auto& d = image.descriptor();
  if (image.empty() || d.width == 0 || d.height == 0) return std::nullopt;
  const int w = static_cast<int>(d.width);
  const int h = static_cast<int>(d.height);

  cv::Mat bgr;
  switch (d.format) {
    case core::PixelFormat::Nv21: {
      auto step = yuv420_step(image);
      if (!step || d.width % 2 != 0 || d.height % 2 != 0) return std::nullopt;
      cv::Mat yuv(h + h / 2, w, CV_8UC1, mutable_data(image), *step);
      // cvtColor needs a continuous 4:2:0 buffer.
      cv::cvtColor(yuv.isContinuous() ? yuv : yuv.clone(), bgr, cv::COLOR_YUV2BGR_NV21);
      return bgr;
    }
    case core::PixelFormat::Yuv420: {
      auto step = yuv420_step(image);
      if (!step || d.width % 2 != 0 || d.height % 2 != 0 || *step % 2 != 0) return std::nullopt;
      if (*step == d.width) {
        cv::Mat yuv(h + h / 2, w, CV_8UC1, mutable_data(image));
        cv::cvtColor(yuv, bgr, cv::COLOR_YUV2BGR_I420);
      } else {
        cv::cvtColor(pack_i420(image, *step), bgr, cv::COLOR_YUV2BGR_I420);
      }
      return bgr;
    }
    case core::PixelFormat::Bgra8888: {
      auto step = packed_step(image, 4);
      if (!step) return std::nullopt;
      cv::Mat bgra(h, w, CV_8UC4, mutable_data(image), *step);
      cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR);
      return bgr;
    }
    case core::PixelFormat::Gray8: {
      auto step = packed_step(image, 1);
      if (!step) return std::nullopt;
      cv::Mat gray(h, w, CV_8UC1, mutable_data(image), *step);
      cv::cvtColor(gray, bgr, cv::COLOR_GRAY2BGR);
      return bgr;
    }
    case core::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

std::optional<cv::Mat> to_gray(const core::InputImage& image) {
  const auto& d = image.descriptor();
  if (image.empty() || d.width == 0 || d.height == 0) return std::nullopt;
  const int w = static_cast<int>(d.width);
  const int h = static_cast<int>(d.height);

  switch (d.format) {
    case core::PixelFormat::Nv21:
    case core::PixelFormat::Yuv420: {
      auto step = yuv420_step(image);
      if (!step) return std::nullopt;
      return cv::Mat(h, w, CV_8UC1, mutable_data(image), *step).clone();
    }
    case core::PixelFormat::Gray8: {
      auto step = packed_step(image, 1);
      if (!step) return std::nullopt;
      return cv::Mat(h, w, CV_8UC1, mutable_data(image), *step).clone();
    }
    case core::PixelFormat::Bgra8888: {
      auto step = packed_step(image, 4);
      if (!step) return std::nullopt;
      cv::Mat gray;
      cv::cvtColor(cv::Mat(h, w, CV_8UC4, mutable_data(image), *step), gray,
                   cv::COLOR_BGRA2GRAY);
      return gray;
    }
    case core::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

cv::Mat rotate_upright(const cv::Mat& image, core::ImageRotation rotation) {
  cv::Mat out;
  switch (rotation) {
    case core::ImageRotation::Rotation90:
      cv::rotate(image, out, cv::ROTATE_90_CLOCKWISE);
      return out;
    case core::ImageRotation::Rotation180:
      cv::rotate(image, out, cv::ROTATE_180);
      return out;
    case core::ImageRotation::Rotation270:
      cv::rotate(image, out, cv::ROTATE_90_COUNTERCLOCKWISE);
      return out;
    case core::ImageRotation::Rotation0:
    default:
      return image;
  }
}

core::CameraFrame bgr_to_nv21_frame(const cv::Mat& bgr, std::uint64_t sequence) {
  const int w = bgr.cols & ~1;
  const int h = bgr.rows & ~1;
  cv::Mat i420;
  cv::cvtColor(bgr(cv::Rect(0, 0, w, h)), i420, cv::COLOR_BGR2YUV_I420);

  const std::size_t y_size = static_cast<std::size_t>(w) * h;
  const std::size_t c_size = y_size / 4;
  const auto* src = reinterpret_cast<const std::byte*>(i420.ptr());

  core::Plane y_plane;
  y_plane.bytes.assign(src, src + y_size);
  y_plane.bytes_per_row = static_cast<std::uint32_t>(w);
  y_plane.bytes_per_pixel = 1;

  core::Plane vu_plane;
  vu_plane.bytes.resize(c_size * 2);
  const std::byte* u = src + y_size;
  const std::byte* v = u + c_size;
  for (std::size_t i = 0; i < c_size; ++i) {
    vu_plane.bytes[2 * i] = v[i];
    vu_plane.bytes[2 * i + 1] = u[i];
  }
  vu_plane.bytes_per_row = static_cast<std::uint32_t>(w);
  vu_plane.bytes_per_pixel = 2;

  std::vector<core::Plane> planes;
  planes.push_back(std::move(y_plane));
  planes.push_back(std::move(vu_plane));
  return core::CameraFrame(static_cast<std::uint32_t>(w), static_cast<std::uint32_t>(h),
                           core::PixelFormat::Nv21, std::move(planes), sequence);
}

core::CameraFrame bgr_to_bgra_frame(const cv::Mat& bgr, std::uint64_t sequence) {
  cv::Mat bgra;
  if (bgr.channels() == 1) {
    cv::cvtColor(bgr, bgra, cv::COLOR_GRAY2BGRA);
  } else {
    cv::cvtColor(bgr, bgra, cv::COLOR_BGR2BGRA);
  }
  const std::size_t len = bgra.total() * bgra.elemSize();
  core::Plane plane;
  plane.bytes.resize(len);
  std::memcpy(plane.bytes.data(), bgra.ptr(), len);
  plane.bytes_per_row = static_cast<std::uint32_t>(bgra.cols * 4);
  plane.bytes_per_pixel = 4;

  std::vector<core::Plane> planes;
  planes.push_back(std::move(plane));
  return core::CameraFrame(static_cast<std::uint32_t>(bgra.cols),
                           static_cast<std::uint32_t>(bgra.rows), core::PixelFormat::Bgra8888,
                           std::move(planes), sequence);
}

std::optional<core::InputImage> load_input_image(const std::string& path, std::uint64_t sequence) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_COLOR);
  if (mat.empty()) return std::nullopt;

  core::CameraFrame frame = bgr_to_bgra_frame(mat, sequence);
  const core::Plane& plane = frame.planes().front();
  core::ImageDescriptor descriptor;
  descriptor.width = frame.width();
  descriptor.height = frame.height();
  descriptor.format = core::PixelFormat::Bgra8888;
  descriptor.bytes_per_row = plane.bytes_per_row;
  descriptor.sequence = sequence;
  return core::InputImage(plane.bytes, descriptor);
}

}  // namespace facelens::vision
