#include <facelens/vision/onnx_face_detector.hpp>
#include <facelens/core/logger.hpp>
#include <facelens/core/orientation.hpp>
#include <facelens/vision/face_decoder.hpp>
#include <facelens/vision/face_tracker.hpp>
#include <facelens/vision/image_convert.hpp>
#include <onnxruntime_cxx_api.h>
#include <opencv2/imgproc.hpp>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace facelens::vision {

namespace {

constexpr int64_t kNumChannels = 3;
constexpr float kPixelMean = 127.f;
constexpr float kPixelScale = 1.f / 128.f;
constexpr float kNmsIouThreshold = 0.3f;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// Copy an HWC float image to NCHW (batch 1).
void HwcToNchw(const cv::Mat& hwc, float* nchw) {
  const int h = hwc.rows;
  const int w = hwc.cols;
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (int y = 0; y < h; ++y) {
    const float* row = hwc.ptr<float>(y);
    for (int x = 0; x < w; ++x) {
      const std::size_t dst = static_cast<std::size_t>(y) * w + x;
      nchw[0 * hw + dst] = row[x * kNumChannels + 0];
      nchw[1 * hw + dst] = row[x * kNumChannels + 1];
      nchw[2 * hw + dst] = row[x * kNumChannels + 2];
    }
  }
}

}  // namespace

struct OnnxFaceDetector::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "facelens"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::array<std::string, 2> output_names;  // scores, boxes
  std::array<const char*, 2> output_name_ptrs{};

  int input_height{0};
  int input_width{0};

  core::DetectorOptions options;
  FaceDecoder decoder;
  FaceTracker tracker;
  std::vector<float> nchw_buffer;
  bool closed{false};

  explicit Impl(core::DetectorOptions opts)
      : options(opts), decoder(opts.confidence_threshold, kNmsIouThreshold) {
    session_options.SetIntraOpNumThreads(
        opts.performance_mode == core::PerformanceMode::Fast ? 1 : 2);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxFaceDetector::OnnxFaceDetector(const std::string& model_path, core::DetectorOptions options)
    : impl_(std::make_unique<Impl>(options)) {
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxFaceDetector: model has no inputs");
  }
  impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();

  const std::vector<int64_t> dims =
      impl_->session.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
  if (dims.size() != 4u || dims[1] != kNumChannels || dims[2] <= 0 || dims[3] <= 0) {
    throw std::runtime_error("OnnxFaceDetector: expected input shape [1,3,H,W]");
  }
  impl_->input_height = static_cast<int>(dims[2]);
  impl_->input_width = static_cast<int>(dims[3]);

  const std::size_t num_outputs = impl_->session.GetOutputCount();
  if (num_outputs < 2u) {
    throw std::runtime_error("OnnxFaceDetector: model must have scores and boxes outputs");
  }
  std::vector<std::string> names;
  for (std::size_t i = 0; i < num_outputs; ++i) {
    names.emplace_back(impl_->session.GetOutputNameAllocated(i, allocator).get());
  }
  impl_->output_names = {names[0], names[1]};
  for (const auto& n : names) {
    if (n == "scores") impl_->output_names[0] = n;
    if (n == "boxes") impl_->output_names[1] = n;
  }
  impl_->output_name_ptrs = {impl_->output_names[0].c_str(), impl_->output_names[1].c_str()};

  core::Logger::info("OnnxFaceDetector: loaded ", model_path, " (input ", impl_->input_width, "x",
                     impl_->input_height, ")");
}

OnnxFaceDetector::~OnnxFaceDetector() = default;

void OnnxFaceDetector::reset_tracking() { impl_->tracker.reset(); }

void OnnxFaceDetector::close() {
  if (impl_->closed) return;
  impl_->closed = true;
  impl_->session = Ort::Session{nullptr};
  impl_->nchw_buffer.clear();
  impl_->nchw_buffer.shrink_to_fit();
  impl_->tracker.reset();
}

std::expected<std::vector<core::Detection>, core::PipelineError> OnnxFaceDetector::detect(
    const core::InputImage& input) {
  if (impl_->closed) {
    return std::unexpected(core::PipelineError::ResourceUnavailable);
  }
  auto bgr = to_bgr(input);
  if (!bgr) {
    return std::unexpected(core::PipelineError::InvalidFrame);
  }

  const auto& descriptor = input.descriptor();
  const cv::Mat upright = rotate_upright(*bgr, descriptor.rotation);

  cv::Mat resized;
  cv::resize(upright, resized, cv::Size(impl_->input_width, impl_->input_height), 0, 0,
             cv::INTER_LINEAR);
  cv::Mat rgb;
  cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);
  cv::Mat normalized;
  rgb.convertTo(normalized, CV_32FC3, kPixelScale, -kPixelMean * kPixelScale);

  const std::size_t num_floats =
      static_cast<std::size_t>(kNumChannels) * impl_->input_height * impl_->input_width;
  impl_->nchw_buffer.resize(num_floats);
  HwcToNchw(normalized, impl_->nchw_buffer.data());

  const std::array<int64_t, 4> shape{1, kNumChannels, impl_->input_height, impl_->input_width};
  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
      mem_info, impl_->nchw_buffer.data(), num_floats, shape.data(), shape.size());

  const char* input_names_c[] = {impl_->input_name.c_str()};
  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(Ort::RunOptions{nullptr}, input_names_c, &input_tensor, 1,
                                 impl_->output_name_ptrs.data(), impl_->output_name_ptrs.size());
  } catch (const Ort::Exception& e) {
    core::Logger::warn("OnnxFaceDetector: Run failed: ", e.what());
    return std::unexpected(core::PipelineError::InferenceFailure);
  }
  if (outputs.size() != 2u) {
    return std::unexpected(core::PipelineError::InferenceFailure);
  }

  const auto scores_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
  const auto boxes_shape = outputs[1].GetTensorTypeAndShapeInfo().GetShape();
  if (scores_shape.size() != 3u || scores_shape[2] != 2 || boxes_shape.size() != 3u ||
      boxes_shape[2] != 4 || scores_shape[1] != boxes_shape[1]) {
    return std::unexpected(core::PipelineError::InferenceFailure);
  }
  const int64_t n = scores_shape[1];
  const float* scores = outputs[0].GetTensorData<float>();
  const float* boxes = outputs[1].GetTensorData<float>();

  InferenceResult raw;
  raw.num_detections = static_cast<std::uint32_t>(n);
  raw.scores.reserve(static_cast<std::size_t>(n));
  raw.boxes.assign(boxes, boxes + n * 4);
  for (int64_t i = 0; i < n; ++i) {
    raw.scores.push_back(scores[i * 2 + 1]);
  }

  const core::Size upright_dims{static_cast<float>(upright.cols), static_cast<float>(upright.rows)};
  std::vector<core::Detection> detections = impl_->decoder.decode(raw, upright_dims);
  const core::Size sensor_size = descriptor.size();
  for (auto& d : detections) {
    d.bounding_box = core::upright_to_sensor(d.bounding_box, sensor_size, descriptor.rotation);
  }
  if (impl_->options.tracking) {
    impl_->tracker.update(detections);
  }
  return detections;
}

void OnnxFaceDetector::warmup() {
  const auto w = static_cast<std::uint32_t>(impl_->input_width);
  const auto h = static_cast<std::uint32_t>(impl_->input_height);
  std::vector<std::byte> buffer(static_cast<std::size_t>(w) * h * 4, std::byte{0});
  core::ImageDescriptor descriptor;
  descriptor.width = w;
  descriptor.height = h;
  descriptor.format = core::PixelFormat::Bgra8888;
  descriptor.bytes_per_row = w * 4;
  auto result = detect(core::InputImage(std::move(buffer), descriptor));
  if (!result) {
    core::Logger::warn("OnnxFaceDetector: warmup failed (", core::to_string(result.error()), ")");
  }
  impl_->tracker.reset();
}

}  // namespace facelens::vision
