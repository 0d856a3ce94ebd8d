/**
 * facelens-cli: live face overlay on a camera feed, or face detection over image files.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/facelens_cli [--config path] [--seconds N] [--output dir]
 *        ./build/facelens_cli --input a.jpg b.jpg   (offline batch)
 * Live mode writes one overlay snapshot per second to <output>/frame_<n>.png.
 */

#include <facelens/app/batch_runner.hpp>
#include <facelens/app/config.hpp>
#include <facelens/app/face_camera_session.hpp>
#include <facelens/app/factory.hpp>
#include <facelens/core/detection.hpp>
#include <facelens/core/error.hpp>
#include <facelens/core/input_image.hpp>
#include <facelens/core/logger.hpp>
#include <facelens/pipeline/frame_assembler.hpp>
#include <facelens/render/mat_render_surface.hpp>
#include <facelens/render/overlay_renderer.hpp>
#include <facelens/vision/image_convert.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

namespace fa = facelens::app;
namespace fc = facelens::core;

std::string describe(const std::string& name, const fa::BatchResult& result) {
  std::ostringstream out;
  if (!result) {
    out << name << " error=" << fc::to_string(result.error()) << "\n";
    return out.str();
  }
  out << name << " faces=" << result->size() << "\n";
  for (const auto& d : *result) {
    const auto& b = d.bounding_box;
    out << "  confidence=" << d.confidence << " box=(" << b.left << "," << b.top << ","
        << b.right << "," << b.bottom << ")";
    if (d.tracking_id) out << " id=" << *d.tracking_id;
    out << "\n";
  }
  return out.str();
}

int run_batch(const fa::AppConfig& cfg,
              const std::vector<std::string>& inputs,
              const std::filesystem::path& out_dir) {
  std::vector<fc::InputImage> images;
  std::vector<std::string> names;
  for (const auto& path : inputs) {
    auto image = facelens::vision::load_input_image(path, images.size());
    if (!image) {
      std::cerr << "Failed to load image: " << path << "\n";
      continue;
    }
    images.push_back(std::move(*image));
    names.push_back(path);
  }
  if (images.empty()) return 1;

  std::vector<fa::BatchResult> results(images.size(),
                                       std::unexpected(fc::PipelineError::None));
  auto store = [&results](std::size_t i, const fa::BatchResult& r) { results[i] = r; };

#ifdef FACELENS_HAS_TBB
  fa::run_offline_batch_tbb(
      images,
      [&cfg]() -> std::unique_ptr<facelens::vision::IFaceDetector> {
        auto detector = fa::make_face_detector(cfg);
        return detector ? std::move(*detector) : nullptr;
      },
      store);
#else
  auto detector = fa::make_face_detector(cfg);
  if (!detector) {
    std::cerr << "Detector unavailable: " << fc::to_string(detector.error()) << "\n";
    return 1;
  }
  fa::run_offline_batch(images, **detector, store);
#endif

  std::filesystem::create_directories(out_dir);
  for (std::size_t i = 0; i < images.size(); ++i) {
    const std::string text = describe(names[i], results[i]);
    std::cout << text;
    const std::filesystem::path out_file =
        out_dir / (std::filesystem::path(names[i]).stem().string() + ".txt");
    std::ofstream f(out_file);
    if (f) {
      f << text;
    } else {
      std::cerr << "Warning: could not write " << out_file << "\n";
    }
  }
  return 0;
}

/// Latest camera frame, decoded upright for the preview background.
class PreviewBuffer {
 public:
  void update(const fc::CameraFrame& frame, const fc::SensorContext& context) {
    auto image = facelens::pipeline::assemble_frame(frame, context.rotation);
    if (!image) return;
    auto bgr = facelens::vision::to_bgr(*image);
    if (!bgr) return;
    cv::Mat upright = facelens::vision::rotate_upright(*bgr, context.rotation);
    if (context.sensor && context.sensor->lens_direction == fc::LensDirection::Front) {
      cv::flip(upright, upright, 1);
    }
    std::lock_guard lock(mutex_);
    latest_ = std::move(upright);
  }

  [[nodiscard]] cv::Mat latest() const {
    std::lock_guard lock(mutex_);
    return latest_.clone();
  }

 private:
  mutable std::mutex mutex_;
  cv::Mat latest_;
};

int run_live(const fa::AppConfig& cfg, int seconds, const std::filesystem::path& out_dir) {
  auto detector = fa::make_face_detector(cfg);
  if (!detector) {
    std::cerr << "Detector unavailable: " << fc::to_string(detector.error()) << "\n";
    return 1;
  }

  fa::FaceCameraSession session(fa::make_camera_source(cfg), std::move(*detector),
                                fa::make_session_options(cfg));
  PreviewBuffer preview;
  session.set_preview_callback([&preview, &session](const fc::CameraFrame& frame) {
    preview.update(frame, session.state().context());
  });

  if (auto started = session.initialize(); !started) {
    std::cerr << "Camera unavailable: " << fc::to_string(started.error()) << "\n";
    return 1;
  }

  // This thread is the UI thread from here on.
  facelens::render::OverlayStyle style;
  style.label_offset = cfg.label_offset;
  style.box.stroke_width = cfg.stroke_width;
  facelens::render::OverlayRenderer renderer(style);
  facelens::render::MatRenderSurface surface(static_cast<int>(cfg.render_width),
                                             static_cast<int>(cfg.render_height));
  std::filesystem::create_directories(out_dir);

  using Clock = std::chrono::steady_clock;
  const auto start = Clock::now();
  const auto end = start + std::chrono::seconds(seconds);
  auto next_snapshot = start + std::chrono::seconds(1);
  bool toggled = false;
  int snapshot = 0;

  while (Clock::now() < end) {
    renderer.render_if_needed(surface, session.publisher());

    if (Clock::now() >= next_snapshot) {
      surface.set_background(preview.latest());
      renderer.invalidate();
      renderer.render_if_needed(surface, session.publisher());
      const auto file = out_dir / ("frame_" + std::to_string(snapshot++) + ".png");
      if (!cv::imwrite(file.string(), surface.image())) {
        std::cerr << "Warning: could not write " << file << "\n";
      }
      fc::Logger::info("Faces detected: ", session.face_count());
      next_snapshot += std::chrono::seconds(1);
    }

    if (!toggled && Clock::now() >= start + std::chrono::seconds(seconds) / 2) {
      toggled = true;
      if (auto switched = session.toggle_camera(); !switched) {
        std::cerr << "Camera switch failed: " << fc::to_string(switched.error()) << "\n";
        break;
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(16));
  }

  const auto stats = session.stats();
  session.shutdown();
  std::cout << "frames_delivered=" << stats.frames_delivered
            << " frames_processed=" << stats.frames_processed
            << " frames_dropped=" << stats.frames_dropped
            << " invalid_frames=" << stats.invalid_frames
            << " inference_failures=" << stats.inference_failures
            << " last_inference_ms=" << stats.last_inference_ms
            << " overlays_rendered=" << renderer.render_count() << "\n";
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string backend_override;
  std::string model_override;
  std::string output_dir = "output";
  std::vector<std::string> inputs;
  int seconds = 10;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--model" && i + 1 < argc) {
      model_override = argv[++i];
    } else if (arg == "--seconds" && i + 1 < argc) {
      try {
        seconds = std::stoi(argv[++i]);
      } catch (const std::exception&) {
        std::cerr << "Invalid --seconds " << argv[i] << "\n";
        return 1;
      }
    } else if (arg == "--output" && i + 1 < argc) {
      output_dir = argv[++i];
    } else if (arg == "--input") {
      while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
        inputs.emplace_back(argv[++i]);
      }
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: facelens_cli [options] [--input <image>...]\n"
                << "  --config <path>   key=value config file; default: built-in (mock, synthetic camera)\n"
                << "  --backend <type>  Override detector: mock | cascade | onnx\n"
                << "  --model <path>    Cascade XML or .onnx model (required for cascade / onnx)\n"
                << "  --seconds <n>     Live run duration (default 10)\n"
                << "  --output <dir>    Snapshot / result directory (default output)\n"
                << "  --input <paths>   Detect faces in image files instead of a live feed\n";
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  fa::AppConfig cfg = config_path.empty() ? fa::default_config() : fa::load_config(config_path);

  if (!backend_override.empty() && !fa::apply_setting(cfg, "detector_backend", backend_override)) {
    std::cerr << "Unknown --backend " << backend_override << " (use mock, cascade, or onnx)\n";
    return 1;
  }
  if (!model_override.empty()) {
    cfg.model_path = model_override;
  }
  fc::Logger::set_level(cfg.log_level);

  if (!inputs.empty()) {
    return run_batch(cfg, inputs, output_dir);
  }
  return run_live(cfg, seconds, output_dir);
}
