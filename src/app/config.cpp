#include <facelens/app/config.hpp>
#include <facelens/core/logger.hpp>
#include <exception>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace facelens::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

bool parse_bool(const std::string& value, bool& out) {
  if (value == "true" || value == "1" || value == "yes" || value == "on") {
    out = true;
    return true;
  }
  if (value == "false" || value == "0" || value == "no" || value == "off") {
    out = false;
    return true;
  }
  return false;
}

// Decimal digits only; throws for signs, trailing text and values above UINT32_MAX.
std::uint32_t parse_u32(const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument("not an unsigned integer: " + value);
  }
  const unsigned long long parsed = std::stoull(value);
  if (parsed > std::numeric_limits<std::uint32_t>::max()) {
    throw std::out_of_range("value exceeds 32 bits: " + value);
  }
  return static_cast<std::uint32_t>(parsed);
}

}  // namespace

AppConfig default_config() {
  AppConfig c;
  c.detector.classification = true;
  c.detector.landmarks = true;
  c.detector.tracking = true;
  c.detector.performance_mode = core::PerformanceMode::Fast;
  return c;
}

bool apply_setting(AppConfig& c, const std::string& key, const std::string& value) {
  try {
    if (key == "detector_backend") {
      if (value == "mock") c.detector_backend = DetectorBackendType::Mock;
      else if (value == "cascade") c.detector_backend = DetectorBackendType::Cascade;
      else if (value == "onnx") c.detector_backend = DetectorBackendType::Onnx;
      else return false;
    } else if (key == "model_path") {
      c.model_path = value;
    } else if (key == "classification") {
      return parse_bool(value, c.detector.classification);
    } else if (key == "landmarks") {
      return parse_bool(value, c.detector.landmarks);
    } else if (key == "tracking") {
      return parse_bool(value, c.detector.tracking);
    } else if (key == "performance_mode") {
      if (value == "fast") c.detector.performance_mode = core::PerformanceMode::Fast;
      else if (value == "accurate") c.detector.performance_mode = core::PerformanceMode::Accurate;
      else return false;
    } else if (key == "min_face_size") {
      c.detector.min_face_size = std::stof(value);
    } else if (key == "confidence_threshold") {
      c.detector.confidence_threshold = std::stof(value);
    } else if (key == "inference_timeout_ms") {
      c.inference_timeout_ms = parse_u32(value);
    } else if (key == "platform") {
      if (value == "android") c.platform = core::Platform::Android;
      else if (value == "ios") c.platform = core::Platform::Ios;
      else if (value == "desktop") c.platform = core::Platform::Desktop;
      else return false;
    } else if (key == "compensate_front_rotation") {
      return parse_bool(value, c.compensate_front_rotation);
    } else if (key == "camera_source") {
      if (value == "synthetic") c.camera_source = CameraSourceType::Synthetic;
      else if (value == "video") c.camera_source = CameraSourceType::Video;
      else return false;
    } else if (key == "video_device") {
      c.video_device = value;
    } else if (key == "frame_width") {
      c.frame_width = parse_u32(value);
    } else if (key == "frame_height") {
      c.frame_height = parse_u32(value);
    } else if (key == "frame_rate") {
      c.frame_rate = parse_u32(value);
    } else if (key == "render_width") {
      c.render_width = parse_u32(value);
    } else if (key == "render_height") {
      c.render_height = parse_u32(value);
    } else if (key == "label_offset") {
      c.label_offset = std::stof(value);
    } else if (key == "stroke_width") {
      c.stroke_width = std::stof(value);
    } else if (key == "log_level") {
      c.log_level = core::parse_log_level(value, c.log_level);
    } else {
      return false;
    }
  } catch (const std::exception&) {
    return false;
  }
  return true;
}

AppConfig load_config(const std::string& path) {
  AppConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    core::Logger::warn("load_config: cannot open ", path, "; using defaults");
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  int line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;
    if (!apply_setting(c, key, value)) {
      core::Logger::warn("load_config: ", path, ":", line_no, ": ignoring '", key, "=", value,
                         "'");
    }
  }
  return c;
}

}  // namespace facelens::app
