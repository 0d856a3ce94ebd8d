#pragma once

#include <facelens/core/geometry.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace facelens::render {

struct Color {
  std::uint8_t r{0};
  std::uint8_t g{0};
  std::uint8_t b{0};
  std::uint8_t a{255};

  friend bool operator==(const Color&, const Color&) = default;
};

struct RectStyle {
  Color color{};
  float stroke_width{1.f};

  friend bool operator==(const RectStyle&, const RectStyle&) = default;
};

struct TextStyle {
  Color color{};
  float font_size{14.f};
  bool bold{false};
  std::optional<Color> background;

  friend bool operator==(const TextStyle&, const TextStyle&) = default;
};

/// Drawing target owned by the UI layer. Coordinates are render-space logical units.
/// Only called from the UI thread.
class IRenderSurface {
 public:
  virtual ~IRenderSurface() = default;

  [[nodiscard]] virtual core::Size size() const = 0;

  /// Removes everything previously drawn on the overlay layer.
  virtual void clear() = 0;

  /// Outlined rectangle. Edges may arrive unordered (mirrored rects).
  virtual void draw_rect(const core::Rect& rect, const RectStyle& style) = 0;

  /// Text with its top-left corner at origin.
  virtual void draw_text(std::string_view text, const core::Point& origin, const TextStyle& style) = 0;
};

}  // namespace facelens::render
