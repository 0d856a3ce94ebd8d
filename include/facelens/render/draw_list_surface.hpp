#pragma once

#include <facelens/render/render_surface.hpp>
#include <string>
#include <variant>
#include <vector>

namespace facelens::render {

struct RectCommand {
  core::Rect rect;
  RectStyle style;

  friend bool operator==(const RectCommand&, const RectCommand&) = default;
};

struct TextCommand {
  std::string text;
  core::Point origin;
  TextStyle style;

  friend bool operator==(const TextCommand&, const TextCommand&) = default;
};

using DrawCommand = std::variant<RectCommand, TextCommand>;

/// Surface that records draw commands instead of rasterising them (headless runs, tests).
class DrawListSurface : public IRenderSurface {
 public:
  explicit DrawListSurface(core::Size size) : size_(size) {}

  [[nodiscard]] core::Size size() const override { return size_; }
  void resize(core::Size size) { size_ = size; }

  void clear() override {
    commands_.clear();
    ++clear_count_;
  }

  void draw_rect(const core::Rect& rect, const RectStyle& style) override {
    commands_.push_back(RectCommand{rect, style});
  }

  void draw_text(std::string_view text, const core::Point& origin, const TextStyle& style) override {
    commands_.push_back(TextCommand{std::string(text), origin, style});
  }

  [[nodiscard]] const std::vector<DrawCommand>& commands() const noexcept { return commands_; }
  [[nodiscard]] std::size_t clear_count() const noexcept { return clear_count_; }

 private:
  core::Size size_;
  std::vector<DrawCommand> commands_;
  std::size_t clear_count_{0};
};

}  // namespace facelens::render
