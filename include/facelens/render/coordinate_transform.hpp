#pragma once

#include <facelens/core/error.hpp>
#include <facelens/core/geometry.hpp>
#include <facelens/core/sensor.hpp>
#include <expected>

namespace facelens::render {

/// Maps a sensor-space box onto the render surface.
///
/// The capture pipeline delivers frames rotated 90 degrees from the display, so the scale
/// axes are swapped: scaleX = render.width / image.height, scaleY = render.height / image.width.
///   back:  (top*sx, left*sy, bottom*sx, right*sy)
///   front: (render.width - top*sx, left*sy, render.width - bottom*sx, right*sy)
/// The front-facing result is mirrored about render.width / 2 and keeps left > right.
/// A zero image dimension yields DegenerateGeometry.
/// Call on every render: render_size follows the live surface size.
[[nodiscard]] std::expected<core::Rect, core::PipelineError> map_rect(
    const core::Rect& box,
    const core::Size& image_size,
    const core::Size& render_size,
    core::LensDirection lens);

/// Same rect with left <= right and top <= bottom.
[[nodiscard]] core::Rect normalized(const core::Rect& rect) noexcept;

}  // namespace facelens::render
