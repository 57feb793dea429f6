#pragma once

#include <cstdint>
#include <vector>

#include "ui/ui_types.h"

namespace fm::ui {

// CPU raster target: RGBA8, straight alpha, row-major, top-left origin. Every primitive
// composites with source-over and clips to the canvas.
class Canvas {
public:
    Canvas(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }

    // Fractional edges get partial coverage.
    void fill_rect(const Rect& rect, const Color& color);
    // Outline of the given width centered on the rectangle edge.
    void stroke_rect(const Rect& rect, const Color& color, float stroke_width);
    // Corner pixels are 4x4 supersampled.
    void fill_round_rect(const Rect& rect, float radius, const LinearGradient& gradient);

    Color pixel(int x, int y) const;
    const std::vector<std::uint8_t>& pixels() const { return pixels_; }
    std::vector<std::uint8_t> take_pixels();

private:
    void blend_pixel(int x, int y, const Color& color, float coverage) noexcept;

    int width_ = 0;
    int height_ = 0;
    std::vector<std::uint8_t> pixels_;
};

Color sample_gradient(const LinearGradient& gradient, float x, float y);

} // namespace fm::ui
