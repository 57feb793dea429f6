#include "ui/ui_canvas.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace fm::ui {

namespace {

constexpr int kSupersample = 4;

std::uint8_t to_byte(float v) {
    return static_cast<std::uint8_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
}

float overlap(float lo, float hi, float cell) {
    return std::max(0.0f, std::min(hi, cell + 1.0f) - std::max(lo, cell));
}

bool inside_round_rect(const Rect& r, float radius, float sx, float sy) {
    if (sx < r.x || sy < r.y || sx >= r.x + r.w || sy >= r.y + r.h) return false;
    const float cx = std::clamp(sx, r.x + radius, r.x + r.w - radius);
    const float cy = std::clamp(sy, r.y + radius, r.y + r.h - radius);
    const float dx = sx - cx;
    const float dy = sy - cy;
    return dx * dx + dy * dy <= radius * radius;
}

} // namespace

Canvas::Canvas(int width, int height)
    : width_(std::max(0, width)), height_(std::max(0, height)),
      pixels_(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_) * 4u, 0) {}

void Canvas::fill_rect(const Rect& rect, const Color& color) {
    const float x0 = std::max(rect.x, 0.0f);
    const float y0 = std::max(rect.y, 0.0f);
    const float x1 = std::min(rect.x + rect.w, static_cast<float>(width_));
    const float y1 = std::min(rect.y + rect.h, static_cast<float>(height_));
    if (x1 <= x0 || y1 <= y0 || color.a <= 0.0f) return;

    const int px_begin = static_cast<int>(std::floor(x0));
    const int px_end = static_cast<int>(std::ceil(x1));
    const int py_begin = static_cast<int>(std::floor(y0));
    const int py_end = static_cast<int>(std::ceil(y1));
    for (int py = py_begin; py < py_end; ++py) {
        const float cy = overlap(y0, y1, static_cast<float>(py));
        for (int px = px_begin; px < px_end; ++px) {
            blend_pixel(px, py, color, cy * overlap(x0, x1, static_cast<float>(px)));
        }
    }
}

void Canvas::stroke_rect(const Rect& rect, const Color& color, float stroke_width) {
    if (stroke_width <= 0.0f) return;
    const float half = stroke_width * 0.5f;
    const Rect outer{rect.x - half, rect.y - half, rect.w + stroke_width, rect.h + stroke_width};
    if (rect.w <= stroke_width || rect.h <= stroke_width) {
        fill_rect(outer, color);
        return;
    }
    // Four non-overlapping bands so corners are not blended twice.
    fill_rect(Rect{outer.x, outer.y, outer.w, stroke_width}, color);
    fill_rect(Rect{outer.x, rect.y + rect.h - half, outer.w, stroke_width}, color);
    fill_rect(Rect{outer.x, rect.y + half, stroke_width, rect.h - stroke_width}, color);
    fill_rect(Rect{rect.x + rect.w - half, rect.y + half, stroke_width, rect.h - stroke_width}, color);
}

void Canvas::fill_round_rect(const Rect& rect, float radius, const LinearGradient& gradient) {
    if (rect.w <= 0.0f || rect.h <= 0.0f) return;
    radius = std::clamp(radius, 0.0f, std::min(rect.w, rect.h) * 0.5f);

    const float x0 = std::max(rect.x, 0.0f);
    const float y0 = std::max(rect.y, 0.0f);
    const float x1 = std::min(rect.x + rect.w, static_cast<float>(width_));
    const float y1 = std::min(rect.y + rect.h, static_cast<float>(height_));
    if (x1 <= x0 || y1 <= y0) return;

    const float inner_left = rect.x + radius;
    const float inner_right = rect.x + rect.w - radius;
    const float inner_top = rect.y + radius;
    const float inner_bottom = rect.y + rect.h - radius;
    const float step = 1.0f / kSupersample;

    for (int py = static_cast<int>(std::floor(y0)); py < static_cast<int>(std::ceil(y1)); ++py) {
        const float fy = static_cast<float>(py);
        const bool corner_row = fy < inner_top || fy + 1.0f > inner_bottom;
        for (int px = static_cast<int>(std::floor(x0)); px < static_cast<int>(std::ceil(x1)); ++px) {
            const float fx = static_cast<float>(px);
            const bool corner_col = fx < inner_left || fx + 1.0f > inner_right;
            float coverage = 0.0f;
            if (radius > 0.0f && corner_row && corner_col) {
                int hits = 0;
                for (int sy = 0; sy < kSupersample; ++sy) {
                    for (int sx = 0; sx < kSupersample; ++sx) {
                        if (inside_round_rect(rect, radius, fx + (sx + 0.5f) * step, fy + (sy + 0.5f) * step)) ++hits;
                    }
                }
                coverage = static_cast<float>(hits) / (kSupersample * kSupersample);
            } else {
                coverage = overlap(rect.x, rect.x + rect.w, fx) * overlap(rect.y, rect.y + rect.h, fy);
            }
            if (coverage <= 0.0f) continue;
            blend_pixel(px, py, sample_gradient(gradient, fx + 0.5f, fy + 0.5f), coverage);
        }
    }
}

Color Canvas::pixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) return Color{0.0f, 0.0f, 0.0f, 0.0f};
    const std::size_t i = (static_cast<std::size_t>(y) * width_ + x) * 4u;
    return Color{pixels_[i] / 255.0f, pixels_[i + 1] / 255.0f, pixels_[i + 2] / 255.0f, pixels_[i + 3] / 255.0f};
}

std::vector<std::uint8_t> Canvas::take_pixels() {
    std::vector<std::uint8_t> out = std::move(pixels_);
    pixels_.clear();
    width_ = 0;
    height_ = 0;
    return out;
}

void Canvas::blend_pixel(int x, int y, const Color& color, float coverage) noexcept {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) return;
    const float sa = std::clamp(color.a * coverage, 0.0f, 1.0f);
    if (sa <= 0.0f) return;

    std::uint8_t* p = pixels_.data() + (static_cast<std::size_t>(y) * width_ + x) * 4u;
    const float da = p[3] / 255.0f;
    const float out_a = sa + da * (1.0f - sa);
    if (out_a <= 0.0f) return;
    const float dst_w = da * (1.0f - sa);
    p[0] = to_byte((color.r * sa + (p[0] / 255.0f) * dst_w) / out_a);
    p[1] = to_byte((color.g * sa + (p[1] / 255.0f) * dst_w) / out_a);
    p[2] = to_byte((color.b * sa + (p[2] / 255.0f) * dst_w) / out_a);
    p[3] = to_byte(out_a);
}

Color sample_gradient(const LinearGradient& gradient, float x, float y) {
    const float dx = gradient.end.x - gradient.start.x;
    const float dy = gradient.end.y - gradient.start.y;
    const float len2 = dx * dx + dy * dy;
    float t = 0.0f;
    if (len2 > 0.0f) {
        t = std::clamp(((x - gradient.start.x) * dx + (y - gradient.start.y) * dy) / len2, 0.0f, 1.0f);
    }
    const Color& a = gradient.start_color;
    const Color& b = gradient.end_color;
    return Color{a.r + (b.r - a.r) * t, a.g + (b.g - a.g) * t, a.b + (b.b - a.b) * t, a.a + (b.a - a.a) * t};
}

} // namespace fm::ui
