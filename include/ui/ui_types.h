#pragma once

#include <algorithm>
#include <cstdint>

namespace fm::ui {

struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;
};

// Straight (non-premultiplied) color, components in [0, 1].
struct Color {
    float r = 1.0f;
    float g = 1.0f;
    float b = 1.0f;
    float a = 1.0f;
};

struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;
};

// Color ramp along the segment start -> end; points project onto it and clamp.
struct LinearGradient {
    Vec2 start{};
    Vec2 end{};
    Color start_color{};
    Color end_color{};
};

struct Rgb8 {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

inline Color to_color(const Rgb8& c, float alpha) {
    return Color{c.r / 255.0f, c.g / 255.0f, c.b / 255.0f, std::clamp(alpha, 0.0f, 1.0f)};
}

inline bool operator==(const Rgb8& a, const Rgb8& b) { return a.r == b.r && a.g == b.g && a.b == b.b; }

} // namespace fm::ui
