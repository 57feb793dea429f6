#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "fm_types.h"

namespace fm {

// One tick's pixels: RGBA8, straight alpha, row-major, top-left origin. Owned by the tick
// that produced it until it is moved into the presenter.
struct RenderedFrame {
    int width = 0;
    int height = 0;
    Point origin{};
    std::vector<std::uint8_t> rgba;

    RenderedFrame() = default;
    RenderedFrame(int w, int h, Point at)
        : width(w), height(h), origin(at),
          rgba(static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * 4u, 0) {}

    RenderedFrame(const RenderedFrame&) = delete;
    RenderedFrame& operator=(const RenderedFrame&) = delete;
    RenderedFrame(RenderedFrame&&) noexcept = default;
    RenderedFrame& operator=(RenderedFrame&&) noexcept = default;

    bool empty() const { return width <= 0 || height <= 0; }
    std::size_t byte_size() const { return rgba.size(); }

    const std::uint8_t* pixel(int x, int y) const {
        return rgba.data() + (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + x) * 4u;
    }

    bool fully_transparent() const {
        for (std::size_t i = 3; i < rgba.size(); i += 4) {
            if (rgba[i] != 0) return false;
        }
        return true;
    }
};

} // namespace fm
