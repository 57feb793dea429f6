#pragma once

#include <string>

#include "fm_types.h"

struct GLFWwindow;

namespace fm {

struct WindowConfig {
    Rect placement{};
    std::string title = "flashmark";
};

// Borderless, transparent, always-on-top window that never takes focus and lets mouse
// input fall through to whatever is underneath.
class OverlayWindow {
public:
    OverlayWindow() = default;
    ~OverlayWindow();

    OverlayWindow(const OverlayWindow&) = delete;
    OverlayWindow& operator=(const OverlayWindow&) = delete;

    void initialize(const WindowConfig& config);
    void shutdown();

    GLFWwindow* handle() const { return window_; }

    bool should_close() const;

    void move_to(Point origin);
    void resize(int width, int height);
    Point position() const { return position_; }

    void get_window_size(int& width, int& height) const;

private:
    GLFWwindow* window_ = nullptr;
    Point position_{};
    mutable int window_width_ = 0;
    mutable int window_height_ = 0;
};

} // namespace fm
