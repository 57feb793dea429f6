#include "overlay_window.h"

#include <GLFW/glfw3.h>

#include <algorithm>

#include "overlay_error.h"

namespace fm {

OverlayWindow::~OverlayWindow() {
    shutdown();
}

void OverlayWindow::initialize(const WindowConfig& config) {
    if (window_) {
        return;
    }

    glfwDefaultWindowHints();
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
    glfwWindowHint(GLFW_DECORATED, GLFW_FALSE);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);
    glfwWindowHint(GLFW_FLOATING, GLFW_TRUE);
    glfwWindowHint(GLFW_TRANSPARENT_FRAMEBUFFER, GLFW_TRUE);
    glfwWindowHint(GLFW_FOCUSED, GLFW_FALSE);
    glfwWindowHint(GLFW_FOCUS_ON_SHOW, GLFW_FALSE);
    glfwWindowHint(GLFW_AUTO_ICONIFY, GLFW_FALSE);
    glfwWindowHint(GLFW_MOUSE_PASSTHROUGH, GLFW_TRUE);

    const int width = std::max(1, config.placement.w);
    const int height = std::max(1, config.placement.h);
    window_ = glfwCreateWindow(width, height, config.title.c_str(), nullptr, nullptr);
    if (!window_) {
        throw OverlayError(ErrorCode::PresenterInit, "Failed to create overlay window");
    }

    // Position while hidden so the first visible frame is already in place.
    move_to(config.placement.origin());
    glfwShowWindow(window_);

    glfwGetWindowSize(window_, &window_width_, &window_height_);
}

void OverlayWindow::shutdown() {
    if (window_) {
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
}

bool OverlayWindow::should_close() const {
    if (!window_) return true;
    return glfwWindowShouldClose(window_);
}

void OverlayWindow::move_to(Point origin) {
    if (!window_) return;
    glfwSetWindowPos(window_, origin.x, origin.y);
    position_ = origin;
}

void OverlayWindow::resize(int width, int height) {
    if (!window_) return;
    glfwSetWindowSize(window_, std::max(1, width), std::max(1, height));
    glfwGetWindowSize(window_, &window_width_, &window_height_);
}

void OverlayWindow::get_window_size(int& width, int& height) const {
    if (window_) {
        glfwGetWindowSize(window_, &window_width_, &window_height_);
    }
    width = window_width_;
    height = window_height_;
}

} // namespace fm
