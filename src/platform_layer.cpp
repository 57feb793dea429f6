#include "platform_layer.h"

#include <GLFW/glfw3.h>

#include <iostream>
#include <stdexcept>

#include "overlay_error.h"
#include "screen_enumerator.h"

namespace fm {

namespace {
int g_glfw_init_count = 0;

void glfw_error_callback(int code, const char* description) {
    std::cerr << "[present] GLFW error " << code << ": " << (description ? description : "") << "\n";
}
} // namespace

PlatformLayer::~PlatformLayer() {
    shutdown();
}

void PlatformLayer::initialize() {
    if (initialized_) {
        return;
    }
    if (g_glfw_init_count == 0) {
        glfwSetErrorCallback(glfw_error_callback);
        if (!glfwInit()) {
            throw OverlayError(ErrorCode::PresenterInit, "Failed to initialize GLFW");
        }
    }
    ++g_glfw_init_count;
    initialized_ = true;
}

void PlatformLayer::shutdown() {
    if (!initialized_) {
        return;
    }
    window_.shutdown();
    initialized_ = false;
    if (g_glfw_init_count > 0) {
        --g_glfw_init_count;
        if (g_glfw_init_count == 0) {
            glfwTerminate();
        }
    }
}

std::vector<ScreenGeometry> PlatformLayer::screens() const {
    if (!initialized_) {
        throw std::runtime_error("PlatformLayer::screens called before initialize");
    }
    return enumerate_screens();
}

void PlatformLayer::open_window(const WindowConfig& config) {
    if (!initialized_) {
        throw std::runtime_error("PlatformLayer::open_window called before initialize");
    }
    window_.initialize(config);
}

void PlatformLayer::close_window() {
    window_.shutdown();
}

bool PlatformLayer::poll_events() {
    if (!window_.handle()) return false;
    glfwPollEvents();
    return !window_.should_close();
}

} // namespace fm
