#pragma once

#include <vector>

#include "fm_types.h"
#include "overlay_window.h"

struct GLFWwindow;

namespace fm {

// Owns the GLFW runtime and the single overlay window.
class PlatformLayer {
public:
    PlatformLayer() = default;
    ~PlatformLayer();

    PlatformLayer(const PlatformLayer&) = delete;
    PlatformLayer& operator=(const PlatformLayer&) = delete;

    // Throws OverlayError(PresenterInit) when GLFW cannot start.
    void initialize();
    void shutdown();

    std::vector<ScreenGeometry> screens() const;

    void open_window(const WindowConfig& config);
    void close_window();

    // Returns false once the window is gone or asked to close.
    bool poll_events();

    OverlayWindow& window() { return window_; }
    GLFWwindow* window_handle() const { return window_.handle(); }

private:
    OverlayWindow window_;
    bool initialized_ = false;
};

} // namespace fm
