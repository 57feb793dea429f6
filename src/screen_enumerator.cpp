#include "screen_enumerator.h"

#include <GLFW/glfw3.h>

#include <iostream>
#include <string>

namespace fm {

std::vector<ScreenGeometry> enumerate_screens() {
    std::vector<ScreenGeometry> result;

    int count = 0;
    GLFWmonitor** monitors = glfwGetMonitors(&count);
    GLFWmonitor* primary = glfwGetPrimaryMonitor();

    for (int i = 0; i < count; ++i) {
        const GLFWvidmode* mode = glfwGetVideoMode(monitors[i]);
        if (!mode) {
            std::cerr << "[screens] monitor " << i << " has no video mode; skipped\n";
            continue;
        }
        ScreenGeometry screen;
        screen.id = i;
        const char* name = glfwGetMonitorName(monitors[i]);
        screen.name = name ? name : "monitor-" + std::to_string(i);
        glfwGetMonitorPos(monitors[i], &screen.bounds.x, &screen.bounds.y);
        screen.bounds.w = mode->width;
        screen.bounds.h = mode->height;
        screen.primary = (monitors[i] == primary);
        result.push_back(screen);
    }

    return result;
}

void print_screens(std::ostream& out, std::span<const ScreenGeometry> screens) {
    if (screens.empty()) {
        out << "[screens] no monitors connected\n";
        return;
    }
    for (const ScreenGeometry& s : screens) {
        out << "[screens] [" << s.id << "] " << s.name;
        if (s.primary) out << " (primary)";
        out << "  " << s.bounds.w << "x" << s.bounds.h << " at (" << s.bounds.x << ", " << s.bounds.y << ")\n";
    }
}

} // namespace fm
