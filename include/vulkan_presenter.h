#pragma once

#include <vulkan/vulkan.h>

#include <array>
#include <cstddef>
#include <cstdint>

#include "overlay_window.h"
#include "platform_layer.h"
#include "surface_presenter.h"
#include "swapchain_context.h"

namespace fm {

// Shows CPU-rendered frames in a transparent GLFW window by copying them into the
// Vulkan swapchain.
class GlfwVulkanPresenter : public SurfacePresenter {
public:
    struct CreateInfo {
        WindowConfig window{};
        bool enable_validation = false;
    };

    explicit GlfwVulkanPresenter(PlatformLayer& platform);
    ~GlfwVulkanPresenter() override;

    GlfwVulkanPresenter(const GlfwVulkanPresenter&) = delete;
    GlfwVulkanPresenter& operator=(const GlfwVulkanPresenter&) = delete;

    // Opens the overlay window and the swapchain. Throws OverlayError(PresenterInit).
    void initialize(const CreateInfo& info);
    void shutdown();

    bool present(Point origin, RenderedFrame&& frame) override;

    // Polls window events; false once the window is gone.
    bool pump_events();

    std::size_t frames_presented() const { return frames_presented_; }

private:
    struct StagingSlot {
        VkBuffer buffer = VK_NULL_HANDLE;
        VkDeviceMemory memory = VK_NULL_HANDLE;
        VkDeviceSize capacity = 0;
        void* mapped = nullptr;
    };

    void ensure_staging(StagingSlot& slot, VkDeviceSize bytes);
    void release_staging(StagingSlot& slot);
    void write_pixels(const RenderedFrame& frame, VkExtent2D extent, std::uint8_t* dst) const;
    bool record_copy(VkCommandBuffer cmd, VkImage image, VkBuffer staging, VkExtent2D extent) const;

    PlatformLayer& platform_;
    SwapchainContext swapchain_;
    std::array<StagingSlot, SwapchainContext::kFramesInFlight> staging_{};
    bool initialized_ = false;
    std::size_t frames_presented_ = 0;
};

} // namespace fm
