#pragma once

#include <vulkan/vulkan.h>

#include <cstddef>
#include <cstdint>
#include <vector>

#include "frame_slots.h"

struct GLFWwindow;

namespace fm {

// Instance, device and a transfer-destination swapchain for one window. Setup failures
// throw OverlayError(PresenterInit); per-frame failures are reported through return values.
class SwapchainContext {
public:
    static constexpr size_t kFramesInFlight = 2;

    struct CreateInfo {
        GLFWwindow* window = nullptr;
        bool enable_validation = false;
    };

    struct FrameContext {
        VkCommandBuffer command_buffer = VK_NULL_HANDLE;
        uint32_t image_index = 0;
        size_t frame_index = 0;
        bool acquired = false;
    };

    // How the compositor interprets the alpha channel of presented images.
    enum class AlphaMode { Premultiplied, Straight, Opaque };

    SwapchainContext() = default;
    ~SwapchainContext();

    SwapchainContext(const SwapchainContext&) = delete;
    SwapchainContext& operator=(const SwapchainContext&) = delete;

    void initialize(const CreateInfo& info);
    void shutdown();

    FrameContext begin_frame();
    bool submit_frame(const FrameContext& ctx);
    bool present_frame(const FrameContext& ctx);
    // Gives up on an acquired frame before submit; the next recreate rebuilds its sync objects.
    void abandon_frame(const FrameContext& ctx);

    void recreate_swapchain();
    void request_recreate() { swapchain_needs_recreate_ = true; }
    void wait_idle() const;

    VkDevice device() const { return device_; }
    VkPhysicalDevice physical_device() const { return physical_device_; }

    VkExtent2D swapchain_extent() const { return swapchain_extent_; }
    VkImage swapchain_image(uint32_t image_index) const { return swapchain_images_.at(image_index); }
    AlphaMode alpha_mode() const { return alpha_mode_; }
    // True for B8G8R8A8 formats, false for R8G8B8A8.
    bool bgra_order() const { return bgra_order_; }

    size_t current_frame() const { return slots_.current(); }
    const FrameSlots& frame_slots() const { return slots_; }
    bool swapchain_needs_recreate() const { return swapchain_needs_recreate_; }
    bool has_swapchain() const { return swapchain_ != VK_NULL_HANDLE; }

private:
    void create_instance();
    void setup_debug_messenger();
    void create_surface();
    void pick_physical_device();
    void create_logical_device();
    void create_swapchain_internal();
    void create_command_pool_and_buffers();
    void create_sync_objects();

    void cleanup_swapchain();
    void destroy_sync_objects();
    void destroy_debug_messenger();

    static bool has_layer(const char* name);
    static bool has_instance_extension(const char* name);
    static bool has_device_extension(VkPhysicalDevice dev, const char* name);

private:
    GLFWwindow* window_ = nullptr;
    bool enable_validation_ = false;

    VkInstance instance_ = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT debug_messenger_ = VK_NULL_HANDLE;
    VkSurfaceKHR surface_ = VK_NULL_HANDLE;
    VkPhysicalDevice physical_device_ = VK_NULL_HANDLE;
    VkDevice device_ = VK_NULL_HANDLE;
    uint32_t queue_family_graphics_ = 0;
    uint32_t queue_family_present_ = 0;
    VkQueue queue_graphics_ = VK_NULL_HANDLE;
    VkQueue queue_present_ = VK_NULL_HANDLE;

    VkSwapchainKHR swapchain_ = VK_NULL_HANDLE;
    VkFormat swapchain_format_ = VK_FORMAT_UNDEFINED;
    VkExtent2D swapchain_extent_{};
    std::vector<VkImage> swapchain_images_;
    AlphaMode alpha_mode_ = AlphaMode::Opaque;
    bool bgra_order_ = true;

    VkCommandPool command_pool_ = VK_NULL_HANDLE;
    std::vector<VkCommandBuffer> command_buffers_;

    std::vector<VkSemaphore> sem_image_available_;
    std::vector<VkSemaphore> sem_render_finished_;
    std::vector<VkFence> fences_in_flight_;

    FrameSlots slots_{kFramesInFlight};
    bool swapchain_needs_recreate_ = false;

    std::vector<const char*> enabled_layers_;
    std::vector<const char*> enabled_instance_exts_;
    std::vector<const char*> enabled_device_exts_;
};

} // namespace fm
