#include "swapchain_context.h"

#include <GLFW/glfw3.h>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <vector>

#include "overlay_error.h"
#include "vk_utils.h"

namespace fm {

using vk::throw_if_failed;

namespace {

// Longest a frame waits for its fence or for a swapchain image.
constexpr uint64_t kFrameTimeoutNs = 1'000'000'000;

// Channel order the presenter can fill with a plain byte copy.
bool is_copyable_format(VkFormat f, bool& bgra) {
    switch (f) {
        case VK_FORMAT_B8G8R8A8_UNORM:
        case VK_FORMAT_B8G8R8A8_SRGB:
            bgra = true;
            return true;
        case VK_FORMAT_R8G8B8A8_UNORM:
        case VK_FORMAT_R8G8B8A8_SRGB:
            bgra = false;
            return true;
        default:
            return false;
    }
}

int format_rank(VkFormat f) {
    switch (f) {
        case VK_FORMAT_B8G8R8A8_UNORM: return 0;
        case VK_FORMAT_R8G8B8A8_UNORM: return 1;
        case VK_FORMAT_B8G8R8A8_SRGB: return 2;
        case VK_FORMAT_R8G8B8A8_SRGB: return 3;
        default: return 100;
    }
}

const char* alpha_mode_name(SwapchainContext::AlphaMode m) {
    switch (m) {
        case SwapchainContext::AlphaMode::Premultiplied: return "premultiplied";
        case SwapchainContext::AlphaMode::Straight: return "straight";
        case SwapchainContext::AlphaMode::Opaque: return "opaque";
    }
    return "unknown";
}

} // namespace

SwapchainContext::~SwapchainContext() {
    shutdown();
}

void SwapchainContext::initialize(const CreateInfo& info) {
    if (instance_) {
        shutdown();
    }
    if (!info.window) {
        throw std::runtime_error("SwapchainContext::initialize requires a window");
    }

    window_ = info.window;
    enable_validation_ = info.enable_validation;
    swapchain_needs_recreate_ = false;
    slots_.reset();

    try {
        create_instance();
        setup_debug_messenger();
        create_surface();
        pick_physical_device();
        create_logical_device();
        create_swapchain_internal();
        create_command_pool_and_buffers();
        create_sync_objects();
    } catch (const OverlayError&) {
        shutdown();
        throw;
    }
}

void SwapchainContext::shutdown() {
    if (device_) {
        vkDeviceWaitIdle(device_);

        destroy_sync_objects();

        if (command_pool_) {
            vkDestroyCommandPool(device_, command_pool_, nullptr);
            command_pool_ = VK_NULL_HANDLE;
            command_buffers_.clear();
        }

        cleanup_swapchain();

        vkDestroyDevice(device_, nullptr);
        device_ = VK_NULL_HANDLE;
    }

    destroy_debug_messenger();

    if (surface_) {
        vkDestroySurfaceKHR(instance_, surface_, nullptr);
        surface_ = VK_NULL_HANDLE;
    }

    if (instance_) {
        vkDestroyInstance(instance_, nullptr);
        instance_ = VK_NULL_HANDLE;
    }

    physical_device_ = VK_NULL_HANDLE;
    queue_graphics_ = VK_NULL_HANDLE;
    queue_present_ = VK_NULL_HANDLE;
    enabled_layers_.clear();
    enabled_instance_exts_.clear();
    enabled_device_exts_.clear();
}

SwapchainContext::FrameContext SwapchainContext::begin_frame() {
    FrameContext ctx{};
    if (!device_ || !swapchain_) return ctx;
    if (slots_.needs_rebuild()) {
        swapchain_needs_recreate_ = true;
        return ctx;
    }

    const size_t frame_index = slots_.current();
    VkFence fence = fences_in_flight_.at(frame_index);
    VkResult wait = vkWaitForFences(device_, 1, &fence, VK_TRUE, kFrameTimeoutNs);
    if (wait != VK_SUCCESS) {
        std::cerr << "[present] vkWaitForFences failed: " << vk::result_name(wait) << "\n";
        slots_.mark_broken(frame_index);
        swapchain_needs_recreate_ = true;
        return ctx;
    }

    ctx.frame_index = frame_index;

    uint32_t image_index = 0;
    VkResult acq = vkAcquireNextImageKHR(device_, swapchain_, kFrameTimeoutNs, sem_image_available_.at(frame_index),
                                         VK_NULL_HANDLE, &image_index);
    if (acq == VK_ERROR_OUT_OF_DATE_KHR) {
        swapchain_needs_recreate_ = true;
        return ctx;
    }
    if (acq == VK_SUBOPTIMAL_KHR) {
        swapchain_needs_recreate_ = true;
    } else if (acq != VK_SUCCESS) {
        // Timeout and not-ready leave the semaphore untouched.
        std::cerr << "[present] vkAcquireNextImageKHR failed: " << vk::result_name(acq) << "\n";
        return ctx;
    }
    slots_.mark_acquired(frame_index);

    VkCommandBuffer cmd = command_buffers_.at(frame_index);
    if (vkResetCommandBuffer(cmd, 0) != VK_SUCCESS) {
        std::cerr << "[present] vkResetCommandBuffer failed\n";
        slots_.abandon(frame_index);
        swapchain_needs_recreate_ = true;
        return ctx;
    }

    ctx.image_index = image_index;
    ctx.command_buffer = cmd;
    ctx.acquired = true;
    return ctx;
}

bool SwapchainContext::submit_frame(const FrameContext& ctx) {
    if (!ctx.acquired) return false;
    VkSemaphore wait_semaphores[] = { sem_image_available_.at(ctx.frame_index) };
    VkPipelineStageFlags wait_stages[] = { VK_PIPELINE_STAGE_TRANSFER_BIT };
    VkSemaphore signal_semaphores[] = { sem_render_finished_.at(ctx.frame_index) };

    VkSubmitInfo submit{};
    submit.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submit.waitSemaphoreCount = 1;
    submit.pWaitSemaphores = wait_semaphores;
    submit.pWaitDstStageMask = wait_stages;
    submit.commandBufferCount = 1;
    submit.pCommandBuffers = &ctx.command_buffer;
    submit.signalSemaphoreCount = 1;
    submit.pSignalSemaphores = signal_semaphores;

    // Reset only right before the submit that signals it again.
    VkFence fence = fences_in_flight_.at(ctx.frame_index);
    VkResult r = vkResetFences(device_, 1, &fence);
    if (r != VK_SUCCESS) {
        std::cerr << "[present] vkResetFences failed: " << vk::result_name(r) << "\n";
        abandon_frame(ctx);
        return false;
    }
    r = vkQueueSubmit(queue_graphics_, 1, &submit, fence);
    if (r != VK_SUCCESS) {
        std::cerr << "[present] vkQueueSubmit failed: " << vk::result_name(r) << "\n";
        // The fence is reset and nothing will signal it.
        slots_.mark_broken(ctx.frame_index);
        swapchain_needs_recreate_ = true;
        return false;
    }
    slots_.mark_submitted(ctx.frame_index);
    return true;
}

void SwapchainContext::abandon_frame(const FrameContext& ctx) {
    if (!ctx.acquired) return;
    slots_.abandon(ctx.frame_index);
    swapchain_needs_recreate_ = true;
}

bool SwapchainContext::present_frame(const FrameContext& ctx) {
    if (!ctx.acquired) return false;
    VkSemaphore signal_semaphores[] = { sem_render_finished_.at(ctx.frame_index) };

    VkPresentInfoKHR present{};
    present.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    present.waitSemaphoreCount = 1;
    present.pWaitSemaphores = signal_semaphores;
    present.swapchainCount = 1;
    present.pSwapchains = &swapchain_;
    present.pImageIndices = &ctx.image_index;
    VkResult pres = vkQueuePresentKHR(queue_present_, &present);
    slots_.advance();

    if (pres == VK_SUBOPTIMAL_KHR) {
        swapchain_needs_recreate_ = true;
        return true;
    }
    if (pres == VK_ERROR_OUT_OF_DATE_KHR) {
        swapchain_needs_recreate_ = true;
        return false;
    }
    if (pres != VK_SUCCESS) {
        std::cerr << "[present] vkQueuePresentKHR failed: " << vk::result_name(pres) << "\n";
        return false;
    }
    return true;
}

void SwapchainContext::wait_idle() const {
    if (device_) vkDeviceWaitIdle(device_);
}

void SwapchainContext::recreate_swapchain() {
    if (!device_) return;
    vkDeviceWaitIdle(device_);

    cleanup_swapchain();
    // Abandoned acquires and failed submits leave sync objects no later frame resolves.
    destroy_sync_objects();
    create_sync_objects();
    slots_.reset();
    create_swapchain_internal();
}

void SwapchainContext::create_instance() {
    uint32_t glfw_count = 0;
    const char** glfw_ext = glfwGetRequiredInstanceExtensions(&glfw_count);
    if (!glfw_ext) {
        throw OverlayError(ErrorCode::PresenterInit, "Vulkan is not available to GLFW on this system");
    }
    enabled_instance_exts_.assign(glfw_ext, glfw_ext + glfw_count);

    if (enable_validation_) {
        enabled_layers_.push_back("VK_LAYER_KHRONOS_validation");
        if (!has_layer(enabled_layers_.back())) {
            std::cerr << "[VK] validation layer not installed; continuing without it\n";
            enabled_layers_.clear();
        }
        if (has_instance_extension("VK_EXT_debug_utils")) {
            enabled_instance_exts_.push_back("VK_EXT_debug_utils");
        }
    }

#ifdef __APPLE__
    if (has_instance_extension("VK_KHR_portability_enumeration")) {
        enabled_instance_exts_.push_back("VK_KHR_portability_enumeration");
    }
#endif

    VkApplicationInfo app{};
    app.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    app.pApplicationName = "flashmark";
    app.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
    app.pEngineName = "fm";
    app.engineVersion = VK_MAKE_VERSION(0, 1, 0);
    app.apiVersion = VK_API_VERSION_1_0;

    VkInstanceCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    ci.pApplicationInfo = &app;
    ci.enabledExtensionCount = static_cast<uint32_t>(enabled_instance_exts_.size());
    ci.ppEnabledExtensionNames = enabled_instance_exts_.data();
    ci.enabledLayerCount = static_cast<uint32_t>(enabled_layers_.size());
    ci.ppEnabledLayerNames = enabled_layers_.data();
#ifdef __APPLE__
    if (std::find_if(enabled_instance_exts_.begin(), enabled_instance_exts_.end(), [](const char* e) {
            return std::strcmp(e, "VK_KHR_portability_enumeration") == 0;
        }) != enabled_instance_exts_.end()) {
        ci.flags |= static_cast<VkInstanceCreateFlags>(0x00000001); // VK_INSTANCE_CREATE_ENUMERATE_PORTABILITY_BIT_KHR
    }
#endif
    throw_if_failed(vkCreateInstance(&ci, nullptr, &instance_), "vkCreateInstance failed");
}

void SwapchainContext::setup_debug_messenger() {
    if (!enable_validation_) return;
    if (!has_instance_extension("VK_EXT_debug_utils")) return;

    VkDebugUtilsMessengerCreateInfoEXT info{};
    info.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
    info.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                           VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    info.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                       VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT;
    info.pfnUserCallback = [](VkDebugUtilsMessageSeverityFlagBitsEXT,
                              VkDebugUtilsMessageTypeFlagsEXT,
                              const VkDebugUtilsMessengerCallbackDataEXT* callback_data,
                              void*) -> VkBool32 {
        std::cerr << "[VK] " << callback_data->pMessage << "\n";
        return VK_FALSE;
    };
    auto pfn_create = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(instance_, "vkCreateDebugUtilsMessengerEXT"));
    if (pfn_create) {
        throw_if_failed(pfn_create(instance_, &info, nullptr, &debug_messenger_), "CreateDebugUtilsMessenger failed");
    }
}

void SwapchainContext::destroy_debug_messenger() {
    if (!instance_ || !debug_messenger_) return;
    auto pfn_destroy = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(instance_, "vkDestroyDebugUtilsMessengerEXT"));
    if (pfn_destroy) {
        pfn_destroy(instance_, debug_messenger_, nullptr);
    }
    debug_messenger_ = VK_NULL_HANDLE;
}

void SwapchainContext::create_surface() {
    throw_if_failed(glfwCreateWindowSurface(instance_, window_, nullptr, &surface_), "glfwCreateWindowSurface failed");
}

void SwapchainContext::pick_physical_device() {
    uint32_t count = 0;
    vkEnumeratePhysicalDevices(instance_, &count, nullptr);
    std::vector<VkPhysicalDevice> devices(count);
    vkEnumeratePhysicalDevices(instance_, &count, devices.data());

    // Integrated GPUs first.
    auto score = [](VkPhysicalDevice device) {
        VkPhysicalDeviceProperties props{};
        vkGetPhysicalDeviceProperties(device, &props);
        if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU) return 2;
        if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU) return 1;
        return 0;
    };

    std::stable_sort(devices.begin(), devices.end(), [&](VkPhysicalDevice a, VkPhysicalDevice b) {
        return score(a) > score(b);
    });

    for (auto device : devices) {
        bool ok = has_device_extension(device, VK_KHR_SWAPCHAIN_EXTENSION_NAME);
#ifdef __APPLE__
        ok = ok && has_device_extension(device, "VK_KHR_portability_subset");
#endif
        if (!ok) continue;

        uint32_t qcount = 0;
        vkGetPhysicalDeviceQueueFamilyProperties(device, &qcount, nullptr);
        std::vector<VkQueueFamilyProperties> qprops(qcount);
        vkGetPhysicalDeviceQueueFamilyProperties(device, &qcount, qprops.data());

        std::optional<uint32_t> gfx;
        std::optional<uint32_t> present;
        for (uint32_t i = 0; i < qcount; ++i) {
            if (!gfx && (qprops[i].queueFlags & VK_QUEUE_GRAPHICS_BIT)) gfx = i;
            VkBool32 sup = VK_FALSE;
            vkGetPhysicalDeviceSurfaceSupportKHR(device, i, surface_, &sup);
            if (sup && (!present || (gfx && *gfx == i))) present = i;
        }

        if (gfx && present) {
            physical_device_ = device;
            queue_family_graphics_ = *gfx;
            queue_family_present_ = *present;
            break;
        }
    }

    if (physical_device_ == VK_NULL_HANDLE) {
        throw OverlayError(ErrorCode::PresenterInit, "No Vulkan device can present to the overlay window");
    }

    VkPhysicalDeviceProperties props{};
    vkGetPhysicalDeviceProperties(physical_device_, &props);
    std::cout << "[present] device: " << props.deviceName << "\n";
}

void SwapchainContext::create_logical_device() {
    std::set<uint32_t> unique_queues = { queue_family_graphics_, queue_family_present_ };
    float priority = 1.0f;
    std::vector<VkDeviceQueueCreateInfo> queue_infos;
    queue_infos.reserve(unique_queues.size());
    for (uint32_t idx : unique_queues) {
        VkDeviceQueueCreateInfo qi{};
        qi.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        qi.queueFamilyIndex = idx;
        qi.queueCount = 1;
        qi.pQueuePriorities = &priority;
        queue_infos.push_back(qi);
    }

    enabled_device_exts_.clear();
    enabled_device_exts_.push_back(VK_KHR_SWAPCHAIN_EXTENSION_NAME);
#ifdef __APPLE__
    if (has_device_extension(physical_device_, "VK_KHR_portability_subset")) {
        enabled_device_exts_.push_back("VK_KHR_portability_subset");
    }
#endif

    VkDeviceCreateInfo dci{};
    dci.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    dci.queueCreateInfoCount = static_cast<uint32_t>(queue_infos.size());
    dci.pQueueCreateInfos = queue_infos.data();
    dci.enabledExtensionCount = static_cast<uint32_t>(enabled_device_exts_.size());
    dci.ppEnabledExtensionNames = enabled_device_exts_.data();

    throw_if_failed(vkCreateDevice(physical_device_, &dci, nullptr, &device_), "vkCreateDevice failed");
    vkGetDeviceQueue(device_, queue_family_graphics_, 0, &queue_graphics_);
    vkGetDeviceQueue(device_, queue_family_present_, 0, &queue_present_);
}

void SwapchainContext::create_swapchain_internal() {
    VkSurfaceCapabilitiesKHR caps{};
    throw_if_failed(vkGetPhysicalDeviceSurfaceCapabilitiesKHR(physical_device_, surface_, &caps),
                    "vkGetPhysicalDeviceSurfaceCapabilitiesKHR failed");

    if (!(caps.supportedUsageFlags & VK_IMAGE_USAGE_TRANSFER_DST_BIT)) {
        throw OverlayError(ErrorCode::PresenterInit, "Swapchain images cannot be transfer destinations on this surface");
    }

    uint32_t fmt_count = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(physical_device_, surface_, &fmt_count, nullptr);
    std::vector<VkSurfaceFormatKHR> formats(fmt_count);
    vkGetPhysicalDeviceSurfaceFormatsKHR(physical_device_, surface_, &fmt_count, formats.data());

    uint32_t pm_count = 0;
    vkGetPhysicalDeviceSurfacePresentModesKHR(physical_device_, surface_, &pm_count, nullptr);
    std::vector<VkPresentModeKHR> present_modes(pm_count);
    vkGetPhysicalDeviceSurfacePresentModesKHR(physical_device_, surface_, &pm_count, present_modes.data());

    std::optional<VkSurfaceFormatKHR> chosen_fmt;
    for (auto f : formats) {
        bool bgra = true;
        if (!is_copyable_format(f.format, bgra)) continue;
        if (!chosen_fmt || format_rank(f.format) < format_rank(chosen_fmt->format)) chosen_fmt = f;
    }
    if (!chosen_fmt) {
        throw OverlayError(ErrorCode::PresenterInit, "Surface offers no 8-bit RGBA swapchain format");
    }
    is_copyable_format(chosen_fmt->format, bgra_order_);

    VkPresentModeKHR chosen_pm = VK_PRESENT_MODE_FIFO_KHR;
    for (auto m : present_modes) {
        if (m == VK_PRESENT_MODE_MAILBOX_KHR) {
            chosen_pm = m;
            break;
        }
    }

    VkCompositeAlphaFlagBitsKHR composite = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    if (caps.supportedCompositeAlpha & VK_COMPOSITE_ALPHA_PRE_MULTIPLIED_BIT_KHR) {
        composite = VK_COMPOSITE_ALPHA_PRE_MULTIPLIED_BIT_KHR;
        alpha_mode_ = AlphaMode::Premultiplied;
    } else if (caps.supportedCompositeAlpha & VK_COMPOSITE_ALPHA_POST_MULTIPLIED_BIT_KHR) {
        composite = VK_COMPOSITE_ALPHA_POST_MULTIPLIED_BIT_KHR;
        alpha_mode_ = AlphaMode::Straight;
    } else if (caps.supportedCompositeAlpha & VK_COMPOSITE_ALPHA_INHERIT_BIT_KHR) {
        // Desktop compositors that inherit alpha from the native window expect premultiplied pixels.
        composite = VK_COMPOSITE_ALPHA_INHERIT_BIT_KHR;
        alpha_mode_ = AlphaMode::Premultiplied;
    } else {
        alpha_mode_ = AlphaMode::Opaque;
        std::cerr << "[present] surface only supports opaque composition; overlay will not be see-through\n";
    }

    VkExtent2D extent = caps.currentExtent;
    if (extent.width == 0xFFFFFFFF) {
        int width = 0;
        int height = 0;
        glfwGetFramebufferSize(window_, &width, &height);
        extent = { static_cast<uint32_t>(std::max(width, 0)), static_cast<uint32_t>(std::max(height, 0)) };
        extent.width = std::clamp(extent.width, caps.minImageExtent.width, caps.maxImageExtent.width);
        extent.height = std::clamp(extent.height, caps.minImageExtent.height, caps.maxImageExtent.height);
    }
    if (extent.width == 0 || extent.height == 0) {
        // Nothing can be presented until the window has a size again.
        swapchain_needs_recreate_ = true;
        return;
    }

    uint32_t image_count = caps.minImageCount + 1;
    if (caps.maxImageCount && image_count > caps.maxImageCount) {
        image_count = caps.maxImageCount;
    }

    VkSwapchainCreateInfoKHR sci{};
    sci.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    sci.surface = surface_;
    sci.minImageCount = image_count;
    sci.imageFormat = chosen_fmt->format;
    sci.imageColorSpace = chosen_fmt->colorSpace;
    sci.imageExtent = extent;
    sci.imageArrayLayers = 1;
    sci.imageUsage = VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    uint32_t queue_indices[] = { queue_family_graphics_, queue_family_present_ };
    if (queue_family_graphics_ != queue_family_present_) {
        sci.imageSharingMode = VK_SHARING_MODE_CONCURRENT;
        sci.queueFamilyIndexCount = 2;
        sci.pQueueFamilyIndices = queue_indices;
    } else {
        sci.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    }
    sci.preTransform = caps.currentTransform;
    sci.compositeAlpha = composite;
    sci.presentMode = chosen_pm;
    sci.clipped = VK_TRUE;

    throw_if_failed(vkCreateSwapchainKHR(device_, &sci, nullptr, &swapchain_), "vkCreateSwapchainKHR failed");

    uint32_t retrieved = 0;
    vkGetSwapchainImagesKHR(device_, swapchain_, &retrieved, nullptr);
    swapchain_images_.resize(retrieved);
    vkGetSwapchainImagesKHR(device_, swapchain_, &retrieved, swapchain_images_.data());
    swapchain_format_ = chosen_fmt->format;
    swapchain_extent_ = extent;
    swapchain_needs_recreate_ = false;

    const char* pm_name = (chosen_pm == VK_PRESENT_MODE_MAILBOX_KHR) ? "MAILBOX" : "FIFO";
    std::cout << "[present] swapchain " << extent.width << "x" << extent.height << " " << pm_name
              << " alpha=" << alpha_mode_name(alpha_mode_) << "\n";
}

void SwapchainContext::create_command_pool_and_buffers() {
    VkCommandPoolCreateInfo pci{};
    pci.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    pci.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    pci.queueFamilyIndex = queue_family_graphics_;
    throw_if_failed(vkCreateCommandPool(device_, &pci, nullptr, &command_pool_), "vkCreateCommandPool failed");

    command_buffers_.resize(kFramesInFlight);
    VkCommandBufferAllocateInfo ai{};
    ai.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    ai.commandPool = command_pool_;
    ai.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    ai.commandBufferCount = static_cast<uint32_t>(command_buffers_.size());
    throw_if_failed(vkAllocateCommandBuffers(device_, &ai, command_buffers_.data()), "vkAllocateCommandBuffers failed");
}

void SwapchainContext::create_sync_objects() {
    sem_image_available_.assign(kFramesInFlight, VK_NULL_HANDLE);
    sem_render_finished_.assign(kFramesInFlight, VK_NULL_HANDLE);
    fences_in_flight_.assign(kFramesInFlight, VK_NULL_HANDLE);

    VkSemaphoreCreateInfo sci{};
    sci.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
    VkFenceCreateInfo fci{};
    fci.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    fci.flags = VK_FENCE_CREATE_SIGNALED_BIT;

    for (size_t i = 0; i < kFramesInFlight; ++i) {
        throw_if_failed(vkCreateSemaphore(device_, &sci, nullptr, &sem_image_available_[i]), "vkCreateSemaphore failed");
        throw_if_failed(vkCreateSemaphore(device_, &sci, nullptr, &sem_render_finished_[i]), "vkCreateSemaphore failed");
        throw_if_failed(vkCreateFence(device_, &fci, nullptr, &fences_in_flight_[i]), "vkCreateFence failed");
    }
}

void SwapchainContext::destroy_sync_objects() {
    for (VkSemaphore s : sem_image_available_) {
        if (s) vkDestroySemaphore(device_, s, nullptr);
    }
    for (VkSemaphore s : sem_render_finished_) {
        if (s) vkDestroySemaphore(device_, s, nullptr);
    }
    for (VkFence f : fences_in_flight_) {
        if (f) vkDestroyFence(device_, f, nullptr);
    }
    sem_image_available_.clear();
    sem_render_finished_.clear();
    fences_in_flight_.clear();
}

void SwapchainContext::cleanup_swapchain() {
    swapchain_images_.clear();
    if (swapchain_) {
        vkDestroySwapchainKHR(device_, swapchain_, nullptr);
        swapchain_ = VK_NULL_HANDLE;
    }
    swapchain_extent_ = VkExtent2D{};
}

bool SwapchainContext::has_layer(const char* name) {
    uint32_t count = 0;
    vkEnumerateInstanceLayerProperties(&count, nullptr);
    std::vector<VkLayerProperties> props(count);
    vkEnumerateInstanceLayerProperties(&count, props.data());
    for (const auto& p : props) {
        if (std::strcmp(p.layerName, name) == 0) return true;
    }
    return false;
}

bool SwapchainContext::has_instance_extension(const char* name) {
    uint32_t count = 0;
    vkEnumerateInstanceExtensionProperties(nullptr, &count, nullptr);
    std::vector<VkExtensionProperties> props(count);
    vkEnumerateInstanceExtensionProperties(nullptr, &count, props.data());
    for (const auto& p : props) {
        if (std::strcmp(p.extensionName, name) == 0) return true;
    }
    return false;
}

bool SwapchainContext::has_device_extension(VkPhysicalDevice dev, const char* name) {
    uint32_t count = 0;
    vkEnumerateDeviceExtensionProperties(dev, nullptr, &count, nullptr);
    std::vector<VkExtensionProperties> props(count);
    vkEnumerateDeviceExtensionProperties(dev, nullptr, &count, props.data());
    for (const auto& p : props) {
        if (std::strcmp(p.extensionName, name) == 0) return true;
    }
    return false;
}

} // namespace fm
