#include "vulkan_presenter.h"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "overlay_error.h"
#include "vk_utils.h"

namespace fm {

namespace {

std::uint8_t premultiply(std::uint8_t c, std::uint8_t a) {
    return static_cast<std::uint8_t>((static_cast<unsigned>(c) * a + 127u) / 255u);
}

} // namespace

GlfwVulkanPresenter::GlfwVulkanPresenter(PlatformLayer& platform)
    : platform_(platform) {}

GlfwVulkanPresenter::~GlfwVulkanPresenter() {
    shutdown();
}

void GlfwVulkanPresenter::initialize(const CreateInfo& info) {
    if (initialized_) {
        return;
    }
    try {
        platform_.open_window(info.window);

        SwapchainContext::CreateInfo sci{};
        sci.window = platform_.window_handle();
        sci.enable_validation = info.enable_validation;
        swapchain_.initialize(sci);
    } catch (const OverlayError&) {
        platform_.close_window();
        throw;
    }
    initialized_ = true;
}

void GlfwVulkanPresenter::shutdown() {
    if (!initialized_) {
        return;
    }
    swapchain_.wait_idle();
    for (StagingSlot& slot : staging_) {
        release_staging(slot);
    }
    swapchain_.shutdown();
    platform_.close_window();
    initialized_ = false;
}

bool GlfwVulkanPresenter::pump_events() {
    return platform_.poll_events();
}

bool GlfwVulkanPresenter::present(Point origin, RenderedFrame&& incoming) {
    if (!initialized_) {
        throw std::runtime_error("GlfwVulkanPresenter::present called before initialize");
    }
    const RenderedFrame frame = std::move(incoming);
    if (frame.empty() || frame.rgba.size() < static_cast<std::size_t>(frame.width) * frame.height * 4u) {
        std::cerr << "[present] rejecting malformed frame " << frame.width << "x" << frame.height << "\n";
        return false;
    }

    OverlayWindow& window = platform_.window();
    if (window.should_close()) {
        return false;
    }
    if (window.position() != origin) {
        window.move_to(origin);
    }
    int ww = 0;
    int wh = 0;
    window.get_window_size(ww, wh);
    if (ww != frame.width || wh != frame.height) {
        window.resize(frame.width, frame.height);
        swapchain_.request_recreate();
    }

    try {
        if (swapchain_.swapchain_needs_recreate() || !swapchain_.has_swapchain()) {
            swapchain_.recreate_swapchain();
        }
        if (!swapchain_.has_swapchain()) {
            std::cerr << "[present] no swapchain for a zero-sized window; frame rejected\n";
            return false;
        }
        const VkExtent2D extent = swapchain_.swapchain_extent();
        ensure_staging(staging_[swapchain_.current_frame()],
                       static_cast<VkDeviceSize>(extent.width) * extent.height * 4u);
    } catch (const OverlayError& e) {
        std::cerr << "[present] " << e.what() << "\n";
        return false;
    }

    const SwapchainContext::FrameContext ctx = swapchain_.begin_frame();
    if (!ctx.acquired) {
        std::cerr << "[present] swapchain image unavailable; frame rejected\n";
        return false;
    }

    const VkExtent2D extent = swapchain_.swapchain_extent();
    StagingSlot& slot = staging_[ctx.frame_index];
    write_pixels(frame, extent, static_cast<std::uint8_t*>(slot.mapped));

    if (!record_copy(ctx.command_buffer, swapchain_.swapchain_image(ctx.image_index), slot.buffer, extent)) {
        std::cerr << "[present] failed to record copy commands\n";
        swapchain_.abandon_frame(ctx);
        return false;
    }
    if (!swapchain_.submit_frame(ctx)) {
        return false;
    }
    if (!swapchain_.present_frame(ctx)) {
        return false;
    }
    ++frames_presented_;
    return true;
}

void GlfwVulkanPresenter::ensure_staging(StagingSlot& slot, VkDeviceSize bytes) {
    if (slot.capacity >= bytes && slot.buffer) {
        return;
    }
    // The old buffer may still feed an in-flight copy.
    swapchain_.wait_idle();
    release_staging(slot);

    vk::create_buffer(swapchain_.physical_device(), swapchain_.device(), bytes,
                      VK_BUFFER_USAGE_TRANSFER_SRC_BIT,
                      VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
                      slot.buffer, slot.memory);
    VkResult r = vkMapMemory(swapchain_.device(), slot.memory, 0, bytes, 0, &slot.mapped);
    if (r != VK_SUCCESS) {
        release_staging(slot);
        vk::throw_if_failed(r, "vkMapMemory(staging) failed");
    }
    slot.capacity = bytes;
}

void GlfwVulkanPresenter::release_staging(StagingSlot& slot) {
    VkDevice device = swapchain_.device();
    if (!device) {
        slot = StagingSlot{};
        return;
    }
    if (slot.mapped) {
        vkUnmapMemory(device, slot.memory);
        slot.mapped = nullptr;
    }
    vk::destroy_buffer(device, slot.buffer, slot.memory);
    slot.capacity = 0;
}

void GlfwVulkanPresenter::write_pixels(const RenderedFrame& frame, VkExtent2D extent, std::uint8_t* dst) const {
    const bool premultiplied = swapchain_.alpha_mode() == SwapchainContext::AlphaMode::Premultiplied;
    const bool bgra = swapchain_.bgra_order();
    const bool same_size = extent.width == static_cast<uint32_t>(frame.width) &&
                           extent.height == static_cast<uint32_t>(frame.height);

    // Nearest-neighbour scaling covers framebuffers larger than the window on HiDPI displays.
    for (uint32_t y = 0; y < extent.height; ++y) {
        const int sy = same_size ? static_cast<int>(y)
                                 : static_cast<int>(static_cast<uint64_t>(y) * frame.height / extent.height);
        std::uint8_t* out = dst + static_cast<std::size_t>(y) * extent.width * 4u;
        for (uint32_t x = 0; x < extent.width; ++x, out += 4) {
            const int sx = same_size ? static_cast<int>(x)
                                     : static_cast<int>(static_cast<uint64_t>(x) * frame.width / extent.width);
            const std::uint8_t* in = frame.pixel(sx, sy);
            const std::uint8_t a = in[3];
            std::uint8_t r = in[0];
            std::uint8_t g = in[1];
            std::uint8_t b = in[2];
            if (premultiplied) {
                r = premultiply(r, a);
                g = premultiply(g, a);
                b = premultiply(b, a);
            }
            out[0] = bgra ? b : r;
            out[1] = g;
            out[2] = bgra ? r : b;
            out[3] = a;
        }
    }
}

bool GlfwVulkanPresenter::record_copy(VkCommandBuffer cmd, VkImage image, VkBuffer staging, VkExtent2D extent) const {
    VkCommandBufferBeginInfo bi{VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO};
    bi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    if (vkBeginCommandBuffer(cmd, &bi) != VK_SUCCESS) return false;

    vk::transition_image(cmd, image, VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                         0, VK_ACCESS_TRANSFER_WRITE_BIT,
                         VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT, VK_PIPELINE_STAGE_TRANSFER_BIT);

    VkBufferImageCopy region{};
    region.bufferOffset = 0;
    region.bufferRowLength = 0;
    region.bufferImageHeight = 0;
    region.imageSubresource.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
    region.imageSubresource.mipLevel = 0;
    region.imageSubresource.baseArrayLayer = 0;
    region.imageSubresource.layerCount = 1;
    region.imageOffset = {0, 0, 0};
    region.imageExtent = {extent.width, extent.height, 1};
    vkCmdCopyBufferToImage(cmd, staging, image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);

    vk::transition_image(cmd, image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, VK_IMAGE_LAYOUT_PRESENT_SRC_KHR,
                         VK_ACCESS_TRANSFER_WRITE_BIT, 0,
                         VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_BOTTOM_OF_PIPE_BIT);

    return vkEndCommandBuffer(cmd) == VK_SUCCESS;
}

} // namespace fm
