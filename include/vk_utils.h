// Small Vulkan helpers shared by the swapchain and the presenter
#pragma once

#include <vulkan/vulkan.h>
#include <cstdint>

namespace fm { namespace vk {

const char* result_name(VkResult r);

// Throws OverlayError(PresenterInit) when r is not VK_SUCCESS.
void throw_if_failed(VkResult r, const char* msg);

// Find a memory type index on the given physical device with the required flags.
// Returns UINT32_MAX when none matches.
uint32_t find_memory_type(VkPhysicalDevice phys,
                          uint32_t typeBits,
                          VkMemoryPropertyFlags properties);

// Create a buffer and allocate/bind memory with the requested properties.
// On failure nothing is leaked and OverlayError(PresenterInit) is thrown.
void create_buffer(VkPhysicalDevice phys,
                   VkDevice device,
                   VkDeviceSize size,
                   VkBufferUsageFlags usage,
                   VkMemoryPropertyFlags properties,
                   VkBuffer& outBuffer,
                   VkDeviceMemory& outMemory);

void destroy_buffer(VkDevice device, VkBuffer& buffer, VkDeviceMemory& memory);

// Whole-image color barrier.
void transition_image(VkCommandBuffer cmd,
                      VkImage image,
                      VkImageLayout oldLayout,
                      VkImageLayout newLayout,
                      VkAccessFlags srcAccess,
                      VkAccessFlags dstAccess,
                      VkPipelineStageFlags srcStage,
                      VkPipelineStageFlags dstStage);

} } // namespace fm::vk
