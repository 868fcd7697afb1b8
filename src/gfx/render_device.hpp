/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vulkan/vulkan.h>

#include <cstdint>
#include <functional>
#include <vector>

#include "gfx/handle.hpp"

struct SurfaceSupport {
    VkSurfaceCapabilitiesKHR caps{};
    std::vector<VkSurfaceFormatKHR> formats;
    std::vector<VkPresentModeKHR> present_modes;
};

struct SwapchainDesc {
    VkSurfaceFormatKHR surface_format{};
    VkPresentModeKHR present_mode{VK_PRESENT_MODE_FIFO_KHR};
    VkExtent2D extent{};
    uint32_t min_image_count = 0;
    VkSurfaceTransformFlagBitsKHR transform{VK_SURFACE_TRANSFORM_IDENTITY_BIT_KHR};
};

struct ImageDesc {
    VkExtent2D extent{};
    VkFormat format{VK_FORMAT_UNDEFINED};
    VkSampleCountFlagBits samples{VK_SAMPLE_COUNT_1_BIT};
    VkImageUsageFlags usage{};
};

struct BufferDesc {
    VkDeviceSize size = 0;
    VkBufferUsageFlags usage{};
};

// Multisampled color + depth, resolved into the presentable image.
struct RenderPassDesc {
    VkFormat color_format{VK_FORMAT_UNDEFINED};
    VkFormat depth_format{VK_FORMAT_UNDEFINED};
    VkSampleCountFlagBits samples{VK_SAMPLE_COUNT_1_BIT};
};

struct FramebufferDesc {
    RenderPassHandle render_pass;
    std::vector<ImageViewHandle> attachments;
    VkExtent2D extent{};
};

struct AcquireResult {
    VkResult result = VK_SUCCESS;
    uint32_t image_index = 0;
};

struct FrameRecording {
    RenderPassHandle render_pass;
    FramebufferHandle framebuffer;
    VkExtent2D extent{};
    VkClearColorValue clear_color{};
    std::function<void(VkCommandBuffer)> draw;
};

struct SubmitDesc {
    CommandBufferHandle cmd;
    SemaphoreHandle wait;
    SemaphoreHandle signal;
    FenceHandle fence;
};

// Everything the presentation core needs from a device and its surface.
// Creation calls throw std::runtime_error on failure; acquire, present and
// fence waits return the VkResult so callers can tell recoverable results apart.
class RenderDevice {
public:
    virtual ~RenderDevice() = default;

    virtual SurfaceSupport query_surface_support() = 0;
    virtual const VkPhysicalDeviceMemoryProperties &memory_properties() const = 0;
    virtual bool supports_format(VkFormat format, VkImageTiling tiling, VkFormatFeatureFlags features) = 0;
    // Sample counts usable for both color and depth framebuffer attachments.
    virtual VkSampleCountFlags framebuffer_sample_counts() = 0;

    virtual SwapchainHandle create_swapchain(const SwapchainDesc &desc) = 0;
    virtual std::vector<ImageHandle> swapchain_images(SwapchainHandle swapchain) = 0;
    virtual void destroy_swapchain(SwapchainHandle swapchain) = 0;
    virtual AcquireResult acquire_next_image(SwapchainHandle swapchain, SemaphoreHandle signal, uint64_t timeout) = 0;
    virtual VkResult present(SwapchainHandle swapchain, uint32_t image_index, SemaphoreHandle wait) = 0;

    virtual ImageHandle create_image(const ImageDesc &desc) = 0;
    virtual VkMemoryRequirements image_memory_requirements(ImageHandle image) = 0;
    virtual void destroy_image(ImageHandle image) = 0;

    virtual BufferHandle create_buffer(const BufferDesc &desc) = 0;
    virtual VkMemoryRequirements buffer_memory_requirements(BufferHandle buffer) = 0;
    virtual void destroy_buffer(BufferHandle buffer) = 0;

    virtual MemoryHandle allocate_memory(VkDeviceSize size, uint32_t type_index) = 0;
    virtual void bind_image_memory(ImageHandle image, MemoryHandle memory) = 0;
    virtual void bind_buffer_memory(BufferHandle buffer, MemoryHandle memory) = 0;
    virtual void write_memory(MemoryHandle memory, const void *data, VkDeviceSize size) = 0;
    virtual void free_memory(MemoryHandle memory) = 0;

    virtual ImageViewHandle create_image_view(ImageHandle image, VkFormat format, VkImageAspectFlags aspect) = 0;
    virtual void destroy_image_view(ImageViewHandle view) = 0;

    virtual RenderPassHandle create_render_pass(const RenderPassDesc &desc) = 0;
    virtual void destroy_render_pass(RenderPassHandle render_pass) = 0;
    virtual FramebufferHandle create_framebuffer(const FramebufferDesc &desc) = 0;
    virtual void destroy_framebuffer(FramebufferHandle framebuffer) = 0;

    virtual SemaphoreHandle create_semaphore() = 0;
    virtual void destroy_semaphore(SemaphoreHandle semaphore) = 0;
    virtual FenceHandle create_fence(bool signaled) = 0;
    virtual void destroy_fence(FenceHandle fence) = 0;
    virtual VkResult wait_for_fence(FenceHandle fence, uint64_t timeout) = 0;
    virtual void reset_fence(FenceHandle fence) = 0;

    virtual CommandBufferHandle allocate_command_buffer() = 0;
    virtual void free_command_buffer(CommandBufferHandle cmd) = 0;
    virtual void record_frame(CommandBufferHandle cmd, const FrameRecording &rec) = 0;
    virtual void submit(const SubmitDesc &desc) = 0;

    virtual void wait_idle() = 0;
};
