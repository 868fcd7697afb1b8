/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vulkan/vulkan.h>

#include <vector>

#include "gfx/handle.hpp"
#include "gfx/render_device.hpp"

class VkContext;

// RenderDevice over a live VkContext. Raw Vulkan objects stay inside the pools;
// a stale or null handle passed in throws instead of touching a destroyed object.
class VulkanDevice final : public RenderDevice {
public:
    explicit VulkanDevice(VkContext &ctx);
    ~VulkanDevice() override;

    VulkanDevice(const VulkanDevice &) = delete;
    VulkanDevice &operator=(const VulkanDevice &) = delete;

    SurfaceSupport query_surface_support() override;
    const VkPhysicalDeviceMemoryProperties &memory_properties() const override;
    bool supports_format(VkFormat format, VkImageTiling tiling, VkFormatFeatureFlags features) override;
    VkSampleCountFlags framebuffer_sample_counts() override;

    SwapchainHandle create_swapchain(const SwapchainDesc &desc) override;
    std::vector<ImageHandle> swapchain_images(SwapchainHandle swapchain) override;
    void destroy_swapchain(SwapchainHandle swapchain) override;
    AcquireResult acquire_next_image(SwapchainHandle swapchain, SemaphoreHandle signal, uint64_t timeout) override;
    VkResult present(SwapchainHandle swapchain, uint32_t image_index, SemaphoreHandle wait) override;

    ImageHandle create_image(const ImageDesc &desc) override;
    VkMemoryRequirements image_memory_requirements(ImageHandle image) override;
    void destroy_image(ImageHandle image) override;

    BufferHandle create_buffer(const BufferDesc &desc) override;
    VkMemoryRequirements buffer_memory_requirements(BufferHandle buffer) override;
    void destroy_buffer(BufferHandle buffer) override;

    MemoryHandle allocate_memory(VkDeviceSize size, uint32_t type_index) override;
    void bind_image_memory(ImageHandle image, MemoryHandle memory) override;
    void bind_buffer_memory(BufferHandle buffer, MemoryHandle memory) override;
    void write_memory(MemoryHandle memory, const void *data, VkDeviceSize size) override;
    void free_memory(MemoryHandle memory) override;

    ImageViewHandle create_image_view(ImageHandle image, VkFormat format, VkImageAspectFlags aspect) override;
    void destroy_image_view(ImageViewHandle view) override;

    RenderPassHandle create_render_pass(const RenderPassDesc &desc) override;
    void destroy_render_pass(RenderPassHandle render_pass) override;
    FramebufferHandle create_framebuffer(const FramebufferDesc &desc) override;
    void destroy_framebuffer(FramebufferHandle framebuffer) override;

    SemaphoreHandle create_semaphore() override;
    void destroy_semaphore(SemaphoreHandle semaphore) override;
    FenceHandle create_fence(bool signaled) override;
    void destroy_fence(FenceHandle fence) override;
    VkResult wait_for_fence(FenceHandle fence, uint64_t timeout) override;
    void reset_fence(FenceHandle fence) override;

    CommandBufferHandle allocate_command_buffer() override;
    void free_command_buffer(CommandBufferHandle cmd) override;
    void record_frame(CommandBufferHandle cmd, const FrameRecording &rec) override;
    void submit(const SubmitDesc &desc) override;

    void wait_idle() override;

    // For integrations that need the raw object (the ImGui backend).
    VkRenderPass raw_render_pass(RenderPassHandle render_pass);

private:
    struct ImageEntry {
        VkImage image{};
        bool swapchain_owned = false;
    };

    struct MemoryEntry {
        VkDeviceMemory memory{};
        VkDeviceSize size = 0;
    };

    struct SwapchainEntry {
        VkSwapchainKHR swapchain{};
        std::vector<ImageHandle> images;
    };

    void release_all();

    VkContext &ctx_;

    HandlePool<ImageTag, ImageEntry> images_;
    HandlePool<ImageViewTag, VkImageView> views_;
    HandlePool<MemoryTag, MemoryEntry> memory_;
    HandlePool<BufferTag, VkBuffer> buffers_;
    HandlePool<RenderPassTag, VkRenderPass> render_passes_;
    HandlePool<FramebufferTag, VkFramebuffer> framebuffers_;
    HandlePool<SwapchainTag, SwapchainEntry> swapchains_;
    HandlePool<SemaphoreTag, VkSemaphore> semaphores_;
    HandlePool<FenceTag, VkFence> fences_;
    HandlePool<CommandBufferTag, VkCommandBuffer> cmds_;
};
