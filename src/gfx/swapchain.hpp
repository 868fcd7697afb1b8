/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

#include "gfx/render_device.hpp"

struct SwapchainConfig {
    VkSurfaceFormatKHR surface_format{};
    VkPresentModeKHR present_mode{VK_PRESENT_MODE_FIFO_KHR};
    VkExtent2D extent{};
    uint32_t image_count = 0;
    VkSurfaceTransformFlagBitsKHR transform{VK_SURFACE_TRANSFORM_IDENTITY_BIT_KHR};
};

VkSurfaceFormatKHR choose_surface_format(const std::vector<VkSurfaceFormatKHR> &fmts);
VkPresentModeKHR choose_present_mode(const std::vector<VkPresentModeKHR> &modes, bool prefer_mailbox);
VkExtent2D choose_extent(const VkSurfaceCapabilitiesKHR &caps, VkExtent2D requested);
uint32_t choose_image_count(const VkSurfaceCapabilitiesKHR &caps);

class Swapchain {
public:
    static SwapchainConfig negotiate(const SurfaceSupport &support, VkExtent2D requested, bool prefer_mailbox);

    void create(RenderDevice &device, const SwapchainConfig &cfg, VkFormat depth_format, VkSampleCountFlagBits samples);
    void destroy(RenderDevice &device);
    void recreate(RenderDevice &device, const SwapchainConfig &cfg, VkFormat depth_format, VkSampleCountFlagBits samples);

    AcquireResult acquire_next_image(RenderDevice &device, SemaphoreHandle image_acquired, uint64_t timeout);
    VkResult present(RenderDevice &device, uint32_t image_index, SemaphoreHandle render_finished);

    SwapchainHandle handle() const { return swapchain_; }
    VkFormat format() const { return format_; }
    VkExtent2D extent() const { return extent_; }
    VkPresentModeKHR present_mode() const { return present_mode_; }

    uint32_t image_count() const { return static_cast<uint32_t>(images_.size()); }
    RenderPassHandle render_pass() const { return render_pass_; }

    const std::vector<ImageViewHandle> &image_views() const { return views_; }

    // Bumped on every create; dependents compare it to detect a rebuilt chain.
    uint64_t generation() const { return generation_; }

private:
    SwapchainHandle swapchain_{};

    VkFormat format_{};
    VkExtent2D extent_{};
    VkPresentModeKHR present_mode_{VK_PRESENT_MODE_FIFO_KHR};
    std::vector<ImageHandle> images_;
    std::vector<ImageViewHandle> views_;

    RenderPassHandle render_pass_{};
    uint64_t generation_ = 0;
};
