/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gfx/swapchain.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

VkSurfaceFormatKHR choose_surface_format(const std::vector<VkSurfaceFormatKHR> &fmts) {
    if (fmts.empty()) {
        throw std::runtime_error("Surface reports no formats");
    }
    for (auto want : {VK_FORMAT_B8G8R8A8_SRGB, VK_FORMAT_B8G8R8A8_UNORM}) {
        for (auto &f : fmts) {
            if (f.format == want && f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR) {
                return f;
            }
        }
    }
    return fmts.at(0);
}

VkPresentModeKHR choose_present_mode(const std::vector<VkPresentModeKHR> &modes, bool prefer_mailbox) {
    if (prefer_mailbox) {
        for (auto m : modes) {
            if (m == VK_PRESENT_MODE_MAILBOX_KHR) {
                return m;
            }
        }
    }
    return VK_PRESENT_MODE_FIFO_KHR;
}

VkExtent2D choose_extent(const VkSurfaceCapabilitiesKHR &caps, VkExtent2D requested) {
    if (caps.currentExtent.width != UINT32_MAX) {
        return caps.currentExtent;
    }
    VkExtent2D e{};
    e.width = std::clamp(requested.width, caps.minImageExtent.width, caps.maxImageExtent.width);
    e.height = std::clamp(requested.height, caps.minImageExtent.height, caps.maxImageExtent.height);
    return e;
}

uint32_t choose_image_count(const VkSurfaceCapabilitiesKHR &caps) {
    uint32_t image_count = caps.minImageCount + 1;
    if (caps.maxImageCount > 0 && image_count > caps.maxImageCount) {
        image_count = caps.maxImageCount;
    }
    return std::max(image_count, caps.minImageCount);
}

SwapchainConfig Swapchain::negotiate(const SurfaceSupport &support, VkExtent2D requested, bool prefer_mailbox) {
    SwapchainConfig cfg{};
    cfg.surface_format = choose_surface_format(support.formats);
    cfg.present_mode = choose_present_mode(support.present_modes, prefer_mailbox);
    cfg.extent = choose_extent(support.caps, requested);
    cfg.image_count = choose_image_count(support.caps);
    cfg.transform = support.caps.currentTransform;
    return cfg;
}

void Swapchain::create(RenderDevice &device,
                       const SwapchainConfig &cfg,
                       VkFormat depth_format,
                       VkSampleCountFlagBits samples) {
    SwapchainDesc desc{};
    desc.surface_format = cfg.surface_format;
    desc.present_mode = cfg.present_mode;
    desc.extent = cfg.extent;
    desc.min_image_count = cfg.image_count;
    desc.transform = cfg.transform;

    swapchain_ = device.create_swapchain(desc);
    format_ = cfg.surface_format.format;
    extent_ = cfg.extent;
    present_mode_ = cfg.present_mode;

    // The driver may hand out more images than requested.
    images_ = device.swapchain_images(swapchain_);
    if (images_.empty()) {
        throw std::runtime_error("Swapchain returned no images");
    }

    views_.resize(images_.size());
    for (size_t i = 0; i < images_.size(); i++) {
        views_[i] = device.create_image_view(images_[i], format_, VK_IMAGE_ASPECT_COLOR_BIT);
    }

    RenderPassDesc rp{};
    rp.color_format = format_;
    rp.depth_format = depth_format;
    rp.samples = samples;
    render_pass_ = device.create_render_pass(rp);

    generation_++;
}

void Swapchain::destroy(RenderDevice &device) {
    if (render_pass_.valid()) {
        device.destroy_render_pass(render_pass_);
        render_pass_ = {};
    }

    for (auto v : views_) {
        device.destroy_image_view(v);
    }
    views_.clear();
    images_.clear();
    if (swapchain_.valid()) {
        device.destroy_swapchain(swapchain_);
    }
    swapchain_ = {};
}

void Swapchain::recreate(RenderDevice &device,
                         const SwapchainConfig &cfg,
                         VkFormat depth_format,
                         VkSampleCountFlagBits samples) {
    destroy(device);
    create(device, cfg, depth_format, samples);
}

AcquireResult Swapchain::acquire_next_image(RenderDevice &device, SemaphoreHandle image_acquired, uint64_t timeout) {
    return device.acquire_next_image(swapchain_, image_acquired, timeout);
}

VkResult Swapchain::present(RenderDevice &device, uint32_t image_index, SemaphoreHandle render_finished) {
    return device.present(swapchain_, image_index, render_finished);
}
