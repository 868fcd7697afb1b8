/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gfx/attachments.hpp"

#include <stdexcept>

#include "gfx/memory_type.hpp"
#include "gfx/render_device.hpp"

VkFormat find_depth_format(RenderDevice &device) {
    const VkFormat candidates[] = {
        VK_FORMAT_D32_SFLOAT,
        VK_FORMAT_D32_SFLOAT_S8_UINT,
        VK_FORMAT_D24_UNORM_S8_UINT,
    };
    for (auto f : candidates) {
        if (device.supports_format(f, VK_IMAGE_TILING_OPTIMAL, VK_FORMAT_FEATURE_DEPTH_STENCIL_ATTACHMENT_BIT)) {
            return f;
        }
    }
    throw std::runtime_error("No supported depth format");
}

VkSampleCountFlagBits choose_sample_count(VkSampleCountFlags supported, uint32_t cap) {
    for (uint32_t s = VK_SAMPLE_COUNT_64_BIT; s > VK_SAMPLE_COUNT_1_BIT; s >>= 1) {
        if (s <= cap && (supported & s)) {
            return static_cast<VkSampleCountFlagBits>(s);
        }
    }
    return VK_SAMPLE_COUNT_1_BIT;
}

void AttachmentSet::init(RenderDevice &device, uint32_t sample_cap) {
    depth_format_ = find_depth_format(device);
    samples_ = choose_sample_count(device.framebuffer_sample_counts(), sample_cap);
    if (samples_ == VK_SAMPLE_COUNT_1_BIT) {
        // The render pass resolves color into the swapchain image, which needs a multisampled source.
        throw std::runtime_error("Multisampled color/depth attachments not supported");
    }
}

void AttachmentSet::recreate(RenderDevice &device, VkExtent2D extent, VkFormat color_format) {
    if (ready()) {
        device.wait_idle();
    }
    release(device, color_);
    release(device, depth_);

    extent_ = extent;
    color_ = make(device,
                  color_format,
                  VK_IMAGE_USAGE_TRANSIENT_ATTACHMENT_BIT | VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT,
                  VK_IMAGE_ASPECT_COLOR_BIT);
    depth_ = make(device,
                  depth_format_,
                  VK_IMAGE_USAGE_TRANSIENT_ATTACHMENT_BIT | VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT,
                  VK_IMAGE_ASPECT_DEPTH_BIT);
    generation_++;
}

void AttachmentSet::shutdown(RenderDevice &device) {
    release(device, color_);
    release(device, depth_);
    extent_ = {};
}

Attachment AttachmentSet::make(RenderDevice &device,
                               VkFormat format,
                               VkImageUsageFlags usage,
                               VkImageAspectFlags aspect) {
    ImageDesc desc{};
    desc.extent = extent_;
    desc.format = format;
    desc.samples = samples_;
    desc.usage = usage;

    Attachment a{};
    a.format = format;
    a.image = device.create_image(desc);
    a.memory = allocate_memory_for(device, device.image_memory_requirements(a.image), VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT);
    device.bind_image_memory(a.image, a.memory);
    a.view = device.create_image_view(a.image, format, aspect);
    return a;
}

void AttachmentSet::release(RenderDevice &device, Attachment &a) {
    if (a.view.valid()) {
        device.destroy_image_view(a.view);
    }
    if (a.image.valid()) {
        device.destroy_image(a.image);
    }
    if (a.memory.valid()) {
        device.free_memory(a.memory);
    }
    a = Attachment{};
}
