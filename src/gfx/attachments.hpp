/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vulkan/vulkan.h>

#include <cstdint>

#include "gfx/handle.hpp"

class RenderDevice;

struct Attachment {
    ImageHandle image;
    MemoryHandle memory;
    ImageViewHandle view;
    VkFormat format{VK_FORMAT_UNDEFINED};
};

// First depth format in D32 / D32S8 / D24S8 order with optimal-tiling depth attachment support.
VkFormat find_depth_format(RenderDevice &device);

// Largest power-of-two count in supported that does not exceed cap (at least 1).
VkSampleCountFlagBits choose_sample_count(VkSampleCountFlags supported, uint32_t cap);

// Multisampled color and depth targets shared by every framebuffer.
class AttachmentSet {
public:
    void init(RenderDevice &device, uint32_t sample_cap);
    void recreate(RenderDevice &device, VkExtent2D extent, VkFormat color_format);
    void shutdown(RenderDevice &device);

    const Attachment &color() const { return color_; }
    const Attachment &depth() const { return depth_; }

    VkFormat depth_format() const { return depth_format_; }
    VkSampleCountFlagBits samples() const { return samples_; }
    VkExtent2D extent() const { return extent_; }

    bool ready() const { return color_.view.valid() && depth_.view.valid(); }
    uint64_t generation() const { return generation_; }

private:
    Attachment make(RenderDevice &device,
                    VkFormat format,
                    VkImageUsageFlags usage,
                    VkImageAspectFlags aspect);
    void release(RenderDevice &device, Attachment &a);

    Attachment color_{};
    Attachment depth_{};

    VkFormat depth_format_{VK_FORMAT_UNDEFINED};
    VkSampleCountFlagBits samples_{VK_SAMPLE_COUNT_1_BIT};
    VkExtent2D extent_{};
    uint64_t generation_ = 0;
};
