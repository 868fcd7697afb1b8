/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gfx/framebuffers.hpp"

#include <stdexcept>

#include "gfx/attachments.hpp"
#include "gfx/render_device.hpp"
#include "gfx/swapchain.hpp"

void FramebufferSet::rebuild(RenderDevice &device, const Swapchain &sw, const AttachmentSet &attachments) {
    destroy(device);

    if (!attachments.ready()) {
        throw std::runtime_error("FramebufferSet::rebuild: attachments not created");
    }

    const auto &views = sw.image_views();
    fb_.reserve(views.size());
    for (auto view : views) {
        FramebufferDesc desc{};
        desc.render_pass = sw.render_pass();
        desc.attachments = {attachments.color().view, attachments.depth().view, view};
        desc.extent = sw.extent();
        fb_.push_back(device.create_framebuffer(desc));
    }

    swapchain_generation_ = sw.generation();
    attachment_generation_ = attachments.generation();
    rebuilds_++;
}

void FramebufferSet::destroy(RenderDevice &device) {
    for (auto fb : fb_) {
        device.destroy_framebuffer(fb);
    }
    fb_.clear();
}

bool FramebufferSet::stale(const Swapchain &sw, const AttachmentSet &attachments) const {
    return count() != sw.image_count() || swapchain_generation_ != sw.generation() ||
           attachment_generation_ != attachments.generation();
}
