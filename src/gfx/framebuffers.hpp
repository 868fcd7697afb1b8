/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <vector>

#include "gfx/handle.hpp"

class AttachmentSet;
class RenderDevice;
class Swapchain;

// One framebuffer per swapchain image: {color, depth, swapchain view i}.
// Attachment views are borrowed from the AttachmentSet, never destroyed here.
class FramebufferSet {
public:
    void rebuild(RenderDevice &device, const Swapchain &sw, const AttachmentSet &attachments);
    void destroy(RenderDevice &device);

    FramebufferHandle framebuffer(uint32_t swap_img) const { return fb_.at(swap_img); }
    const std::vector<FramebufferHandle> &framebuffers() const { return fb_; }
    uint32_t count() const { return static_cast<uint32_t>(fb_.size()); }

    bool stale(const Swapchain &sw, const AttachmentSet &attachments) const;
    uint64_t rebuild_count() const { return rebuilds_; }

private:
    std::vector<FramebufferHandle> fb_;
    uint64_t swapchain_generation_ = 0;
    uint64_t attachment_generation_ = 0;
    uint64_t rebuilds_ = 0;
};
