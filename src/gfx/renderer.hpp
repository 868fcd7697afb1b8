/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vulkan/vulkan.h>

#include <cstdint>
#include <functional>

#include "gfx/attachments.hpp"
#include "gfx/frame_resources.hpp"
#include "gfx/framebuffers.hpp"
#include "gfx/swapchain.hpp"
#include "gfx/uniforms.hpp"

class RenderDevice;

struct RendererConfig {
    uint32_t sample_cap = 8;
    bool prefer_mailbox = true;
    VkClearColorValue clear_color{{0.15f, 0.15f, 0.18f, 1.0f}};
    uint64_t fence_timeout = UINT64_MAX;
    uint64_t acquire_timeout = UINT64_MAX;
};

// Owns every size-dependent GPU resource and the frame ring.
class Renderer {
public:
    Renderer(RenderDevice &device, const RendererConfig &cfg);
    ~Renderer();

    Renderer(const Renderer &) = delete;
    Renderer &operator=(const Renderer &) = delete;

    // Returns false when the surface is zero-sized; nothing is built until a later recreate succeeds.
    bool init(VkExtent2D extent);
    void shutdown();

    // Device-idle barrier, then rebuild in dependency order:
    // extent -> attachments -> swapchain -> framebuffers -> images_in_flight.
    // Returns false (keeping the current resources) when the surface is zero-sized.
    bool recreate(VkExtent2D requested);

    void update_image(uint32_t image, const FrameUniforms &u);
    void record(CommandBufferHandle cmd, uint32_t image, const std::function<void(VkCommandBuffer)> &draw);

    bool ready() const { return ready_; }

    RenderDevice &device() { return device_; }
    const RendererConfig &config() const { return cfg_; }
    VkExtent2D requested_extent() const { return requested_; }

    Swapchain &swapchain() { return sw_; }
    const Swapchain &swapchain() const { return sw_; }
    const AttachmentSet &attachments() const { return attachments_; }
    const FramebufferSet &framebuffers() const { return fbs_; }
    FrameRing &frames() { return frames_; }
    const FrameRing &frames() const { return frames_; }
    const UniformBuffers &uniforms() const { return ubos_; }

private:
    void build(const SwapchainConfig &sc);
    void teardown_size_dependent();

    RenderDevice &device_;
    RendererConfig cfg_;
    VkExtent2D requested_{};
    bool ready_ = false;
    bool ring_ready_ = false;

    AttachmentSet attachments_;
    Swapchain sw_;
    FramebufferSet fbs_;
    FrameRing frames_;
    UniformBuffers ubos_;
};
