/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gfx/renderer.hpp"

#include <stdexcept>

#include "gfx/render_device.hpp"
#include "util/log.hpp"

namespace {

const char *present_mode_name(VkPresentModeKHR m) {
    switch (m) {
    case VK_PRESENT_MODE_IMMEDIATE_KHR:
        return "immediate";
    case VK_PRESENT_MODE_MAILBOX_KHR:
        return "mailbox";
    case VK_PRESENT_MODE_FIFO_KHR:
        return "fifo";
    case VK_PRESENT_MODE_FIFO_RELAXED_KHR:
        return "fifo-relaxed";
    default:
        return "other";
    }
}

} // namespace

Renderer::Renderer(RenderDevice &device, const RendererConfig &cfg) : device_(device), cfg_(cfg) {}

Renderer::~Renderer() {
    try {
        shutdown();
    } catch (const std::exception &e) {
        log_error("Renderer teardown failed: {}", e.what());
    }
}

bool Renderer::init(VkExtent2D extent) {
    attachments_.init(device_, cfg_.sample_cap);
    return recreate(extent);
}

void Renderer::shutdown() {
    if (!ready_ && !ring_ready_) {
        return;
    }
    device_.wait_idle();
    teardown_size_dependent();
    ubos_.destroy(device_);
    frames_.shutdown(device_);
    ring_ready_ = false;
}

bool Renderer::recreate(VkExtent2D requested) {
    requested_ = requested;
    if (requested.width == 0 || requested.height == 0) {
        return false;
    }

    const SwapchainConfig sc = Swapchain::negotiate(device_.query_surface_support(), requested, cfg_.prefer_mailbox);
    if (sc.extent.width == 0 || sc.extent.height == 0) {
        return false;
    }

    device_.wait_idle();
    teardown_size_dependent();
    build(sc);
    return true;
}

void Renderer::build(const SwapchainConfig &sc) {
    attachments_.recreate(device_, sc.extent, sc.surface_format.format);
    sw_.create(device_, sc, attachments_.depth_format(), attachments_.samples());
    fbs_.rebuild(device_, sw_, attachments_);

    const uint32_t n = sw_.image_count();
    if (!ring_ready_) {
        frames_.init(device_, n);
        ring_ready_ = true;
    } else {
        frames_.resize_images(n);
    }
    if (ubos_.count() != n) {
        ubos_.rebuild(device_, n);
    }

    ready_ = true;
    log_info("swapchain {}x{}, {} images, {} present, {}x msaa",
             sw_.extent().width,
             sw_.extent().height,
             n,
             present_mode_name(sw_.present_mode()),
             static_cast<uint32_t>(attachments_.samples()));
}

void Renderer::teardown_size_dependent() {
    fbs_.destroy(device_);
    sw_.destroy(device_);
    attachments_.shutdown(device_);
    ready_ = false;
}

void Renderer::update_image(uint32_t image, const FrameUniforms &u) { ubos_.write(device_, image, u); }

void Renderer::record(CommandBufferHandle cmd, uint32_t image, const std::function<void(VkCommandBuffer)> &draw) {
    FrameRecording rec{};
    rec.render_pass = sw_.render_pass();
    rec.framebuffer = fbs_.framebuffer(image);
    rec.extent = sw_.extent();
    rec.clear_color = cfg_.clear_color;
    rec.draw = draw;
    device_.record_frame(cmd, rec);
}
