/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gfx/frame_scheduler.hpp"

#include "gfx/render_device.hpp"
#include "gfx/renderer.hpp"
#include "util/checks.hpp"
#include "util/log.hpp"

FrameScheduler::FrameScheduler(Renderer &renderer, FrameClock::duration delta)
    : renderer_(renderer), clock_(delta) {}

FrameStatus FrameScheduler::tick() {
    clock_.tick();
    step();
    return run_frame();
}

FrameStatus FrameScheduler::tick(FrameClock::duration frame_time) {
    clock_.advance(frame_time);
    step();
    return run_frame();
}

uint32_t FrameScheduler::step() {
    uint32_t n = 0;
    while (clock_.consume()) {
        if (step_) {
            step_(clock_.delta_seconds());
        }
        n++;
    }
    stats_.sim_steps += n;
    return n;
}

void FrameScheduler::request_recreate(VkExtent2D extent) {
    pending_extent_ = extent;
    host_request_ = true;
    pending_ = true;
}

bool FrameScheduler::recreate_now() {
    // Recreations the swapchain asked for keep the last extent the host reported.
    const VkExtent2D extent = host_request_ ? pending_extent_ : renderer_.requested_extent();
    if (!renderer_.recreate(extent)) {
        pending_ = true;
        if (!zero_extent_logged_) {
            log_info("surface is zero-sized, presentation paused");
            zero_extent_logged_ = true;
        }
        return false;
    }
    pending_ = false;
    host_request_ = false;
    zero_extent_logged_ = false;
    stats_.recreations++;
    return true;
}

FrameStatus FrameScheduler::run_frame() {
    if (pending_ || !renderer_.ready()) {
        if (!recreate_now()) {
            stats_.skipped++;
            return FrameStatus::Skipped;
        }
    }

    auto &dev = renderer_.device();
    auto &ring = renderer_.frames();
    auto &f = ring.current();
    const auto &cfg = renderer_.config();

    // At most kMaxFrames submissions are outstanding: this slot's previous one must retire first.
    vk_check(dev.wait_for_fence(f.in_flight, cfg.fence_timeout), "vkWaitForFences(in_flight)");

    const AcquireResult acq = renderer_.swapchain().acquire_next_image(dev, f.image_acquired, cfg.acquire_timeout);
    switch (acq.result) {
    case VK_SUCCESS:
        break;
    case VK_SUBOPTIMAL_KHR:
        pending_ = true;
        break;
    case VK_ERROR_OUT_OF_DATE_KHR:
        // The fence was not reset, so the next cycle on this slot does not block.
        if (!recreate_now()) {
            stats_.skipped++;
            return FrameStatus::Skipped;
        }
        return FrameStatus::Recreated;
    case VK_TIMEOUT:
    case VK_NOT_READY:
        stats_.skipped++;
        return FrameStatus::Skipped;
    default:
        vk_check(acq.result, "vkAcquireNextImageKHR");
    }

    const uint32_t img = acq.image_index;

    // Another slot may still be rendering into this image when kMaxFrames != image count.
    const FenceHandle prior = ring.image_fence(img);
    if (prior.valid()) {
        vk_check(dev.wait_for_fence(prior, cfg.fence_timeout), "vkWaitForFences(image)");
    }

    if (uniforms_) {
        renderer_.update_image(img, uniforms_(renderer_.swapchain().extent(), clock_.elapsed_seconds()));
    }

    ring.bind_image(img, f.in_flight);
    dev.reset_fence(f.in_flight);

    renderer_.record(f.cmd, img, draw_);

    SubmitDesc submit{};
    submit.cmd = f.cmd;
    submit.wait = f.image_acquired;
    submit.signal = f.render_finished;
    submit.fence = f.in_flight;
    dev.submit(submit);

    const VkResult pr = renderer_.swapchain().present(dev, img, f.render_finished);
    if (pr == VK_ERROR_OUT_OF_DATE_KHR || pr == VK_SUBOPTIMAL_KHR) {
        pending_ = true;
    } else {
        vk_check(pr, "vkQueuePresentKHR");
    }

    stats_.last_image = img;
    stats_.last_slot = ring.index();
    stats_.presented++;
    ring.advance();
    return FrameStatus::Presented;
}
