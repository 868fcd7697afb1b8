/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <vector>

#include "gfx/frame_scheduler.hpp"
#include "gfx/renderer.hpp"
#include "mock_device.hpp"

namespace {

using namespace std::chrono_literals;

struct Rig {
    MockDevice dev;
    Renderer renderer;
    FrameScheduler scheduler;

    Rig() : renderer(dev, RendererConfig{}), scheduler(renderer, FrameClock::step_for_rate(60.0)) {}

    bool start() { return renderer.init({800, 600}); }
    FrameRing &ring() { return renderer.frames(); }
    FenceHandle slot_fence(uint32_t slot) { return renderer.frames().frame(slot).in_flight; }
};

bool presented(FrameStatus s) { return s == FrameStatus::Presented; }

bool test_bounded_frames_in_flight() {
    Rig r;
    r.dev.auto_retire = false;
    if (!r.start()) return false;

    if (!presented(r.scheduler.run_frame())) return false;
    if (!presented(r.scheduler.run_frame())) return false;
    if (r.dev.outstanding() != 2) return false;

    // Third submission while both earlier ones are unretired: the slot wait cannot complete.
    bool blocked = false;
    try {
        r.scheduler.run_frame();
    } catch (const std::runtime_error &) {
        blocked = true;
    }
    if (!blocked) return false;
    if (r.dev.submissions() != 2 || r.dev.outstanding() != 2) return false;
    if (r.dev.stalls != 1 || r.dev.stalled_on.at(0) != r.slot_fence(0)) return false;
    if (r.ring().cycles() != 2) return false;

    // Retiring the first submission releases the third.
    r.dev.on_stall = [](MockDevice &d, FenceHandle) { d.retire_oldest(); };
    if (!presented(r.scheduler.run_frame())) return false;
    if (r.dev.retired().empty() || r.dev.retired().front() != 0) return false;
    if (r.dev.submissions() != 3) return false;

    for (int i = 0; i < 20; i++) {
        if (!presented(r.scheduler.run_frame())) return false;
        if (r.dev.outstanding() > FrameRing::kMaxFrames) return false;
    }
    return r.dev.max_outstanding() == FrameRing::kMaxFrames;
}

bool test_image_fence_wait() {
    Rig r;
    r.dev.auto_retire = false;
    if (!r.start()) return false;

    // Slot 0 -> image 0, slot 1 -> image 1, then slot 0 gets image 1 again.
    r.dev.acquire_indices = {0, 1, 1};
    if (!presented(r.scheduler.run_frame())) return false;
    if (!presented(r.scheduler.run_frame())) return false;

    const FenceHandle f0 = r.slot_fence(0);
    const FenceHandle f1 = r.slot_fence(1);

    // Only slot 0's own work retires: the cycle must still block on image 1's fence.
    r.dev.on_stall = [f0](MockDevice &d, FenceHandle f) {
        if (f == f0) {
            d.retire_oldest();
        }
    };
    bool blocked = false;
    try {
        r.scheduler.run_frame();
    } catch (const std::runtime_error &) {
        blocked = true;
    }
    if (!blocked) return false;
    if (r.dev.stalled_on.size() != 2) return false;
    if (r.dev.stalled_on[0] != f0 || r.dev.stalled_on[1] != f1) return false;
    if (r.dev.submissions() != 2) return false;
    // Slot 0's fence was not reset because the cycle never reached the bind step.
    if (!r.dev.fence_signaled(f0)) return false;

    r.dev.on_stall = [](MockDevice &d, FenceHandle) { d.retire_oldest(); };
    r.dev.acquire_indices = {1};
    if (!presented(r.scheduler.run_frame())) return false;
    if (r.dev.stalled_on.back() != f1) return false;
    if (r.dev.submissions() != 3) return false;

    const auto &table = r.ring().images_in_flight();
    return table.at(1) == f0 && !table.at(0).valid();
}

bool test_three_images_two_slots_five_cycles() {
    Rig r;
    if (!r.start()) return false;
    if (r.renderer.swapchain().image_count() != 3) return false;

    for (int i = 0; i < 5; i++) {
        if (!presented(r.scheduler.run_frame())) return false;
    }

    const auto &table = r.ring().images_in_flight();
    if (table.size() != 3) return false;
    // Cycle 3 (slot 1) drew image 0, cycle 4 (slot 0) drew image 1.
    if (table[0] != r.slot_fence(1)) return false;
    if (table[1] != r.slot_fence(0)) return false;
    if (table[2].valid()) return false;

    if (r.dev.presented_images != std::vector<uint32_t>{0, 1, 2, 0, 1}) return false;
    if (r.renderer.framebuffers().rebuild_count() != 1) return false;
    if (r.scheduler.stats().recreations != 0) return false;
    if (r.ring().cycles() != 5) return false;
    return r.dev.stalls == 0;
}

bool test_suboptimal_acquire_presents_then_recreates() {
    Rig r;
    if (!r.start()) return false;

    r.dev.acquire_results = {VK_SUBOPTIMAL_KHR};
    if (!presented(r.scheduler.run_frame())) return false;
    if (!r.scheduler.recreate_pending()) return false;
    if (r.dev.presented_images.size() != 1) return false;
    if (r.renderer.framebuffers().rebuild_count() != 1) return false;

    if (!presented(r.scheduler.run_frame())) return false;
    if (r.scheduler.recreate_pending()) return false;
    if (r.scheduler.stats().recreations != 1) return false;
    return r.renderer.framebuffers().rebuild_count() == 2;
}

bool test_out_of_date_acquire_recreates_immediately() {
    Rig r;
    if (!r.start()) return false;
    if (!presented(r.scheduler.run_frame())) return false;

    const FramebufferHandle old_fb = r.renderer.framebuffers().framebuffer(0);
    const uint32_t idle_before = r.dev.wait_idle_calls;

    r.dev.set_surface_extent({1024, 768});
    r.dev.acquire_results = {VK_ERROR_OUT_OF_DATE_KHR};
    if (r.scheduler.run_frame() != FrameStatus::Recreated) return false;

    if (r.ring().cycles() != 1) return false;
    if (r.dev.presented_images.size() != 1 || r.dev.recordings != 1) return false;
    if (r.dev.wait_idle_calls <= idle_before) return false;
    if (r.dev.alive(old_fb)) return false;
    if (r.renderer.swapchain().extent().width != 1024 || r.renderer.swapchain().extent().height != 768) return false;
    if (r.renderer.framebuffers().rebuild_count() != 2) return false;
    if (r.scheduler.stats().recreations != 1) return false;
    // The slot's fence stays signaled so the restarted cycle does not block.
    if (!r.dev.fence_signaled(r.slot_fence(1))) return false;

    if (!presented(r.scheduler.run_frame())) return false;
    return r.dev.stalls == 0 && r.dev.presented_images.size() == 2;
}

bool test_present_results_defer_recreation() {
    for (VkResult pr : {VK_ERROR_OUT_OF_DATE_KHR, VK_SUBOPTIMAL_KHR}) {
        Rig r;
        if (!r.start()) return false;

        r.dev.present_results = {pr};
        if (!presented(r.scheduler.run_frame())) return false;
        if (!r.scheduler.recreate_pending()) return false;
        if (r.renderer.framebuffers().rebuild_count() != 1) return false;

        if (!presented(r.scheduler.run_frame())) return false;
        if (r.scheduler.stats().recreations != 1) return false;
        if (r.renderer.framebuffers().rebuild_count() != 2) return false;
        if (r.scheduler.recreate_pending()) return false;
    }
    return true;
}

bool test_fatal_present_result_throws() {
    Rig r;
    if (!r.start()) return false;
    r.dev.present_results = {VK_ERROR_DEVICE_LOST};
    try {
        r.scheduler.run_frame();
    } catch (const std::runtime_error &) {
        return true;
    }
    return false;
}

bool test_zero_extent_skips_until_restored() {
    Rig r;
    if (!r.start()) return false;
    if (!presented(r.scheduler.run_frame())) return false;
    const uint32_t acquires = r.dev.acquires;

    r.dev.set_surface_extent({0, 0});
    r.scheduler.request_recreate({0, 0});
    if (r.scheduler.run_frame() != FrameStatus::Skipped) return false;
    if (r.scheduler.run_frame() != FrameStatus::Skipped) return false;
    if (r.scheduler.stats().skipped != 2) return false;
    if (r.dev.acquires != acquires) return false;
    // Nothing was torn down for the zero-sized surface.
    if (!r.renderer.ready() || r.renderer.framebuffers().rebuild_count() != 1) return false;

    r.dev.set_surface_extent({640, 480});
    r.scheduler.request_recreate({640, 480});
    if (!presented(r.scheduler.run_frame())) return false;
    if (r.renderer.swapchain().extent().width != 640 || r.renderer.swapchain().extent().height != 480) return false;
    return r.scheduler.stats().recreations == 1 && !r.scheduler.recreate_pending();
}

bool test_acquire_timeout_skips() {
    Rig r;
    if (!r.start()) return false;

    r.dev.acquire_results = {VK_TIMEOUT};
    if (r.scheduler.run_frame() != FrameStatus::Skipped) return false;
    if (r.ring().cycles() != 0) return false;
    if (!r.dev.fence_signaled(r.slot_fence(0))) return false;
    if (r.dev.submissions() != 0) return false;

    if (!presented(r.scheduler.run_frame())) return false;
    return r.dev.stalls == 0;
}

bool test_image_count_change_resizes_table() {
    Rig r;
    if (!r.start()) return false;
    if (!presented(r.scheduler.run_frame())) return false;
    if (!presented(r.scheduler.run_frame())) return false;

    r.dev.support.caps.minImageCount = 3;
    r.scheduler.request_recreate({800, 600});
    if (!presented(r.scheduler.run_frame())) return false;
    if (r.renderer.swapchain().image_count() != 4) return false;
    if (r.ring().images_in_flight().size() != 4) return false;
    if (r.renderer.framebuffers().count() != 4) return false;
    if (r.renderer.uniforms().count() != 4) return false;

    // The driver may return more images than requested; the real count wins.
    r.dev.extra_swapchain_images = 2;
    r.scheduler.request_recreate({800, 600});
    for (int i = 0; i < 7; i++) {
        if (!presented(r.scheduler.run_frame())) return false;
    }
    if (r.renderer.swapchain().image_count() != 6) return false;
    if (r.ring().images_in_flight().size() != 6) return false;
    return r.renderer.framebuffers().count() == 6 && r.renderer.uniforms().count() == 6;
}

bool test_simulation_steps_decoupled_from_presents() {
    Rig r;
    if (!r.start()) return false;

    int steps = 0;
    float step_dt = 0.0f;
    r.scheduler.on_step([&](float dt) {
        steps++;
        step_dt = dt;
    });

    for (int i = 0; i < 3; i++) {
        if (!presented(r.scheduler.tick(20ms))) return false;
    }
    if (steps != 3 || r.scheduler.stats().sim_steps != 3) return false;
    if (step_dt <= 0.0166f || step_dt >= 0.0167f) return false;

    // A short frame runs no step but still presents.
    if (!presented(r.scheduler.tick(5ms))) return false;
    if (steps != 3) return false;

    // A long one runs several steps for a single present.
    if (!presented(r.scheduler.tick(100ms))) return false;
    if (steps != 9) return false;
    return r.scheduler.stats().presented == 5;
}

bool test_uniforms_and_draw_follow_acquired_image() {
    Rig r;
    if (!r.start()) return false;

    int draws = 0;
    VkExtent2D seen{};
    r.scheduler.on_uniforms([&](VkExtent2D extent, double) {
        seen = extent;
        return FrameUniforms{};
    });
    r.scheduler.on_draw([&](VkCommandBuffer) { draws++; });

    for (int i = 0; i < 4; i++) {
        if (!presented(r.scheduler.run_frame())) return false;
        const uint32_t img = r.scheduler.stats().last_image;
        if (r.dev.last_recording.framebuffer != r.renderer.framebuffers().framebuffer(img)) return false;
        if (r.dev.last_recording.render_pass != r.renderer.swapchain().render_pass()) return false;
    }
    if (draws != 4 || r.dev.memory_writes != 4) return false;
    return seen.width == 800 && seen.height == 600;
}

bool test_shutdown_releases_everything() {
    Rig r;
    r.dev.auto_retire = false;
    r.dev.on_stall = [](MockDevice &d, FenceHandle) { d.retire_oldest(); };
    if (!r.start()) return false;
    for (int i = 0; i < 6; i++) {
        if (!presented(r.scheduler.run_frame())) return false;
    }
    if (r.dev.outstanding() == 0) return false;

    r.renderer.shutdown();
    if (r.dev.outstanding() != 0) return false;
    return r.dev.live_objects() == 0;
}

} // namespace

int main() {
    const bool ok_bound = test_bounded_frames_in_flight();
    const bool ok_image_wait = test_image_fence_wait();
    const bool ok_five = test_three_images_two_slots_five_cycles();
    const bool ok_subopt = test_suboptimal_acquire_presents_then_recreates();
    const bool ok_ood = test_out_of_date_acquire_recreates_immediately();
    const bool ok_present = test_present_results_defer_recreation();
    const bool ok_fatal = test_fatal_present_result_throws();
    const bool ok_zero = test_zero_extent_skips_until_restored();
    const bool ok_timeout = test_acquire_timeout_skips();
    const bool ok_count = test_image_count_change_resizes_table();
    const bool ok_sim = test_simulation_steps_decoupled_from_presents();
    const bool ok_uniforms = test_uniforms_and_draw_follow_acquired_image();
    const bool ok_shutdown = test_shutdown_releases_everything();

    if (!ok_bound) std::fprintf(stderr, "[frame-cycle] bounded frames in flight failed\n");
    if (!ok_image_wait) std::fprintf(stderr, "[frame-cycle] image fence wait failed\n");
    if (!ok_five) std::fprintf(stderr, "[frame-cycle] 3 images / 2 slots / 5 cycles failed\n");
    if (!ok_subopt) std::fprintf(stderr, "[frame-cycle] suboptimal acquire failed\n");
    if (!ok_ood) std::fprintf(stderr, "[frame-cycle] out-of-date acquire failed\n");
    if (!ok_present) std::fprintf(stderr, "[frame-cycle] deferred present recreation failed\n");
    if (!ok_fatal) std::fprintf(stderr, "[frame-cycle] fatal present result failed\n");
    if (!ok_zero) std::fprintf(stderr, "[frame-cycle] zero extent skip failed\n");
    if (!ok_timeout) std::fprintf(stderr, "[frame-cycle] acquire timeout skip failed\n");
    if (!ok_count) std::fprintf(stderr, "[frame-cycle] image count change failed\n");
    if (!ok_sim) std::fprintf(stderr, "[frame-cycle] simulation stepping failed\n");
    if (!ok_uniforms) std::fprintf(stderr, "[frame-cycle] uniforms/draw per image failed\n");
    if (!ok_shutdown) std::fprintf(stderr, "[frame-cycle] shutdown release failed\n");

    if (!(ok_bound && ok_image_wait && ok_five && ok_subopt && ok_ood && ok_present && ok_fatal && ok_zero &&
          ok_timeout && ok_count && ok_sim && ok_uniforms && ok_shutdown)) {
        return 1;
    }
    std::fprintf(stderr, "[frame-cycle] all tests passed\n");
    return 0;
}
