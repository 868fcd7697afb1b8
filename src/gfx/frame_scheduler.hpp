/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vulkan/vulkan.h>

#include <cstdint>
#include <functional>
#include <utility>

#include "gfx/uniforms.hpp"
#include "util/frame_clock.hpp"

class Renderer;

enum class FrameStatus {
    Presented,
    Recreated, // acquire reported out-of-date, resources rebuilt, nothing presented
    Skipped,   // zero-sized surface or acquire timed out
};

struct FrameStats {
    uint64_t presented = 0;
    uint64_t recreations = 0;
    uint64_t skipped = 0;
    uint64_t sim_steps = 0;
    uint32_t last_image = 0;
    uint32_t last_slot = 0;
};

// Drives fixed-step simulation and the acquire -> submit -> present cycle.
class FrameScheduler {
public:
    using StepFn = std::function<void(float)>;
    using UniformFn = std::function<FrameUniforms(VkExtent2D, double)>;
    using DrawFn = std::function<void(VkCommandBuffer)>;

    FrameScheduler(Renderer &renderer, FrameClock::duration delta);

    void on_step(StepFn fn) { step_ = std::move(fn); }
    void on_uniforms(UniformFn fn) { uniforms_ = std::move(fn); }
    void on_draw(DrawFn fn) { draw_ = std::move(fn); }

    // Samples the wall clock, runs the due simulation steps, then one present cycle.
    FrameStatus tick();
    // Same with an explicit elapsed time instead of the wall clock.
    FrameStatus tick(FrameClock::duration frame_time);

    // Runs simulation steps until less than one delta is accumulated. Returns the number run.
    uint32_t step();

    FrameStatus run_frame();

    // Host-side surface change; applied at the start of the next cycle.
    void request_recreate(VkExtent2D extent);
    bool recreate_pending() const { return pending_; }

    const FrameClock &clock() const { return clock_; }
    const FrameStats &stats() const { return stats_; }

private:
    bool recreate_now();

    Renderer &renderer_;
    FrameClock clock_;

    StepFn step_;
    UniformFn uniforms_;
    DrawFn draw_;

    bool pending_ = false;
    bool host_request_ = false;
    VkExtent2D pending_extent_{};
    bool zero_extent_logged_ = false;

    FrameStats stats_{};
};
