/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gfx/frame_resources.hpp"

#include "gfx/render_device.hpp"

void FrameRing::init(RenderDevice &device, uint32_t image_count) {
    for (uint32_t i = 0; i < kMaxFrames; i++) {
        frames_[i].cmd = device.allocate_command_buffer();
        frames_[i].image_acquired = device.create_semaphore();
        frames_[i].render_finished = device.create_semaphore();
        // Signaled so the first wait on each slot returns immediately.
        frames_[i].in_flight = device.create_fence(true);
    }
    frame_index_ = 0;
    cycles_ = 0;
    resize_images(image_count);
}

void FrameRing::shutdown(RenderDevice &device) {
    for (auto &f : frames_) {
        if (f.in_flight.valid()) {
            device.destroy_fence(f.in_flight);
        }
        if (f.render_finished.valid()) {
            device.destroy_semaphore(f.render_finished);
        }
        if (f.image_acquired.valid()) {
            device.destroy_semaphore(f.image_acquired);
        }
        if (f.cmd.valid()) {
            device.free_command_buffer(f.cmd);
        }
        f = FrameResources{};
    }
    images_in_flight_.clear();
}

void FrameRing::resize_images(uint32_t image_count) { images_in_flight_.assign(image_count, FenceHandle{}); }

void FrameRing::bind_image(uint32_t image, FenceHandle fence) {
    for (auto &f : images_in_flight_) {
        if (f == fence) {
            f = FenceHandle{};
        }
    }
    images_in_flight_.at(image) = fence;
}
