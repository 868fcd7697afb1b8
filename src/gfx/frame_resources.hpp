/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <vector>

#include "gfx/handle.hpp"

struct FrameResources {
    CommandBufferHandle cmd{};
    SemaphoreHandle image_acquired{};
    SemaphoreHandle render_finished{};
    FenceHandle in_flight{};
};

class RenderDevice;

// Per frame-in-flight sync objects plus the per-swapchain-image fence table.
class FrameRing {
public:
    static constexpr uint32_t kMaxFrames = 2;

    void init(RenderDevice &device, uint32_t image_count);
    void shutdown(RenderDevice &device);

    FrameResources &frame(uint32_t i) { return frames_[i]; }
    const FrameResources &frame(uint32_t i) const { return frames_[i]; }

    FrameResources &current() { return frames_[frame_index_]; }
    uint32_t index() const { return frame_index_; }
    uint64_t cycles() const { return cycles_; }
    void advance() {
        cycles_++;
        frame_index_ = static_cast<uint32_t>(cycles_ % kMaxFrames);
    }

    // Resized to the real image count on every recreation and cleared: after the
    // idle barrier no recorded fence can still be pending.
    void resize_images(uint32_t image_count);

    FenceHandle image_fence(uint32_t image) const { return images_in_flight_.at(image); }
    // Records fence as the last submission targeting image. Older entries naming
    // the same fence are dropped since its previous work was retired in the slot wait.
    void bind_image(uint32_t image, FenceHandle fence);

    const std::vector<FenceHandle> &images_in_flight() const { return images_in_flight_; }

private:
    FrameResources frames_[kMaxFrames]{};
    uint32_t frame_index_ = 0;
    uint64_t cycles_ = 0;

    std::vector<FenceHandle> images_in_flight_;
};
