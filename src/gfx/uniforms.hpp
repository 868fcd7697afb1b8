/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

#include "gfx/handle.hpp"

class Camera;
class RenderDevice;

struct alignas(16) FrameUniforms {
    glm::mat4 view{1.0f};
    glm::mat4 proj{1.0f};
    glm::vec4 misc{0.0f}; // time, aspect, ...
};
static_assert(sizeof(FrameUniforms) % 16 == 0);

FrameUniforms make_frame_uniforms(const Camera &camera, VkExtent2D extent, double elapsed_seconds);

// One host-visible uniform buffer per swapchain image.
class UniformBuffers {
public:
    void rebuild(RenderDevice &device, uint32_t image_count);
    void destroy(RenderDevice &device);

    void write(RenderDevice &device, uint32_t image, const FrameUniforms &u);

    uint32_t count() const { return static_cast<uint32_t>(slots_.size()); }
    BufferHandle buffer(uint32_t image) const { return slots_.at(image).buffer; }

private:
    struct Slot {
        BufferHandle buffer;
        MemoryHandle memory;
    };

    std::vector<Slot> slots_;
};
