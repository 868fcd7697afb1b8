/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gfx/uniforms.hpp"

#include "gfx/camera.hpp"
#include "gfx/memory_type.hpp"
#include "gfx/render_device.hpp"

FrameUniforms make_frame_uniforms(const Camera &camera, VkExtent2D extent, double elapsed_seconds) {
    const float aspect =
        extent.height > 0 ? static_cast<float>(extent.width) / static_cast<float>(extent.height) : 1.0f;

    FrameUniforms u{};
    u.view = camera.view();
    u.proj = camera.projection(aspect);
    u.misc[0] = static_cast<float>(elapsed_seconds);
    u.misc[1] = aspect;
    return u;
}

void UniformBuffers::rebuild(RenderDevice &device, uint32_t image_count) {
    destroy(device);

    slots_.resize(image_count);
    for (auto &s : slots_) {
        BufferDesc desc{};
        desc.size = sizeof(FrameUniforms);
        desc.usage = VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
        s.buffer = device.create_buffer(desc);
        s.memory = allocate_memory_for(device,
                                       device.buffer_memory_requirements(s.buffer),
                                       VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT);
        device.bind_buffer_memory(s.buffer, s.memory);
    }
}

void UniformBuffers::destroy(RenderDevice &device) {
    for (auto &s : slots_) {
        if (s.buffer.valid()) {
            device.destroy_buffer(s.buffer);
        }
        if (s.memory.valid()) {
            device.free_memory(s.memory);
        }
    }
    slots_.clear();
}

void UniformBuffers::write(RenderDevice &device, uint32_t image, const FrameUniforms &u) {
    device.write_memory(slots_.at(image).memory, &u, sizeof(u));
}
