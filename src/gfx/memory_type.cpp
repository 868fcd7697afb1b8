/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gfx/memory_type.hpp"

#include <format>
#include <stdexcept>

#include "gfx/render_device.hpp"

uint32_t find_memory_type(const VkPhysicalDeviceMemoryProperties &props, uint32_t type_bits, VkMemoryPropertyFlags flags) {
    for (uint32_t i = 0; i < props.memoryTypeCount && i < VK_MAX_MEMORY_TYPES; i++) {
        if ((type_bits & (1u << i)) && (props.memoryTypes[i].propertyFlags & flags) == flags) {
            return i;
        }
    }
    throw std::runtime_error(
        std::format("No suitable memory type (type_bits=0x{:x}, flags=0x{:x})", type_bits, static_cast<uint32_t>(flags)));
}

MemoryHandle allocate_memory_for(RenderDevice &device, const VkMemoryRequirements &req, VkMemoryPropertyFlags flags) {
    const uint32_t type_index = find_memory_type(device.memory_properties(), req.memoryTypeBits, flags);
    return device.allocate_memory(req.size, type_index);
}
