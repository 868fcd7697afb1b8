/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vulkan/vulkan.h>

#include <cstdint>

#include "gfx/handle.hpp"

class RenderDevice;

// Lowest memory type index allowed by type_bits that has every bit of flags.
// Device order is kept as reported. Throws std::runtime_error when nothing matches.
uint32_t find_memory_type(const VkPhysicalDeviceMemoryProperties &props, uint32_t type_bits, VkMemoryPropertyFlags flags);

MemoryHandle allocate_memory_for(RenderDevice &device, const VkMemoryRequirements &req, VkMemoryPropertyFlags flags);
