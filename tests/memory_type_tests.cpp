/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdio>
#include <initializer_list>
#include <stdexcept>

#include "gfx/memory_type.hpp"
#include "mock_device.hpp"

namespace {

constexpr VkMemoryPropertyFlags kDeviceLocal = VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT;
constexpr VkMemoryPropertyFlags kHostVisible = VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT;
constexpr VkMemoryPropertyFlags kHostCoherent = VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;
constexpr VkMemoryPropertyFlags kHostCached = VK_MEMORY_PROPERTY_HOST_CACHED_BIT;

VkPhysicalDeviceMemoryProperties make_props(std::initializer_list<VkMemoryPropertyFlags> types) {
    VkPhysicalDeviceMemoryProperties p{};
    for (auto flags : types) {
        p.memoryTypes[p.memoryTypeCount].propertyFlags = flags;
        p.memoryTypes[p.memoryTypeCount].heapIndex = 0;
        p.memoryTypeCount++;
    }
    p.memoryHeapCount = 1;
    return p;
}

bool throws_no_type(const VkPhysicalDeviceMemoryProperties &p, uint32_t bits, VkMemoryPropertyFlags flags) {
    try {
        (void)find_memory_type(p, bits, flags);
    } catch (const std::runtime_error &) {
        return true;
    }
    return false;
}

struct Fixture {
    uint32_t bits;
    VkMemoryPropertyFlags flags;
    int expected; // -1: no type satisfies both
};

bool test_lowest_matching_index() {
    // A typical discrete GPU layout.
    const auto props = make_props({
        kDeviceLocal,
        kHostVisible | kHostCoherent,
        kHostVisible | kHostCoherent | kHostCached,
        kDeviceLocal | kHostVisible | kHostCoherent,
    });

    const Fixture fixtures[] = {
        {0b1111, kDeviceLocal, 0},
        {0b1111, kHostVisible, 1},
        {0b1111, kHostVisible | kHostCoherent, 1},
        {0b1111, kHostVisible | kHostCached, 2},
        {0b1110, kDeviceLocal, 3},
        {0b1100, kHostVisible | kHostCoherent, 2},
        {0b1000, kDeviceLocal | kHostVisible, 3},
        {0b1111, 0, 0},
        {0b0100, 0, 2},
        {0b0111, kDeviceLocal | kHostVisible, -1},
        {0b0001, kHostVisible, -1},
        {0b0000, 0, -1},
    };

    for (const auto &f : fixtures) {
        if (f.expected < 0) {
            if (!throws_no_type(props, f.bits, f.flags)) return false;
            continue;
        }
        if (find_memory_type(props, f.bits, f.flags) != static_cast<uint32_t>(f.expected)) return false;
    }
    return true;
}

bool test_bits_beyond_type_count_ignored() {
    const auto props = make_props({kHostVisible, kDeviceLocal});
    // Bit 5 names a type the device does not report.
    if (!throws_no_type(props, 0b100000, 0)) return false;
    if (find_memory_type(props, 0b100010, kDeviceLocal) != 1) return false;
    return true;
}

bool test_device_order_preserved() {
    // Type 1 has strictly more flags than type 0; the lower index still wins.
    const auto props = make_props({kHostVisible | kHostCoherent, kHostVisible | kHostCoherent | kDeviceLocal});
    if (find_memory_type(props, 0b11, kHostVisible | kHostCoherent) != 0) return false;
    return true;
}

bool test_failure_message_names_request() {
    const auto props = make_props({kDeviceLocal});
    try {
        (void)find_memory_type(props, 0x1, kHostVisible);
    } catch (const std::runtime_error &e) {
        const std::string msg = e.what();
        return msg.find("type_bits=0x1") != std::string::npos && msg.find("flags=0x2") != std::string::npos;
    }
    return false;
}

bool test_allocate_for_requirements() {
    MockDevice dev;
    VkMemoryRequirements req{};
    req.size = 4096;
    req.memoryTypeBits = 0b110;

    const MemoryHandle local = allocate_memory_for(dev, req, kDeviceLocal);
    if (!dev.alive(local) || dev.memory_type_of(local) != 2) return false;
    if (dev.memory_contents(local).size() != 4096) return false;

    const MemoryHandle host = allocate_memory_for(dev, req, kHostVisible | kHostCoherent);
    if (dev.memory_type_of(host) != 1) return false;

    req.memoryTypeBits = 0b001;
    try {
        (void)allocate_memory_for(dev, req, kHostVisible);
        return false;
    } catch (const std::runtime_error &) {
    }
    return dev.live_objects() == 2;
}

} // namespace

int main() {
    const bool ok_lowest = test_lowest_matching_index();
    const bool ok_bits = test_bits_beyond_type_count_ignored();
    const bool ok_order = test_device_order_preserved();
    const bool ok_message = test_failure_message_names_request();
    const bool ok_alloc = test_allocate_for_requirements();

    if (!ok_lowest) std::fprintf(stderr, "[memory-type] lowest matching index failed\n");
    if (!ok_bits) std::fprintf(stderr, "[memory-type] out-of-range type bits failed\n");
    if (!ok_order) std::fprintf(stderr, "[memory-type] device enumeration order failed\n");
    if (!ok_message) std::fprintf(stderr, "[memory-type] failure diagnostic failed\n");
    if (!ok_alloc) std::fprintf(stderr, "[memory-type] allocate for requirements failed\n");

    if (!(ok_lowest && ok_bits && ok_order && ok_message && ok_alloc)) return 1;
    std::fprintf(stderr, "[memory-type] all tests passed\n");
    return 0;
}
