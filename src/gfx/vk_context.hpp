/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vulkan/vulkan.h>

#include <GLFW/glfw3.h>

#include <string>

struct QueueFamilyIndices {
    uint32_t graphics = UINT32_MAX;
    uint32_t present = UINT32_MAX;
    bool complete() const { return graphics != UINT32_MAX && present != UINT32_MAX; }
};

struct ContextOptions {
    std::string app_name = "vk-orbit";
    bool validation = false;
};

// Instance, surface, physical/logical device, queues and the graphics command pool.
class VkContext {
public:
    void init(GLFWwindow *window, const ContextOptions &opts);
    void shutdown();

    VkInstance instance() const { return instance_; }
    VkPhysicalDevice phys() const { return phys_; }
    VkDevice device() const { return device_; }
    VkSurfaceKHR surface() const { return surface_; }

    VkQueue graphics_queue() const { return graphics_queue_; }
    VkQueue present_queue() const { return present_queue_; }
    uint32_t graphics_qf() const { return qf_.graphics; }
    uint32_t present_qf() const { return qf_.present; }

    VkCommandPool command_pool() const { return cmd_pool_; }

    const VkPhysicalDeviceProperties &properties() const { return props_; }
    const VkPhysicalDeviceMemoryProperties &memory_properties() const { return mem_props_; }

private:
    QueueFamilyIndices find_queue_families(VkPhysicalDevice dev);
    bool is_device_suitable(VkPhysicalDevice dev);

    void create_debug_messenger();
    void destroy_debug_messenger();

    VkInstance instance_{};
    VkDebugUtilsMessengerEXT messenger_{};
    VkPhysicalDevice phys_{};
    VkDevice device_{};
    VkSurfaceKHR surface_{};

    VkQueue graphics_queue_{};
    VkQueue present_queue_{};
    QueueFamilyIndices qf_{};

    VkCommandPool cmd_pool_{};

    VkPhysicalDeviceProperties props_{};
    VkPhysicalDeviceMemoryProperties mem_props_{};
};
