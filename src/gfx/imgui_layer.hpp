/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vulkan/vulkan.h>

#include <GLFW/glfw3.h>

class VkContext;

struct OverlayStats {
    float fps = 0.0f;
    uint64_t presented = 0;
    uint64_t sim_steps = 0;
    uint64_t recreations = 0;
    uint64_t skipped = 0;
    uint32_t frame_slot = 0;
    uint32_t image_count = 0;
    VkExtent2D extent{};
    double sim_time = 0.0;
};

class ImGuiLayer {
public:
    void init(GLFWwindow *window,
              const VkContext &ctx,
              VkRenderPass render_pass,
              uint32_t image_count,
              VkSampleCountFlagBits samples);

    // Called after a swapchain rebuild.
    void set_image_count(uint32_t image_count);

    void new_frame(const OverlayStats &stats);
    void render(VkCommandBuffer cmd);
    void shutdown();

    bool active() const { return device_ != VK_NULL_HANDLE; }

private:
    VkDevice device_{VK_NULL_HANDLE};
    VkDescriptorPool descriptor_pool_{VK_NULL_HANDLE};
    uint32_t image_count_ = 0;
};
