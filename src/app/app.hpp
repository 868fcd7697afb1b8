/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <GLFW/glfw3.h>
#include <cstdint>
#include <memory>

#include "app/config.hpp"
#include "gfx/camera.hpp"
#include "gfx/frame_scheduler.hpp"
#include "gfx/imgui_layer.hpp"
#include "gfx/renderer.hpp"
#include "gfx/vk_context.hpp"
#include "gfx/vk_device.hpp"

class App {
public:
    explicit App(const AppConfig &cfg);
    ~App();

    App(const App &) = delete;
    App &operator=(const App &) = delete;

    void run();
    void on_framebuffer_resize(int width, int height);
    void on_mouse_move(double x, double y);
    void toggle_mouse_lock();

private:
    void init_window();
    void init_vulkan();
    void shutdown();

    CameraInput read_input() const;
    OverlayStats overlay_stats() const;
    void sync_overlay();

    AppConfig cfg_;

    GLFWwindow *window_{};
    bool glfw_ready_ = false;

    // Declaration order is destruction order in reverse: scheduler and renderer
    // go before the device that owns their handles.
    VkContext ctx_;
    std::unique_ptr<VulkanDevice> device_;
    std::unique_ptr<Renderer> renderer_;
    std::unique_ptr<FrameScheduler> scheduler_;
    ImGuiLayer overlay_;

    Camera camera_;
    bool first_mouse_ = true;
    double last_x_ = 0.0;
    double last_y_ = 0.0;
    bool mouse_locked_ = true;

    double fps_ = 0.0;
};
