/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <chrono>
#include <stdexcept>

#include "app/app.hpp"
#include "gfx/uniforms.hpp"
#include "util/log.hpp"

namespace {

void framebuffer_resize_cb(GLFWwindow *w, int width, int height) {
    auto *app = reinterpret_cast<App *>(glfwGetWindowUserPointer(w));
    if (app) {
        app->on_framebuffer_resize(width, height);
    }
}

void cursor_pos_cb(GLFWwindow *w, double x, double y) {
    auto *app = reinterpret_cast<App *>(glfwGetWindowUserPointer(w));
    if (app) {
        app->on_mouse_move(x, y);
    }
}

void key_cb(GLFWwindow *w, int key, int scancode, int action, int mods) {
    (void)scancode;
    (void)mods;

    auto *app = reinterpret_cast<App *>(glfwGetWindowUserPointer(w));
    if (!app || action != GLFW_PRESS) {
        return;
    }

    switch (key) {
    case GLFW_KEY_ESCAPE:
        glfwSetWindowShouldClose(w, GLFW_TRUE);
        break;
    case GLFW_KEY_TAB:
        app->toggle_mouse_lock();
        break;
    }
}

VkExtent2D framebuffer_extent(GLFWwindow *window) {
    int w = 0, h = 0;
    glfwGetFramebufferSize(window, &w, &h);
    return {static_cast<uint32_t>(w > 0 ? w : 0), static_cast<uint32_t>(h > 0 ? h : 0)};
}

} // namespace

App::App(const AppConfig &cfg) : cfg_(cfg) {}

App::~App() {
    try {
        shutdown();
    } catch (const std::exception &e) {
        log_error("shutdown: {}", e.what());
    }
}

void App::on_mouse_move(double xpos, double ypos) {
    if (first_mouse_) {
        last_x_ = xpos;
        last_y_ = ypos;
        first_mouse_ = false;
    }

    const float dx = static_cast<float>(xpos - last_x_);
    const float dy = static_cast<float>(ypos - last_y_);

    last_x_ = xpos;
    last_y_ = ypos;

    if (mouse_locked_) {
        camera_.look(dx, dy);
    }
}

void App::on_framebuffer_resize(int width, int height) {
    if (!scheduler_) {
        return;
    }
    scheduler_->request_recreate(
        {static_cast<uint32_t>(width > 0 ? width : 0), static_cast<uint32_t>(height > 0 ? height : 0)});
}

void App::toggle_mouse_lock() {
    mouse_locked_ = !mouse_locked_;
    first_mouse_ = true;
    glfwSetInputMode(window_, GLFW_CURSOR, mouse_locked_ ? GLFW_CURSOR_DISABLED : GLFW_CURSOR_NORMAL);
}

void App::init_window() {
    if (!glfwInit()) {
        throw std::runtime_error("glfwInit failed");
    }
    glfw_ready_ = true;

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);

    window_ = glfwCreateWindow(
        static_cast<int>(cfg_.width), static_cast<int>(cfg_.height), cfg_.title.c_str(), nullptr, nullptr);
    if (!window_) {
        throw std::runtime_error("glfwCreateWindow failed");
    }

    glfwSetWindowUserPointer(window_, this);
    glfwSetFramebufferSizeCallback(window_, framebuffer_resize_cb);
    glfwSetCursorPosCallback(window_, cursor_pos_cb);
    glfwSetKeyCallback(window_, key_cb);
    glfwSetInputMode(window_, GLFW_CURSOR, GLFW_CURSOR_DISABLED);
}

void App::init_vulkan() {
    ContextOptions opts{};
    opts.app_name = cfg_.title;
    opts.validation = cfg_.validation;
    ctx_.init(window_, opts);

    device_ = std::make_unique<VulkanDevice>(ctx_);
    renderer_ = std::make_unique<Renderer>(*device_, cfg_.renderer());

    VkExtent2D extent = framebuffer_extent(window_);
    if (extent.width == 0 || extent.height == 0) {
        extent = {cfg_.width, cfg_.height};
    }
    if (!renderer_->init(extent)) {
        throw std::runtime_error("window surface is zero-sized at startup");
    }

    scheduler_ = std::make_unique<FrameScheduler>(*renderer_, FrameClock::step_for_rate(cfg_.sim_rate_hz));

    scheduler_->on_step([this](float dt) { camera_.step(read_input(), dt); });
    scheduler_->on_uniforms([this](VkExtent2D ext, double elapsed) {
        return make_frame_uniforms(camera_, ext, elapsed);
    });

    if (cfg_.overlay) {
        overlay_.init(window_,
                      ctx_,
                      device_->raw_render_pass(renderer_->swapchain().render_pass()),
                      renderer_->swapchain().image_count(),
                      renderer_->attachments().samples());
        scheduler_->on_draw([this](VkCommandBuffer cmd) { overlay_.render(cmd); });
    }
}

void App::shutdown() {
    if (renderer_) {
        renderer_->shutdown();
    }
    overlay_.shutdown();
    scheduler_.reset();
    renderer_.reset();
    device_.reset();
    ctx_.shutdown();

    if (window_) {
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
    if (glfw_ready_) {
        glfwTerminate();
        glfw_ready_ = false;
    }
}

CameraInput App::read_input() const {
    CameraInput in{};
    in.forward = glfwGetKey(window_, GLFW_KEY_W) == GLFW_PRESS;
    in.backward = glfwGetKey(window_, GLFW_KEY_S) == GLFW_PRESS;
    in.left = glfwGetKey(window_, GLFW_KEY_A) == GLFW_PRESS;
    in.right = glfwGetKey(window_, GLFW_KEY_D) == GLFW_PRESS;
    in.roll_left = glfwGetKey(window_, GLFW_KEY_Q) == GLFW_PRESS;
    in.roll_right = glfwGetKey(window_, GLFW_KEY_E) == GLFW_PRESS;
    return in;
}

OverlayStats App::overlay_stats() const {
    const FrameStats &s = scheduler_->stats();

    OverlayStats o{};
    o.fps = static_cast<float>(fps_);
    o.presented = s.presented;
    o.sim_steps = s.sim_steps;
    o.recreations = s.recreations;
    o.skipped = s.skipped;
    o.frame_slot = s.last_slot;
    o.image_count = renderer_->swapchain().image_count();
    o.extent = renderer_->swapchain().extent();
    o.sim_time = scheduler_->clock().elapsed_seconds();
    return o;
}

void App::sync_overlay() {
    if (overlay_.active() && renderer_->ready()) {
        overlay_.set_image_count(renderer_->swapchain().image_count());
    }
}

void App::run() {
    init_window();
    init_vulkan();

    auto fps_t0 = std::chrono::steady_clock::now();
    uint64_t fps_presented = 0;

    while (!glfwWindowShouldClose(window_)) {
        glfwPollEvents();

        if (overlay_.active()) {
            overlay_.new_frame(overlay_stats());
        }

        const FrameStatus status = scheduler_->tick();
        sync_overlay();

        // Minimized: block on events instead of spinning on a zero-sized surface.
        if (status == FrameStatus::Skipped && scheduler_->recreate_pending()) {
            glfwWaitEvents();
        }

        const auto now = std::chrono::steady_clock::now();
        const double window = std::chrono::duration<double>(now - fps_t0).count();
        if (window >= 0.5) {
            const uint64_t presented = scheduler_->stats().presented;
            fps_ = static_cast<double>(presented - fps_presented) / window;
            fps_presented = presented;
            fps_t0 = now;
        }
    }

    shutdown();
}
