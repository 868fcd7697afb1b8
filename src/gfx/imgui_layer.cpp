/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <imgui.h>

#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_vulkan.h>

#include <iterator>
#include <stdexcept>

#include "gfx/imgui_layer.hpp"
#include "gfx/vk_context.hpp"
#include "util/checks.hpp"

namespace {

VkDescriptorPool create_imgui_descriptor_pool(VkDevice device) {
    const VkDescriptorPoolSize pool_sizes[] = {
        {VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 16},
    };

    VkDescriptorPoolCreateInfo info{VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO};
    info.flags = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
    info.maxSets = 16;
    info.poolSizeCount = static_cast<uint32_t>(std::size(pool_sizes));
    info.pPoolSizes = pool_sizes;

    VkDescriptorPool pool = VK_NULL_HANDLE;
    vk_check(vkCreateDescriptorPool(device, &info, nullptr, &pool), "vkCreateDescriptorPool");
    return pool;
}

} // namespace

void ImGuiLayer::init(GLFWwindow *window,
                      const VkContext &ctx,
                      VkRenderPass render_pass,
                      uint32_t image_count,
                      VkSampleCountFlagBits samples) {
    device_ = ctx.device();
    image_count_ = image_count;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGui::GetIO().IniFilename = nullptr;

    descriptor_pool_ = create_imgui_descriptor_pool(device_);
    ImGui_ImplGlfw_InitForVulkan(window, true);

    ImGui_ImplVulkan_InitInfo init_info{};
    init_info.ApiVersion = VK_API_VERSION_1_3;
    init_info.Instance = ctx.instance();
    init_info.PhysicalDevice = ctx.phys();
    init_info.Device = device_;
    init_info.QueueFamily = ctx.graphics_qf();
    init_info.Queue = ctx.graphics_queue();

    init_info.DescriptorPool = descriptor_pool_;
    init_info.DescriptorPoolSize = 0;

    init_info.MinImageCount = image_count;
    init_info.ImageCount = image_count;

    // Attachment formats and sample counts never change across rebuilds, so the
    // pipeline stays compatible with every later render pass.
    init_info.PipelineInfoMain.RenderPass = render_pass;
    init_info.PipelineInfoMain.Subpass = 0;
    init_info.PipelineInfoMain.MSAASamples = samples;

    init_info.UseDynamicRendering = false;

    init_info.PipelineCache = VK_NULL_HANDLE;
    init_info.Allocator = nullptr;
    init_info.CheckVkResultFn = nullptr;
    init_info.MinAllocationSize = 0;

    if (!ImGui_ImplVulkan_Init(&init_info)) {
        throw std::runtime_error("ImGui_ImplVulkan_Init failed");
    }
}

void ImGuiLayer::set_image_count(uint32_t image_count) {
    if (!active() || image_count == image_count_) {
        return;
    }
    ImGui_ImplVulkan_SetMinImageCount(image_count);
    image_count_ = image_count;
}

void ImGuiLayer::new_frame(const OverlayStats &stats) {
    ImGui_ImplVulkan_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();

    ImGui::SetNextWindowPos(ImVec2(10.0f, 10.0f), ImGuiCond_Always);
    ImGui::SetNextWindowBgAlpha(0.6f);
    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize |
                                   ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoFocusOnAppearing |
                                   ImGuiWindowFlags_NoNav | ImGuiWindowFlags_NoMove;
    if (ImGui::Begin("frame", nullptr, flags)) {
        ImGui::Text("%.1f fps", stats.fps);
        ImGui::Text("extent      %ux%u", stats.extent.width, stats.extent.height);
        ImGui::Text("images      %u", stats.image_count);
        ImGui::Text("frame slot  %u", stats.frame_slot);
        ImGui::Separator();
        ImGui::Text("presented   %llu", static_cast<unsigned long long>(stats.presented));
        ImGui::Text("sim steps   %llu", static_cast<unsigned long long>(stats.sim_steps));
        ImGui::Text("sim time    %.2f s", stats.sim_time);
        ImGui::Text("recreated   %llu", static_cast<unsigned long long>(stats.recreations));
        ImGui::Text("skipped     %llu", static_cast<unsigned long long>(stats.skipped));
    }
    ImGui::End();
    ImGui::Render();
}

void ImGuiLayer::render(VkCommandBuffer cmd) { ImGui_ImplVulkan_RenderDrawData(ImGui::GetDrawData(), cmd); }

void ImGuiLayer::shutdown() {
    if (device_ == VK_NULL_HANDLE) {
        return;
    }

    ImGui_ImplVulkan_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    if (descriptor_pool_ != VK_NULL_HANDLE) {
        vkDestroyDescriptorPool(device_, descriptor_pool_, nullptr);
        descriptor_pool_ = VK_NULL_HANDLE;
    }

    device_ = VK_NULL_HANDLE;
}
