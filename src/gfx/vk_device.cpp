/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gfx/vk_device.hpp"

#include <array>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

#include "gfx/vk_context.hpp"
#include "util/checks.hpp"
#include "util/log.hpp"

namespace {

template <typename Tag, typename T> T &resolve(HandlePool<Tag, T> &pool, Handle<Tag> h, const char *kind) {
    T *v = pool.get(h);
    if (!v) {
        throw std::runtime_error(std::string("stale or null ") + kind + " handle (slot " + std::to_string(h.slot) +
                                 ", generation " + std::to_string(h.generation) + ")");
    }
    return *v;
}

template <typename Tag, typename T> T take(HandlePool<Tag, T> &pool, Handle<Tag> h, const char *kind) {
    auto v = pool.take(h);
    if (!v) {
        throw std::runtime_error(std::string("release of stale or null ") + kind + " handle");
    }
    return std::move(*v);
}

} // namespace

VulkanDevice::VulkanDevice(VkContext &ctx) : ctx_(ctx) {}

VulkanDevice::~VulkanDevice() { release_all(); }

SurfaceSupport VulkanDevice::query_surface_support() {
    SurfaceSupport s{};
    vk_check(vkGetPhysicalDeviceSurfaceCapabilitiesKHR(ctx_.phys(), ctx_.surface(), &s.caps),
             "vkGetPhysicalDeviceSurfaceCapabilitiesKHR");

    uint32_t fmt_count = 0;
    vk_check(vkGetPhysicalDeviceSurfaceFormatsKHR(ctx_.phys(), ctx_.surface(), &fmt_count, nullptr),
             "vkGetPhysicalDeviceSurfaceFormatsKHR(count)");
    s.formats.resize(fmt_count);
    vk_check(vkGetPhysicalDeviceSurfaceFormatsKHR(ctx_.phys(), ctx_.surface(), &fmt_count, s.formats.data()),
             "vkGetPhysicalDeviceSurfaceFormatsKHR(list)");

    uint32_t pm_count = 0;
    vk_check(vkGetPhysicalDeviceSurfacePresentModesKHR(ctx_.phys(), ctx_.surface(), &pm_count, nullptr),
             "vkGetPhysicalDeviceSurfacePresentModesKHR(count)");
    s.present_modes.resize(pm_count);
    vk_check(vkGetPhysicalDeviceSurfacePresentModesKHR(ctx_.phys(), ctx_.surface(), &pm_count, s.present_modes.data()),
             "vkGetPhysicalDeviceSurfacePresentModesKHR(list)");
    return s;
}

const VkPhysicalDeviceMemoryProperties &VulkanDevice::memory_properties() const { return ctx_.memory_properties(); }

bool VulkanDevice::supports_format(VkFormat format, VkImageTiling tiling, VkFormatFeatureFlags features) {
    VkFormatProperties p{};
    vkGetPhysicalDeviceFormatProperties(ctx_.phys(), format, &p);
    if (tiling == VK_IMAGE_TILING_LINEAR) {
        return (p.linearTilingFeatures & features) == features;
    }
    return (p.optimalTilingFeatures & features) == features;
}

VkSampleCountFlags VulkanDevice::framebuffer_sample_counts() {
    const auto &limits = ctx_.properties().limits;
    return limits.framebufferColorSampleCounts & limits.framebufferDepthSampleCounts;
}

// ---------------------------------------------------------------------------
// Swapchain
// ---------------------------------------------------------------------------

SwapchainHandle VulkanDevice::create_swapchain(const SwapchainDesc &desc) {
    VkSwapchainCreateInfoKHR ci{VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR};
    ci.surface = ctx_.surface();
    ci.minImageCount = desc.min_image_count;
    ci.imageFormat = desc.surface_format.format;
    ci.imageColorSpace = desc.surface_format.colorSpace;
    ci.imageExtent = desc.extent;
    ci.imageArrayLayers = 1;
    ci.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    ci.preTransform = desc.transform;
    ci.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    ci.presentMode = desc.present_mode;
    ci.clipped = VK_TRUE;
    ci.oldSwapchain = VK_NULL_HANDLE;

    uint32_t qfs[] = {ctx_.graphics_qf(), ctx_.present_qf()};
    if (ctx_.graphics_qf() != ctx_.present_qf()) {
        ci.imageSharingMode = VK_SHARING_MODE_CONCURRENT;
        ci.queueFamilyIndexCount = 2;
        ci.pQueueFamilyIndices = qfs;
    } else {
        ci.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    }

    SwapchainEntry e{};
    vk_check(vkCreateSwapchainKHR(ctx_.device(), &ci, nullptr, &e.swapchain), "vkCreateSwapchainKHR");

    uint32_t img_count = 0;
    vk_check(vkGetSwapchainImagesKHR(ctx_.device(), e.swapchain, &img_count, nullptr),
             "vkGetSwapchainImagesKHR(count)");
    std::vector<VkImage> images(img_count);
    vk_check(vkGetSwapchainImagesKHR(ctx_.device(), e.swapchain, &img_count, images.data()),
             "vkGetSwapchainImagesKHR(list)");

    for (auto img : images) {
        e.images.push_back(images_.insert(ImageEntry{img, true}));
    }
    return swapchains_.insert(std::move(e));
}

std::vector<ImageHandle> VulkanDevice::swapchain_images(SwapchainHandle swapchain) {
    return resolve(swapchains_, swapchain, "swapchain").images;
}

void VulkanDevice::destroy_swapchain(SwapchainHandle swapchain) {
    SwapchainEntry e = take(swapchains_, swapchain, "swapchain");
    for (auto img : e.images) {
        images_.take(img);
    }
    vkDestroySwapchainKHR(ctx_.device(), e.swapchain, nullptr);
}

AcquireResult VulkanDevice::acquire_next_image(SwapchainHandle swapchain, SemaphoreHandle signal, uint64_t timeout) {
    AcquireResult r{};
    r.result = vkAcquireNextImageKHR(ctx_.device(),
                                     resolve(swapchains_, swapchain, "swapchain").swapchain,
                                     timeout,
                                     resolve(semaphores_, signal, "semaphore"),
                                     VK_NULL_HANDLE,
                                     &r.image_index);
    return r;
}

VkResult VulkanDevice::present(SwapchainHandle swapchain, uint32_t image_index, SemaphoreHandle wait) {
    VkSemaphore wait_sem = resolve(semaphores_, wait, "semaphore");
    VkSwapchainKHR sc_handle = resolve(swapchains_, swapchain, "swapchain").swapchain;

    VkPresentInfoKHR pi{VK_STRUCTURE_TYPE_PRESENT_INFO_KHR};
    pi.waitSemaphoreCount = 1;
    pi.pWaitSemaphores = &wait_sem;
    pi.swapchainCount = 1;
    pi.pSwapchains = &sc_handle;
    pi.pImageIndices = &image_index;

    return vkQueuePresentKHR(ctx_.present_queue(), &pi);
}

// ---------------------------------------------------------------------------
// Images, buffers, memory
// ---------------------------------------------------------------------------

ImageHandle VulkanDevice::create_image(const ImageDesc &desc) {
    VkImageCreateInfo ici{VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO};
    ici.imageType = VK_IMAGE_TYPE_2D;
    ici.extent = {desc.extent.width, desc.extent.height, 1};
    ici.mipLevels = 1;
    ici.arrayLayers = 1;
    ici.format = desc.format;
    ici.tiling = VK_IMAGE_TILING_OPTIMAL;
    ici.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    ici.usage = desc.usage;
    ici.samples = desc.samples;
    ici.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    VkImage img{};
    vk_check(vkCreateImage(ctx_.device(), &ici, nullptr, &img), "vkCreateImage");
    return images_.insert(ImageEntry{img, false});
}

VkMemoryRequirements VulkanDevice::image_memory_requirements(ImageHandle image) {
    VkMemoryRequirements req{};
    vkGetImageMemoryRequirements(ctx_.device(), resolve(images_, image, "image").image, &req);
    return req;
}

void VulkanDevice::destroy_image(ImageHandle image) {
    if (resolve(images_, image, "image").swapchain_owned) {
        throw std::runtime_error("destroy_image: image belongs to a swapchain");
    }
    vkDestroyImage(ctx_.device(), take(images_, image, "image").image, nullptr);
}

BufferHandle VulkanDevice::create_buffer(const BufferDesc &desc) {
    VkBufferCreateInfo bci{VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO};
    bci.size = desc.size;
    bci.usage = desc.usage;
    bci.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    VkBuffer buf{};
    vk_check(vkCreateBuffer(ctx_.device(), &bci, nullptr, &buf), "vkCreateBuffer");
    return buffers_.insert(buf);
}

VkMemoryRequirements VulkanDevice::buffer_memory_requirements(BufferHandle buffer) {
    VkMemoryRequirements req{};
    vkGetBufferMemoryRequirements(ctx_.device(), resolve(buffers_, buffer, "buffer"), &req);
    return req;
}

void VulkanDevice::destroy_buffer(BufferHandle buffer) {
    vkDestroyBuffer(ctx_.device(), take(buffers_, buffer, "buffer"), nullptr);
}

MemoryHandle VulkanDevice::allocate_memory(VkDeviceSize size, uint32_t type_index) {
    VkMemoryAllocateInfo mai{VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO};
    mai.allocationSize = size;
    mai.memoryTypeIndex = type_index;

    MemoryEntry e{};
    e.size = size;
    vk_check(vkAllocateMemory(ctx_.device(), &mai, nullptr, &e.memory), "vkAllocateMemory");
    return memory_.insert(e);
}

void VulkanDevice::bind_image_memory(ImageHandle image, MemoryHandle memory) {
    vk_check(vkBindImageMemory(ctx_.device(),
                               resolve(images_, image, "image").image,
                               resolve(memory_, memory, "memory").memory,
                               0),
             "vkBindImageMemory");
}

void VulkanDevice::bind_buffer_memory(BufferHandle buffer, MemoryHandle memory) {
    vk_check(vkBindBufferMemory(ctx_.device(),
                                resolve(buffers_, buffer, "buffer"),
                                resolve(memory_, memory, "memory").memory,
                                0),
             "vkBindBufferMemory");
}

void VulkanDevice::write_memory(MemoryHandle memory, const void *data, VkDeviceSize size) {
    const MemoryEntry &e = resolve(memory_, memory, "memory");
    if (size > e.size) {
        throw std::runtime_error("write_memory: write larger than allocation");
    }
    void *mapped = nullptr;
    vk_check(vkMapMemory(ctx_.device(), e.memory, 0, size, 0, &mapped), "vkMapMemory");
    std::memcpy(mapped, data, static_cast<size_t>(size));
    vkUnmapMemory(ctx_.device(), e.memory);
}

void VulkanDevice::free_memory(MemoryHandle memory) {
    vkFreeMemory(ctx_.device(), take(memory_, memory, "memory").memory, nullptr);
}

ImageViewHandle VulkanDevice::create_image_view(ImageHandle image, VkFormat format, VkImageAspectFlags aspect) {
    VkImageViewCreateInfo vci{VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO};
    vci.image = resolve(images_, image, "image").image;
    vci.viewType = VK_IMAGE_VIEW_TYPE_2D;
    vci.format = format;
    vci.subresourceRange.aspectMask = aspect;
    vci.subresourceRange.levelCount = 1;
    vci.subresourceRange.layerCount = 1;

    VkImageView view{};
    vk_check(vkCreateImageView(ctx_.device(), &vci, nullptr, &view), "vkCreateImageView");
    return views_.insert(view);
}

void VulkanDevice::destroy_image_view(ImageViewHandle view) {
    vkDestroyImageView(ctx_.device(), take(views_, view, "image view"), nullptr);
}

// ---------------------------------------------------------------------------
// Render pass / framebuffers
// ---------------------------------------------------------------------------

RenderPassHandle VulkanDevice::create_render_pass(const RenderPassDesc &desc) {
    std::array<VkAttachmentDescription, 3> att{};

    // 0: multisampled color
    att[0].format = desc.color_format;
    att[0].samples = desc.samples;
    att[0].loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
    att[0].storeOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    att[0].stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    att[0].stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    att[0].initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    att[0].finalLayout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;

    // 1: depth
    att[1].format = desc.depth_format;
    att[1].samples = desc.samples;
    att[1].loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
    att[1].storeOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    att[1].stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    att[1].stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    att[1].initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    att[1].finalLayout = VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL;

    // 2: resolve target, the swapchain image
    att[2].format = desc.color_format;
    att[2].samples = VK_SAMPLE_COUNT_1_BIT;
    att[2].loadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    att[2].storeOp = VK_ATTACHMENT_STORE_OP_STORE;
    att[2].stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    att[2].stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    att[2].initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    att[2].finalLayout = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;

    VkAttachmentReference color_ref{0, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL};
    VkAttachmentReference depth_ref{1, VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL};
    VkAttachmentReference resolve_ref{2, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL};

    VkSubpassDescription subpass{};
    subpass.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
    subpass.colorAttachmentCount = 1;
    subpass.pColorAttachments = &color_ref;
    subpass.pDepthStencilAttachment = &depth_ref;
    subpass.pResolveAttachments = &resolve_ref;

    // Color output waits for the acquire semaphore; depth is shared by all in-flight frames.
    VkSubpassDependency dep{};
    dep.srcSubpass = VK_SUBPASS_EXTERNAL;
    dep.dstSubpass = 0;
    dep.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT | VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT |
                       VK_PIPELINE_STAGE_LATE_FRAGMENT_TESTS_BIT;
    dep.dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT | VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT |
                       VK_PIPELINE_STAGE_LATE_FRAGMENT_TESTS_BIT;
    dep.srcAccessMask = VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT;
    dep.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT | VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT;

    VkRenderPassCreateInfo rpci{VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO};
    rpci.attachmentCount = static_cast<uint32_t>(att.size());
    rpci.pAttachments = att.data();
    rpci.subpassCount = 1;
    rpci.pSubpasses = &subpass;
    rpci.dependencyCount = 1;
    rpci.pDependencies = &dep;

    VkRenderPass rp{};
    vk_check(vkCreateRenderPass(ctx_.device(), &rpci, nullptr, &rp), "vkCreateRenderPass");
    return render_passes_.insert(rp);
}

void VulkanDevice::destroy_render_pass(RenderPassHandle render_pass) {
    vkDestroyRenderPass(ctx_.device(), take(render_passes_, render_pass, "render pass"), nullptr);
}

FramebufferHandle VulkanDevice::create_framebuffer(const FramebufferDesc &desc) {
    std::vector<VkImageView> views;
    views.reserve(desc.attachments.size());
    for (auto v : desc.attachments) {
        views.push_back(resolve(views_, v, "image view"));
    }

    VkFramebufferCreateInfo fci{VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO};
    fci.renderPass = resolve(render_passes_, desc.render_pass, "render pass");
    fci.attachmentCount = static_cast<uint32_t>(views.size());
    fci.pAttachments = views.data();
    fci.width = desc.extent.width;
    fci.height = desc.extent.height;
    fci.layers = 1;

    VkFramebuffer fb{};
    vk_check(vkCreateFramebuffer(ctx_.device(), &fci, nullptr, &fb), "vkCreateFramebuffer");
    return framebuffers_.insert(fb);
}

void VulkanDevice::destroy_framebuffer(FramebufferHandle framebuffer) {
    vkDestroyFramebuffer(ctx_.device(), take(framebuffers_, framebuffer, "framebuffer"), nullptr);
}

// ---------------------------------------------------------------------------
// Sync + submission
// ---------------------------------------------------------------------------

SemaphoreHandle VulkanDevice::create_semaphore() {
    VkSemaphoreCreateInfo sci{VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO};
    VkSemaphore s{};
    vk_check(vkCreateSemaphore(ctx_.device(), &sci, nullptr, &s), "vkCreateSemaphore");
    return semaphores_.insert(s);
}

void VulkanDevice::destroy_semaphore(SemaphoreHandle semaphore) {
    vkDestroySemaphore(ctx_.device(), take(semaphores_, semaphore, "semaphore"), nullptr);
}

FenceHandle VulkanDevice::create_fence(bool signaled) {
    VkFenceCreateInfo fci{VK_STRUCTURE_TYPE_FENCE_CREATE_INFO};
    if (signaled) {
        fci.flags = VK_FENCE_CREATE_SIGNALED_BIT;
    }
    VkFence f{};
    vk_check(vkCreateFence(ctx_.device(), &fci, nullptr, &f), "vkCreateFence");
    return fences_.insert(f);
}

void VulkanDevice::destroy_fence(FenceHandle fence) {
    vkDestroyFence(ctx_.device(), take(fences_, fence, "fence"), nullptr);
}

VkResult VulkanDevice::wait_for_fence(FenceHandle fence, uint64_t timeout) {
    VkFence f = resolve(fences_, fence, "fence");
    return vkWaitForFences(ctx_.device(), 1, &f, VK_TRUE, timeout);
}

void VulkanDevice::reset_fence(FenceHandle fence) {
    VkFence f = resolve(fences_, fence, "fence");
    vk_check(vkResetFences(ctx_.device(), 1, &f), "vkResetFences");
}

CommandBufferHandle VulkanDevice::allocate_command_buffer() {
    VkCommandBufferAllocateInfo cai{VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO};
    cai.commandPool = ctx_.command_pool();
    cai.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    cai.commandBufferCount = 1;

    VkCommandBuffer cb{};
    vk_check(vkAllocateCommandBuffers(ctx_.device(), &cai, &cb), "vkAllocateCommandBuffers");
    return cmds_.insert(cb);
}

void VulkanDevice::free_command_buffer(CommandBufferHandle cmd) {
    VkCommandBuffer cb = take(cmds_, cmd, "command buffer");
    vkFreeCommandBuffers(ctx_.device(), ctx_.command_pool(), 1, &cb);
}

void VulkanDevice::record_frame(CommandBufferHandle cmd, const FrameRecording &rec) {
    VkCommandBuffer cb = resolve(cmds_, cmd, "command buffer");

    vk_check(vkResetCommandBuffer(cb, 0), "vkResetCommandBuffer");

    VkCommandBufferBeginInfo cbi{VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO};
    cbi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    vk_check(vkBeginCommandBuffer(cb, &cbi), "vkBeginCommandBuffer");

    std::array<VkClearValue, 3> clear{};
    clear[0].color = rec.clear_color;
    clear[1].depthStencil = {1.0f, 0};
    clear[2].color = rec.clear_color;

    VkRenderPassBeginInfo rpbi{VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO};
    rpbi.renderPass = resolve(render_passes_, rec.render_pass, "render pass");
    rpbi.framebuffer = resolve(framebuffers_, rec.framebuffer, "framebuffer");
    rpbi.renderArea.offset = {0, 0};
    rpbi.renderArea.extent = rec.extent;
    rpbi.clearValueCount = static_cast<uint32_t>(clear.size());
    rpbi.pClearValues = clear.data();

    vkCmdBeginRenderPass(cb, &rpbi, VK_SUBPASS_CONTENTS_INLINE);

    VkViewport vp{};
    vp.width = static_cast<float>(rec.extent.width);
    vp.height = static_cast<float>(rec.extent.height);
    vp.minDepth = 0.0f;
    vp.maxDepth = 1.0f;
    vkCmdSetViewport(cb, 0, 1, &vp);

    VkRect2D sc{};
    sc.extent = rec.extent;
    vkCmdSetScissor(cb, 0, 1, &sc);

    if (rec.draw) {
        rec.draw(cb);
    }

    vkCmdEndRenderPass(cb);
    vk_check(vkEndCommandBuffer(cb), "vkEndCommandBuffer");
}

void VulkanDevice::submit(const SubmitDesc &desc) {
    VkCommandBuffer cb = resolve(cmds_, desc.cmd, "command buffer");
    VkSemaphore wait = resolve(semaphores_, desc.wait, "semaphore");
    VkSemaphore signal = resolve(semaphores_, desc.signal, "semaphore");
    VkFence fence = resolve(fences_, desc.fence, "fence");

    VkPipelineStageFlags wait_stage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;

    VkSubmitInfo si{VK_STRUCTURE_TYPE_SUBMIT_INFO};
    si.waitSemaphoreCount = 1;
    si.pWaitSemaphores = &wait;
    si.pWaitDstStageMask = &wait_stage;
    si.commandBufferCount = 1;
    si.pCommandBuffers = &cb;
    si.signalSemaphoreCount = 1;
    si.pSignalSemaphores = &signal;

    vk_check(vkQueueSubmit(ctx_.graphics_queue(), 1, &si, fence), "vkQueueSubmit");
}

void VulkanDevice::wait_idle() { vk_check(vkDeviceWaitIdle(ctx_.device()), "vkDeviceWaitIdle"); }

VkRenderPass VulkanDevice::raw_render_pass(RenderPassHandle render_pass) {
    return resolve(render_passes_, render_pass, "render pass");
}

void VulkanDevice::release_all() {
    VkDevice dev = ctx_.device();
    if (!dev) {
        return;
    }

    size_t leaked = framebuffers_.live_count() + render_passes_.live_count() + views_.live_count() +
                    buffers_.live_count() + memory_.live_count() + semaphores_.live_count() + fences_.live_count() +
                    cmds_.live_count() + swapchains_.live_count();
    if (leaked == 0) {
        return;
    }
    log_warn("releasing {} device objects still alive at shutdown", leaked);

    vkDeviceWaitIdle(dev);
    framebuffers_.for_each([&](FramebufferHandle, VkFramebuffer fb) { vkDestroyFramebuffer(dev, fb, nullptr); });
    render_passes_.for_each([&](RenderPassHandle, VkRenderPass rp) { vkDestroyRenderPass(dev, rp, nullptr); });
    views_.for_each([&](ImageViewHandle, VkImageView v) { vkDestroyImageView(dev, v, nullptr); });
    images_.for_each([&](ImageHandle, ImageEntry &e) {
        if (!e.swapchain_owned) {
            vkDestroyImage(dev, e.image, nullptr);
        }
    });
    buffers_.for_each([&](BufferHandle, VkBuffer b) { vkDestroyBuffer(dev, b, nullptr); });
    memory_.for_each([&](MemoryHandle, MemoryEntry &e) { vkFreeMemory(dev, e.memory, nullptr); });
    swapchains_.for_each([&](SwapchainHandle, SwapchainEntry &e) { vkDestroySwapchainKHR(dev, e.swapchain, nullptr); });
    semaphores_.for_each([&](SemaphoreHandle, VkSemaphore s) { vkDestroySemaphore(dev, s, nullptr); });
    fences_.for_each([&](FenceHandle, VkFence f) { vkDestroyFence(dev, f, nullptr); });
    cmds_.for_each([&](CommandBufferHandle, VkCommandBuffer cb) { vkFreeCommandBuffers(dev, ctx_.command_pool(), 1, &cb); });
}
