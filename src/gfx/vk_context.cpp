/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstring>
#include <stdexcept>
#include <vector>

#include "gfx/vk_context.hpp"
#include "util/checks.hpp"
#include "util/log.hpp"

static VKAPI_ATTR VkBool32 VKAPI_CALL dbg_cb(VkDebugUtilsMessageSeverityFlagBitsEXT severity,
                                             VkDebugUtilsMessageTypeFlagsEXT,
                                             const VkDebugUtilsMessengerCallbackDataEXT *cb,
                                             void *) {
    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) {
        log_error("Vulkan: {}", cb->pMessage);
    } else {
        log_warn("Vulkan: {}", cb->pMessage);
    }
    return VK_FALSE;
}

void VkContext::create_debug_messenger() {
    auto vkCreateDebugUtilsMessengerEXT =
        (PFN_vkCreateDebugUtilsMessengerEXT)vkGetInstanceProcAddr(instance_, "vkCreateDebugUtilsMessengerEXT");
    if (!vkCreateDebugUtilsMessengerEXT) {
        return;
    }

    VkDebugUtilsMessengerCreateInfoEXT ci{VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT};
    ci.messageSeverity =
        VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    ci.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                     VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
    ci.pfnUserCallback = dbg_cb;

    vk_check(vkCreateDebugUtilsMessengerEXT(instance_, &ci, nullptr, &messenger_), "vkCreateDebugUtilsMessengerEXT");
}

void VkContext::destroy_debug_messenger() {
    auto vkDestroyDebugUtilsMessengerEXT =
        (PFN_vkDestroyDebugUtilsMessengerEXT)vkGetInstanceProcAddr(instance_, "vkDestroyDebugUtilsMessengerEXT");
    if (vkDestroyDebugUtilsMessengerEXT && messenger_) {
        vkDestroyDebugUtilsMessengerEXT(instance_, messenger_, nullptr);
    }
    messenger_ = VK_NULL_HANDLE;
}

QueueFamilyIndices VkContext::find_queue_families(VkPhysicalDevice dev) {
    QueueFamilyIndices out{};
    uint32_t count = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(dev, &count, nullptr);
    std::vector<VkQueueFamilyProperties> props(count);
    vkGetPhysicalDeviceQueueFamilyProperties(dev, &count, props.data());

    for (uint32_t i = 0; i < count; i++) {
        if (props[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) {
            out.graphics = i;
        }

        VkBool32 present = VK_FALSE;
        vk_check(vkGetPhysicalDeviceSurfaceSupportKHR(dev, i, surface_, &present),
                 "vkGetPhysicalDeviceSurfaceSupportKHR");
        if (present) {
            out.present = i;
        }

        if (out.complete()) {
            break;
        }
    }
    return out;
}

bool VkContext::is_device_suitable(VkPhysicalDevice dev) {
    if (!find_queue_families(dev).complete()) {
        return false;
    }

    uint32_t ext_count = 0;
    vk_check(vkEnumerateDeviceExtensionProperties(dev, nullptr, &ext_count, nullptr),
             "vkEnumerateDeviceExtensionProperties(count)");
    std::vector<VkExtensionProperties> exts(ext_count);
    vk_check(vkEnumerateDeviceExtensionProperties(dev, nullptr, &ext_count, exts.data()),
             "vkEnumerateDeviceExtensionProperties(list)");
    bool has_swapchain = false;
    for (auto &e : exts) {
        if (std::strcmp(e.extensionName, VK_KHR_SWAPCHAIN_EXTENSION_NAME) == 0) {
            has_swapchain = true;
        }
    }
    if (!has_swapchain) {
        return false;
    }

    uint32_t fmt_count = 0;
    uint32_t pm_count = 0;
    vk_check(vkGetPhysicalDeviceSurfaceFormatsKHR(dev, surface_, &fmt_count, nullptr),
             "vkGetPhysicalDeviceSurfaceFormatsKHR(count)");
    vk_check(vkGetPhysicalDeviceSurfacePresentModesKHR(dev, surface_, &pm_count, nullptr),
             "vkGetPhysicalDeviceSurfacePresentModesKHR(count)");
    return fmt_count > 0 && pm_count > 0;
}

void VkContext::init(GLFWwindow *window, const ContextOptions &opts) {
    // Instance
    VkApplicationInfo app{VK_STRUCTURE_TYPE_APPLICATION_INFO};
    app.pApplicationName = opts.app_name.c_str();
    app.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
    app.pEngineName = "vk-orbit";
    app.engineVersion = VK_MAKE_VERSION(0, 1, 0);
    app.apiVersion = VK_API_VERSION_1_3;

    uint32_t glfw_ext_count = 0;
    const char **glfw_exts = glfwGetRequiredInstanceExtensions(&glfw_ext_count);
    if (!glfw_exts) {
        throw std::runtime_error("GLFW: Vulkan surface extensions unavailable");
    }

    std::vector<const char *> exts(glfw_exts, glfw_exts + glfw_ext_count);
    std::vector<const char *> layers;
    if (opts.validation) {
        exts.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
        layers.push_back("VK_LAYER_KHRONOS_validation");
    }

    VkInstanceCreateInfo ici{VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO};
    ici.pApplicationInfo = &app;
    ici.enabledExtensionCount = static_cast<uint32_t>(exts.size());
    ici.ppEnabledExtensionNames = exts.data();
    ici.enabledLayerCount = static_cast<uint32_t>(layers.size());
    ici.ppEnabledLayerNames = layers.empty() ? nullptr : layers.data();

    vk_check(vkCreateInstance(&ici, nullptr, &instance_), "vkCreateInstance");
    if (opts.validation) {
        create_debug_messenger();
    }

    // Surface
    vk_check(glfwCreateWindowSurface(instance_, window, nullptr, &surface_), "glfwCreateWindowSurface");

    // Pick physical device
    uint32_t dev_count = 0;
    vk_check(vkEnumeratePhysicalDevices(instance_, &dev_count, nullptr), "vkEnumeratePhysicalDevices(count)");
    if (dev_count == 0) {
        throw std::runtime_error("No Vulkan physical devices found");
    }

    std::vector<VkPhysicalDevice> devs(dev_count);
    vk_check(vkEnumeratePhysicalDevices(instance_, &dev_count, devs.data()), "vkEnumeratePhysicalDevices(list)");

    for (auto d : devs) {
        if (is_device_suitable(d)) {
            phys_ = d;
            break;
        }
    }
    if (!phys_) {
        throw std::runtime_error("No suitable Vulkan device found");
    }

    vkGetPhysicalDeviceProperties(phys_, &props_);
    vkGetPhysicalDeviceMemoryProperties(phys_, &mem_props_);
    qf_ = find_queue_families(phys_);
    log_info("device: {} (graphics qf {}, present qf {})", props_.deviceName, qf_.graphics, qf_.present);

    // Logical device
    float prio = 1.0f;
    std::vector<VkDeviceQueueCreateInfo> qcis;

    auto make_qci = [&](uint32_t family) {
        VkDeviceQueueCreateInfo qci{VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO};
        qci.queueFamilyIndex = family;
        qci.queueCount = 1;
        qci.pQueuePriorities = &prio;
        return qci;
    };

    qcis.push_back(make_qci(qf_.graphics));
    if (qf_.present != qf_.graphics) {
        qcis.push_back(make_qci(qf_.present));
    }

    std::vector<const char *> dev_exts = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};

    VkPhysicalDeviceFeatures feats{};

    VkDeviceCreateInfo dci{VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO};
    dci.queueCreateInfoCount = static_cast<uint32_t>(qcis.size());
    dci.pQueueCreateInfos = qcis.data();
    dci.enabledExtensionCount = static_cast<uint32_t>(dev_exts.size());
    dci.ppEnabledExtensionNames = dev_exts.data();
    dci.pEnabledFeatures = &feats;

    vk_check(vkCreateDevice(phys_, &dci, nullptr, &device_), "vkCreateDevice");

    vkGetDeviceQueue(device_, qf_.graphics, 0, &graphics_queue_);
    vkGetDeviceQueue(device_, qf_.present, 0, &present_queue_);

    // Command pool (graphics)
    VkCommandPoolCreateInfo cpci{VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO};
    cpci.queueFamilyIndex = qf_.graphics;
    cpci.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    vk_check(vkCreateCommandPool(device_, &cpci, nullptr, &cmd_pool_), "vkCreateCommandPool");
}

void VkContext::shutdown() {
    if (device_) {
        vkDeviceWaitIdle(device_);
        if (cmd_pool_) {
            vkDestroyCommandPool(device_, cmd_pool_, nullptr);
        }
        vkDestroyDevice(device_, nullptr);
    }
    if (instance_) {
        destroy_debug_messenger();
    }
    if (surface_) {
        vkDestroySurfaceKHR(instance_, surface_, nullptr);
    }
    if (instance_) {
        vkDestroyInstance(instance_, nullptr);
    }

    cmd_pool_ = VK_NULL_HANDLE;
    device_ = VK_NULL_HANDLE;
    surface_ = VK_NULL_HANDLE;
    instance_ = VK_NULL_HANDLE;
}
