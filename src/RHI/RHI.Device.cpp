module;
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

#include "RHI.Vulkan.hpp"

module RHI:Device.Impl;
import :Device;
import :Context;
import Core;

namespace RHI
{
    VulkanDevice::VulkanDevice(VulkanContext& context)
    {
        if (!context.IsValid())
        {
            Core::Log::Error("VulkanDevice: context has no instance.");
            m_IsValid = false;
            return;
        }

        PickPhysicalDevice(context.GetInstance());

        // Abort initialization if no physical device was selected
        if (m_PhysicalDevice == VK_NULL_HANDLE) {
            m_IsValid = false;
            return;
        }

        CreateLogicalDevice(context);

        if (m_Device == VK_NULL_HANDLE) {
            m_IsValid = false;
        }
    }

    VulkanDevice::~VulkanDevice()
    {
        // 1. Wait for GPU to stop
        if (m_Device) vkDeviceWaitIdle(m_Device);

        // 2. Flush ALL Deletion Queues
        {
            std::lock_guard lock(m_DeletionMutex);
            for (auto& queue : m_DeletionQueue)
            {
                for (auto& fn : queue) fn();
                queue.clear();
            }
        }

        // 3. Destroy allocator, then device
        if (m_Allocator) vmaDestroyAllocator(m_Allocator);
        if (m_Device) vkDestroyDevice(m_Device, nullptr);
    }

    void VulkanDevice::FlushDeletionQueue(uint32_t frameIndex)
    {
        std::lock_guard lock(m_DeletionMutex);
        m_CurrentFrameIndex = frameIndex % MAX_FRAMES_IN_FLIGHT;
        auto& queue = m_DeletionQueue[m_CurrentFrameIndex];
        for (auto& fn : queue) fn();
        queue.clear();
    }

    void VulkanDevice::SafeDestroy(std::function<void()>&& deleteFn)
    {
        std::lock_guard lock(m_DeletionMutex);
        m_DeletionQueue[m_CurrentFrameIndex].push_back(std::move(deleteFn));
    }

    void VulkanDevice::PickPhysicalDevice(VkInstance instance)
    {
        uint32_t deviceCount = 0;
        vkEnumeratePhysicalDevices(instance, &deviceCount, nullptr);

        if (deviceCount == 0)
        {
            Core::Log::Error("Failed to find GPUs with Vulkan support!");
            m_IsValid = false;
            return;
        }

        std::vector<VkPhysicalDevice> devices(deviceCount);
        vkEnumeratePhysicalDevices(instance, &deviceCount, devices.data());

        for (const auto& device : devices)
        {
            VkPhysicalDeviceProperties props;
            vkGetPhysicalDeviceProperties(device, &props);

            if (FindQueueFamilies(device).IsComplete())
            {
                m_PhysicalDevice = device;
                Core::Log::Info("Selected GPU: {}", props.deviceName);
                return;
            }

            Core::Log::Warn("GPU '{}' rejected: No Graphics Queue.", props.deviceName);
        }

        Core::Log::Error("Failed to find a suitable GPU! Checked {} devices.", deviceCount);
        m_IsValid = false;
    }

    void VulkanDevice::CreateLogicalDevice(VulkanContext& context)
    {
        m_Indices = FindQueueFamilies(m_PhysicalDevice);

        float queuePriority = 1.0f;
        VkDeviceQueueCreateInfo queueCreateInfo{};
        queueCreateInfo.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        queueCreateInfo.queueFamilyIndex = m_Indices.GraphicsFamily.value();
        queueCreateInfo.queueCount = 1;
        queueCreateInfo.pQueuePriorities = &queuePriority;

        VkPhysicalDeviceFeatures features{};

        VkDeviceCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
        createInfo.queueCreateInfoCount = 1;
        createInfo.pQueueCreateInfos = &queueCreateInfo;
        createInfo.pEnabledFeatures = &features;
        createInfo.enabledExtensionCount = 0;
        createInfo.enabledLayerCount = 0;

        if (vkCreateDevice(m_PhysicalDevice, &createInfo, nullptr, &m_Device) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create logical device!");
            m_Device = VK_NULL_HANDLE;
            m_IsValid = false;
            return;
        }

        volkLoadDevice(m_Device);

        VmaVulkanFunctions vulkanFunctions = {};
        vulkanFunctions.vkGetInstanceProcAddr = vkGetInstanceProcAddr;
        vulkanFunctions.vkGetDeviceProcAddr = vkGetDeviceProcAddr;

        VmaAllocatorCreateInfo allocatorInfo = {};
        allocatorInfo.vulkanApiVersion = VK_API_VERSION_1_3;
        allocatorInfo.physicalDevice = m_PhysicalDevice;
        allocatorInfo.device = m_Device;
        allocatorInfo.instance = context.GetInstance();
        allocatorInfo.pVulkanFunctions = &vulkanFunctions;

        if (vmaCreateAllocator(&allocatorInfo, &m_Allocator) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create VMA allocator!");
            m_IsValid = false;
            return;
        }

        vkGetDeviceQueue(m_Device, m_Indices.GraphicsFamily.value(), 0, &m_GraphicsQueue);
    }

    QueueFamilyIndices VulkanDevice::FindQueueFamilies(VkPhysicalDevice device)
    {
        QueueFamilyIndices indices;
        uint32_t queueFamilyCount = 0;

        vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, nullptr);

        std::vector<VkQueueFamilyProperties> queueFamilies(queueFamilyCount);
        vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, queueFamilies.data());

        uint32_t i = 0;
        for (const auto& queueFamily : queueFamilies)
        {
            if (queueFamily.queueFlags & VK_QUEUE_GRAPHICS_BIT)
            {
                indices.GraphicsFamily = i;
                break;
            }
            i++;
        }
        return indices;
    }
}
