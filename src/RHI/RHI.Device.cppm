module;
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI:Device;

import :Context;

namespace RHI
{
    export struct QueueFamilyIndices
    {
        std::optional<uint32_t> GraphicsFamily;

        bool IsComplete() const
        {
            return GraphicsFamily.has_value();
        }
    };

    // Logical device with a single graphics queue and a VMA allocator.
    // Scene buffers are host-visible and written in place, so no transfer
    // queue or swapchain support is requested.
    export class VulkanDevice
    {
    public:
        explicit VulkanDevice(VulkanContext& context);
        ~VulkanDevice();

        // No copy
        VulkanDevice(const VulkanDevice&) = delete;
        VulkanDevice& operator=(const VulkanDevice&) = delete;

        [[nodiscard]] VkDevice GetLogicalDevice() const { return m_Device; }
        [[nodiscard]] VkPhysicalDevice GetPhysicalDevice() const { return m_PhysicalDevice; }
        [[nodiscard]] VkQueue GetGraphicsQueue() const { return m_GraphicsQueue; }
        [[nodiscard]] QueueFamilyIndices GetQueueIndices() const { return m_Indices; }
        [[nodiscard]] VmaAllocator GetAllocator() const { return m_Allocator; }
        [[nodiscard]] bool IsValid() const { return m_IsValid; }
        [[nodiscard]] constexpr uint32_t GetFramesInFlight() const { return MAX_FRAMES_IN_FLIGHT; }

        // Runs every destructor queued for this frame slot. Call once the GPU
        // has retired the frame that last used them.
        void FlushDeletionQueue(uint32_t frameIndex);
        void SafeDestroy(std::function<void()>&& deleteFn);

    private:
        VkPhysicalDevice m_PhysicalDevice = VK_NULL_HANDLE;
        VkDevice m_Device = VK_NULL_HANDLE;

        VkQueue m_GraphicsQueue = VK_NULL_HANDLE;
        QueueFamilyIndices m_Indices;

        VmaAllocator m_Allocator = VK_NULL_HANDLE;

        bool m_IsValid = true;

        static constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 2;
        std::vector<std::function<void()>> m_DeletionQueue[MAX_FRAMES_IN_FLIGHT];
        uint32_t m_CurrentFrameIndex = 0;
        std::mutex m_DeletionMutex;

        void PickPhysicalDevice(VkInstance instance);
        void CreateLogicalDevice(VulkanContext& context);

        QueueFamilyIndices FindQueueFamilies(VkPhysicalDevice device);
    };
}
