module;
#include <cstdint>
#include <cstring>
#include <limits>
#include "RHI.Vulkan.hpp"

export module RHI:Buffer;

import :Device;
import Core.Logging; // For Core::Log::Error in inline Write/Read methods

export namespace RHI {
    class VulkanBuffer {
    public:
        // usage: VertexBuffer, IndexBuffer, StorageBuffer, etc.
        // memoryUsage: CPU_TO_GPU buffers are persistently mapped at creation.
        VulkanBuffer(VulkanDevice& device, size_t size, VkBufferUsageFlags usage, VmaMemoryUsage memoryUsage);
        ~VulkanBuffer();

        // Disable copy
        VulkanBuffer(const VulkanBuffer&) = delete;
        VulkanBuffer& operator=(const VulkanBuffer&) = delete;

        [[nodiscard]] VkBuffer GetHandle() const { return m_Buffer; }
        [[nodiscard]] void* GetMappedData() const { return m_MappedData; }
        [[nodiscard]] bool IsHostVisible() const { return m_MappedData != nullptr; }
        [[nodiscard]] size_t GetSizeBytes() const { return m_SizeBytes; }

        void Write(const void* data, size_t size, size_t offset = 0)
        {
            if (!data || size == 0) return;
            if (offset + size > m_SizeBytes)
            {
                Core::Log::Error("VulkanBuffer::Write(): Out of bounds. size={} offset={} cap={}", size, offset, m_SizeBytes);
                return;
            }

            if (!m_MappedData)
            {
                Core::Log::Error("VulkanBuffer::Write(): buffer={} is not host-visible. size={} offset={}",
                                 (void*)m_Buffer, size, offset);
                return;
            }

            std::memcpy(static_cast<uint8_t*>(m_MappedData) + offset, data, size);

            // Flush host writes. Safe for coherent memory too (no-op in driver/VMA).
            Flush(offset, size);
        }

        void Flush(size_t offset = 0, size_t size = std::numeric_limits<size_t>::max());

    private:
        VulkanDevice& m_Device;
        VkBuffer m_Buffer = VK_NULL_HANDLE;
        VmaAllocation m_Allocation = VK_NULL_HANDLE;

        // The persistent pointer. nullptr if memory is GPU-only.
        void* m_MappedData = nullptr;

        size_t m_SizeBytes = 0;
    };
}
