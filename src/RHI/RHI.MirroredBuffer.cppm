module;
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <type_traits>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI:MirroredBuffer;

import :Buffer;
import :Device;

export namespace RHI {

    // CPU shadow of a GPU buffer.
    //
    // All writes land in the shadow and widen a single dirty byte range.
    // Flush() copies that range into the bound VulkanBuffer. Until a device is
    // bound the shadow is the only copy and Flush() just clears the range.
    class MirroredBuffer {
    public:
        MirroredBuffer(std::string debugName, size_t sizeBytes, VkBufferUsageFlags usage);
        ~MirroredBuffer();

        MirroredBuffer(const MirroredBuffer&) = delete;
        MirroredBuffer& operator=(const MirroredBuffer&) = delete;

        // Creates the host-visible GPU side and marks the whole buffer dirty.
        void Bind(VulkanDevice& device);
        [[nodiscard]] bool IsBound() const { return m_GpuBuffer != nullptr; }

        void Write(size_t offset, std::span<const std::byte> bytes);
        void Fill(size_t offset, size_t size, std::byte value = std::byte{0});
        // memmove semantics; source and destination may overlap.
        void Move(size_t dstOffset, size_t srcOffset, size_t size);
        void Read(size_t offset, std::span<std::byte> out) const;

        template<typename T>
        void WriteValue(size_t offset, const T& value)
        {
            static_assert(std::is_trivially_copyable_v<T>);
            Write(offset, std::as_bytes(std::span<const T, 1>(&value, 1)));
        }

        template<typename T>
        [[nodiscard]] T ReadValue(size_t offset) const
        {
            static_assert(std::is_trivially_copyable_v<T>);
            T value{};
            Read(offset, std::as_writable_bytes(std::span<T, 1>(&value, 1)));
            return value;
        }

        // Uploads the dirty range (if bound) and clears it.
        void Flush();

        [[nodiscard]] bool IsDirty() const { return m_DirtyEnd > m_DirtyBegin; }
        [[nodiscard]] size_t GetDirtyOffset() const { return m_DirtyBegin; }
        [[nodiscard]] size_t GetDirtySize() const { return m_DirtyEnd - m_DirtyBegin; }

        [[nodiscard]] std::span<const std::byte> GetShadow() const { return m_Shadow; }
        [[nodiscard]] size_t GetSizeBytes() const { return m_Shadow.size(); }
        [[nodiscard]] const std::string& GetDebugName() const { return m_DebugName; }

        // VK_NULL_HANDLE until Bind() succeeded.
        [[nodiscard]] VkBuffer GetHandle() const;

    private:
        [[nodiscard]] bool CheckRange(const char* op, size_t offset, size_t size) const;
        void MarkDirty(size_t offset, size_t size);

        std::string m_DebugName;
        VkBufferUsageFlags m_Usage = 0;
        std::vector<std::byte> m_Shadow;
        std::unique_ptr<VulkanBuffer> m_GpuBuffer;

        size_t m_DirtyBegin = 0;
        size_t m_DirtyEnd = 0;
    };
}
