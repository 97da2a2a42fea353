module;
#include <algorithm>
#include <cstddef>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include "RHI.Vulkan.hpp"

module RHI:MirroredBuffer.Impl;
import :MirroredBuffer;
import :Buffer;
import :Device;
import Core;

namespace RHI {

    MirroredBuffer::MirroredBuffer(std::string debugName, size_t sizeBytes, VkBufferUsageFlags usage)
        : m_DebugName(std::move(debugName))
        , m_Usage(usage)
        , m_Shadow(sizeBytes, std::byte{0})
    {
    }

    MirroredBuffer::~MirroredBuffer() = default;

    void MirroredBuffer::Bind(VulkanDevice& device)
    {
        // Vulkan rejects zero-sized buffers.
        const size_t gpuSize = std::max<size_t>(m_Shadow.size(), 4);
        auto buffer = std::make_unique<VulkanBuffer>(device, gpuSize, m_Usage, VMA_MEMORY_USAGE_CPU_TO_GPU);
        if (buffer->GetHandle() == VK_NULL_HANDLE || !buffer->IsHostVisible())
        {
            Core::Log::Error("MirroredBuffer[{}]: failed to create a host-visible GPU buffer ({} bytes)",
                             m_DebugName, gpuSize);
            return;
        }

        m_GpuBuffer = std::move(buffer);
        MarkDirty(0, m_Shadow.size());
        Core::Log::Debug("MirroredBuffer[{}]: bound {} bytes", m_DebugName, gpuSize);
    }

    bool MirroredBuffer::CheckRange(const char* op, size_t offset, size_t size) const
    {
        if (offset > m_Shadow.size() || size > m_Shadow.size() - offset)
        {
            Core::Log::Error("MirroredBuffer[{}]::{}(): Out of bounds. size={} offset={} cap={}",
                             m_DebugName, op, size, offset, m_Shadow.size());
            return false;
        }
        return true;
    }

    void MirroredBuffer::MarkDirty(size_t offset, size_t size)
    {
        if (size == 0) return;

        if (!IsDirty())
        {
            m_DirtyBegin = offset;
            m_DirtyEnd = offset + size;
            return;
        }

        m_DirtyBegin = std::min(m_DirtyBegin, offset);
        m_DirtyEnd = std::max(m_DirtyEnd, offset + size);
    }

    void MirroredBuffer::Write(size_t offset, std::span<const std::byte> bytes)
    {
        if (bytes.empty() || !CheckRange("Write", offset, bytes.size())) return;

        std::memcpy(m_Shadow.data() + offset, bytes.data(), bytes.size());
        MarkDirty(offset, bytes.size());
    }

    void MirroredBuffer::Fill(size_t offset, size_t size, std::byte value)
    {
        if (size == 0 || !CheckRange("Fill", offset, size)) return;

        std::fill_n(m_Shadow.begin() + static_cast<std::ptrdiff_t>(offset), size, value);
        MarkDirty(offset, size);
    }

    void MirroredBuffer::Move(size_t dstOffset, size_t srcOffset, size_t size)
    {
        if (size == 0) return;
        if (!CheckRange("Move", srcOffset, size) || !CheckRange("Move", dstOffset, size)) return;

        std::memmove(m_Shadow.data() + dstOffset, m_Shadow.data() + srcOffset, size);
        MarkDirty(dstOffset, size);
    }

    void MirroredBuffer::Read(size_t offset, std::span<std::byte> out) const
    {
        if (out.empty() || !CheckRange("Read", offset, out.size())) return;

        std::memcpy(out.data(), m_Shadow.data() + offset, out.size());
    }

    void MirroredBuffer::Flush()
    {
        if (!IsDirty()) return;

        if (m_GpuBuffer)
        {
            m_GpuBuffer->Write(m_Shadow.data() + m_DirtyBegin, m_DirtyEnd - m_DirtyBegin, m_DirtyBegin);
        }

        m_DirtyBegin = 0;
        m_DirtyEnd = 0;
    }

    VkBuffer MirroredBuffer::GetHandle() const
    {
        return m_GpuBuffer ? m_GpuBuffer->GetHandle() : VK_NULL_HANDLE;
    }
}
