module;

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

module Graphics:MeshStore.Impl;

import :MeshStore;
import :Bounds;

import Core;
import RHI;

namespace Graphics
{
    MeshStore::MeshStore(uint32_t vertexCapacity, uint32_t indexCapacity, uint32_t vertexStride, uint32_t indexWidth)
        : m_VertexCapacity(vertexCapacity)
        , m_IndexCapacity(indexCapacity)
        , m_VertexStride(vertexStride)
        , m_IndexWidth(indexWidth == 2 ? 2u : 4u)
        , m_VertexBuffer("MeshStore.Vertices", size_t(vertexCapacity) * vertexStride,
                         VK_BUFFER_USAGE_VERTEX_BUFFER_BIT)
        , m_IndexBuffer("MeshStore.Indices", size_t(indexCapacity) * (indexWidth == 2 ? 2u : 4u),
                        VK_BUFFER_USAGE_INDEX_BUFFER_BIT)
    {
        if (indexWidth != 2 && indexWidth != 4)
            Core::Log::Warn("MeshStore: unsupported index width {}, using 4 bytes", indexWidth);
    }

    VkIndexType MeshStore::GetIndexType() const
    {
        return m_IndexWidth == 2 ? VK_INDEX_TYPE_UINT16 : VK_INDEX_TYPE_UINT32;
    }

    Core::Expected<MeshId> MeshStore::AddMesh(const std::string& name,
                                              uint32_t vertexCount,
                                              std::span<const std::byte> vertexData,
                                              std::span<const uint32_t> indices,
                                              const std::string& materialName)
    {
        if (vertexData.size() != size_t(vertexCount) * m_VertexStride)
        {
            Core::Log::Error("MeshStore: mesh '{}' has {} vertex bytes, expected {} ({} x {})",
                             name, vertexData.size(), size_t(vertexCount) * m_VertexStride, vertexCount, m_VertexStride);
            return Core::Err<MeshId>(Core::ErrorCode::InvalidArgument);
        }

        if (vertexCount > m_VertexCapacity - m_NextVertex)
        {
            Core::Log::Error("MeshStore: Vertex buffer is full (mesh '{}' needs {}, {} free)",
                             name, vertexCount, m_VertexCapacity - m_NextVertex);
            return Core::Err<MeshId>(Core::ErrorCode::CapacityExceeded);
        }

        if (indices.size() > size_t(m_IndexCapacity - m_NextIndex))
        {
            Core::Log::Error("MeshStore: Index buffer is full (mesh '{}' needs {}, {} free)",
                             name, indices.size(), m_IndexCapacity - m_NextIndex);
            return Core::Err<MeshId>(Core::ErrorCode::CapacityExceeded);
        }

        for (uint32_t index : indices)
        {
            if (index >= vertexCount)
            {
                Core::Log::Error("MeshStore: mesh '{}' references vertex {} of {}", name, index, vertexCount);
                return Core::Err<MeshId>(Core::ErrorCode::InvalidArgument);
            }
        }

        const uint32_t baseVertex = m_NextVertex;
        if (m_IndexWidth == 2 && vertexCount > 0 &&
            size_t(baseVertex) + vertexCount - 1 > std::numeric_limits<uint16_t>::max())
        {
            Core::Log::Error("MeshStore: mesh '{}' does not fit 16-bit indices at base vertex {}", name, baseVertex);
            return Core::Err<MeshId>(Core::ErrorCode::CapacityExceeded);
        }

        MeshResource mesh{};
        mesh.Id = m_NextMeshId++;
        mesh.Name = name;
        mesh.MaterialName = materialName;
        mesh.VertexOffset = baseVertex;
        mesh.VertexPointer = VkDeviceSize(baseVertex) * m_VertexStride;
        mesh.VertexCount = vertexCount;
        mesh.IndexOffset = m_NextIndex;
        mesh.IndexPointer = VkDeviceSize(m_NextIndex) * m_IndexWidth;
        mesh.IndexCount = static_cast<uint32_t>(indices.size());
        mesh.Bounds = ComputeBounds(vertexCount, vertexData);

        m_VertexBuffer.Write(size_t(mesh.VertexPointer), vertexData);

        if (m_IndexWidth == 2)
        {
            std::vector<uint16_t> rebased(indices.size());
            for (size_t i = 0; i < indices.size(); ++i)
                rebased[i] = static_cast<uint16_t>(indices[i] + baseVertex);
            m_IndexBuffer.Write(size_t(mesh.IndexPointer), std::as_bytes(std::span<const uint16_t>(rebased)));
        }
        else
        {
            std::vector<uint32_t> rebased(indices.size());
            for (size_t i = 0; i < indices.size(); ++i)
                rebased[i] = indices[i] + baseVertex;
            m_IndexBuffer.Write(size_t(mesh.IndexPointer), std::as_bytes(std::span<const uint32_t>(rebased)));
        }

        m_NextVertex += vertexCount;
        m_NextIndex += mesh.IndexCount;

        if (!name.empty())
        {
            if (m_MeshesByName.contains(name))
                Core::Log::Warn("MeshStore: mesh name '{}' reused; lookups now return mesh {}", name, mesh.Id);
            m_MeshesByName[name] = mesh.Id;
        }

        Core::Log::Debug("MeshStore: added '{}' (id {}, {} vertices @ {}, {} indices @ {})",
                         name, mesh.Id, vertexCount, baseVertex, mesh.IndexCount, mesh.IndexOffset);

        const MeshId id = mesh.Id;
        m_Meshes.emplace(id, std::move(mesh));
        return id;
    }

    Core::Result MeshStore::RemoveMesh(MeshId id)
    {
        auto it = m_Meshes.find(id);
        if (it == m_Meshes.end())
            return Core::Err(Core::ErrorCode::InvalidHandle);

        const MeshResource& mesh = it->second;
        m_Vacancies.push_back({mesh.VertexPointer, mesh.VertexCount, mesh.IndexPointer, mesh.IndexCount});

        auto byName = m_MeshesByName.find(mesh.Name);
        if (byName != m_MeshesByName.end() && byName->second == id)
            m_MeshesByName.erase(byName);

        m_Meshes.erase(it);
        return Core::Ok();
    }

    const MeshResource* MeshStore::GetMesh(MeshId id) const
    {
        auto it = m_Meshes.find(id);
        return it != m_Meshes.end() ? &it->second : nullptr;
    }

    const MeshResource* MeshStore::FindMesh(const std::string& name) const
    {
        auto it = m_MeshesByName.find(name);
        return it != m_MeshesByName.end() ? GetMesh(it->second) : nullptr;
    }

    std::vector<uint32_t> MeshStore::ReadIndices(const MeshResource& mesh) const
    {
        std::vector<uint32_t> result(mesh.IndexCount);
        for (uint32_t i = 0; i < mesh.IndexCount; ++i)
        {
            const size_t offset = size_t(mesh.IndexPointer) + size_t(i) * m_IndexWidth;
            result[i] = m_IndexWidth == 2 ? m_IndexBuffer.ReadValue<uint16_t>(offset)
                                          : m_IndexBuffer.ReadValue<uint32_t>(offset);
        }
        return result;
    }

    void MeshStore::Bind(RHI::VulkanDevice& device)
    {
        m_VertexBuffer.Bind(device);
        m_IndexBuffer.Bind(device);
    }

    void MeshStore::Flush()
    {
        m_VertexBuffer.Flush();
        m_IndexBuffer.Flush();
    }

    AABB MeshStore::ComputeBounds(uint32_t vertexCount, std::span<const std::byte> vertexData) const
    {
        AABB bounds;
        if (m_VertexStride < sizeof(glm::vec3))
            return bounds;

        for (uint32_t v = 0; v < vertexCount; ++v)
        {
            glm::vec3 position;
            std::memcpy(&position, vertexData.data() + size_t(v) * m_VertexStride, sizeof(glm::vec3));
            bounds = Union(bounds, position);
        }
        return bounds;
    }
}
