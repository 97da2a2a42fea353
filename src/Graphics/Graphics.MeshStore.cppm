module;

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "RHI.Vulkan.hpp"

export module Graphics:MeshStore;

import :Bounds;
import Core;
import RHI;

export namespace Graphics
{
    using MeshId = uint32_t;

    // Where one mesh lives inside the shared vertex/index buffers.
    struct MeshResource
    {
        MeshId Id = 0;
        std::string Name;
        std::string MaterialName;    // default material for model nodes using this mesh

        uint32_t VertexOffset = 0;   // base vertex, in vertices
        VkDeviceSize VertexPointer = 0; // in bytes
        uint32_t VertexCount = 0;

        uint32_t IndexOffset = 0;    // first index, in indices
        VkDeviceSize IndexPointer = 0;  // in bytes
        uint32_t IndexCount = 0;

        AABB Bounds;                 // local space, from the position attribute
    };

    struct MeshVacancy
    {
        VkDeviceSize VertexPointer = 0;
        uint32_t VertexCount = 0;
        VkDeviceSize IndexPointer = 0;
        uint32_t IndexCount = 0;
    };

    // Append-only arena over one shared vertex buffer and one shared index
    // buffer. Indices are rebased by the mesh's base vertex on insertion, so
    // every draw can use vertexOffset = 0.
    //
    // Removed meshes leave vacancies that are recorded but never refilled.
    class MeshStore
    {
    public:
        // indexWidth is 2 (uint16) or 4 (uint32) bytes. Vertices start with
        // three floats of position.
        MeshStore(uint32_t vertexCapacity, uint32_t indexCapacity, uint32_t vertexStride, uint32_t indexWidth = 4);

        MeshStore(const MeshStore&) = delete;
        MeshStore& operator=(const MeshStore&) = delete;

        [[nodiscard]] Core::Expected<MeshId> AddMesh(const std::string& name,
                                                     uint32_t vertexCount,
                                                     std::span<const std::byte> vertexData,
                                                     std::span<const uint32_t> indices,
                                                     const std::string& materialName = {});

        Core::Result RemoveMesh(MeshId id);

        [[nodiscard]] const MeshResource* GetMesh(MeshId id) const;
        [[nodiscard]] const MeshResource* FindMesh(const std::string& name) const;

        [[nodiscard]] uint32_t GetVertexStride() const { return m_VertexStride; }
        [[nodiscard]] uint32_t GetIndexWidth() const { return m_IndexWidth; }
        [[nodiscard]] VkIndexType GetIndexType() const;
        [[nodiscard]] uint32_t GetVertexCount() const { return m_NextVertex; }
        [[nodiscard]] uint32_t GetIndexCount() const { return m_NextIndex; }
        [[nodiscard]] const std::vector<MeshVacancy>& GetVacancies() const { return m_Vacancies; }

        // Index values as stored (already rebased), widened to uint32.
        [[nodiscard]] std::vector<uint32_t> ReadIndices(const MeshResource& mesh) const;

        [[nodiscard]] RHI::MirroredBuffer& GetVertexBuffer() { return m_VertexBuffer; }
        [[nodiscard]] RHI::MirroredBuffer& GetIndexBuffer() { return m_IndexBuffer; }
        [[nodiscard]] const RHI::MirroredBuffer& GetVertexBuffer() const { return m_VertexBuffer; }
        [[nodiscard]] const RHI::MirroredBuffer& GetIndexBuffer() const { return m_IndexBuffer; }

        void Bind(RHI::VulkanDevice& device);
        void Flush();

    private:
        [[nodiscard]] AABB ComputeBounds(uint32_t vertexCount, std::span<const std::byte> vertexData) const;

        uint32_t m_VertexCapacity = 0;
        uint32_t m_IndexCapacity = 0;
        uint32_t m_VertexStride = 0;
        uint32_t m_IndexWidth = 4;

        uint32_t m_NextVertex = 0;
        uint32_t m_NextIndex = 0;
        MeshId m_NextMeshId = 0;

        std::unordered_map<MeshId, MeshResource> m_Meshes;
        std::unordered_map<std::string, MeshId> m_MeshesByName;
        std::vector<MeshVacancy> m_Vacancies;

        RHI::MirroredBuffer m_VertexBuffer;
        RHI::MirroredBuffer m_IndexBuffer;
    };
}
