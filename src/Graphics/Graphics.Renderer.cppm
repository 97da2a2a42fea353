module;

#include <cstdint>
#include <string>
#include <unordered_map>

#include "RHI.Vulkan.hpp"

export module Graphics:Renderer;

import :InstanceStore;
import :MaterialStore;
import :MeshStore;
import :TextureAtlas;
import Core;
import RHI;

export namespace Graphics
{
    struct RendererConfig
    {
        uint32_t InstanceCapacity = 5000;
        uint32_t VertexCapacity = 20000;
        uint32_t IndexCapacity = 50000;
        uint32_t VertexStride = RHI::SceneVertexLayout::VertexStride;
        uint32_t IndexWidth = 4;     // bytes, 2 or 4
        uint32_t MaterialCapacity = 100;
        TextureAtlasConfig Atlas{};
    };

    // Shared GPU-facing state for any number of scene graphs: the instance,
    // mesh, material and texture stores and the named pipeline table.
    class Renderer
    {
    public:
        explicit Renderer(const RendererConfig& config = {});

        Renderer(const Renderer&) = delete;
        Renderer& operator=(const Renderer&) = delete;

        [[nodiscard]] const RendererConfig& GetConfig() const { return m_Config; }

        [[nodiscard]] InstanceStore& GetInstanceStore() { return m_Instances; }
        [[nodiscard]] const InstanceStore& GetInstanceStore() const { return m_Instances; }
        [[nodiscard]] MeshStore& GetMeshStore() { return m_Meshes; }
        [[nodiscard]] const MeshStore& GetMeshStore() const { return m_Meshes; }
        [[nodiscard]] TextureAtlas& GetAtlas() { return m_Atlas; }
        [[nodiscard]] const TextureAtlas& GetAtlas() const { return m_Atlas; }
        [[nodiscard]] MaterialStore& GetMaterialStore() { return m_Materials; }
        [[nodiscard]] const MaterialStore& GetMaterialStore() const { return m_Materials; }

        // Pipelines are compiled elsewhere; the renderer only names them.
        void RegisterPipeline(const std::string& name, const RHI::PipelineHandle& pipeline);
        [[nodiscard]] const RHI::PipelineHandle* FindPipeline(const std::string& name) const;

        // Creates the GPU side of every store. Until then all data lives in
        // the CPU shadows only.
        void BindDevice(RHI::VulkanDevice& device);
        [[nodiscard]] bool IsDeviceBound() const { return m_Device != nullptr; }

        void Flush();

    private:
        RendererConfig m_Config;
        RHI::VulkanDevice* m_Device = nullptr;

        InstanceStore m_Instances;
        MeshStore m_Meshes;
        TextureAtlas m_Atlas;
        MaterialStore m_Materials;

        std::unordered_map<std::string, RHI::PipelineHandle> m_Pipelines;
    };
}
