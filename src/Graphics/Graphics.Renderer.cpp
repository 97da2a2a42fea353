module;

#include <string>
#include <unordered_map>

#include "RHI.Vulkan.hpp"

module Graphics:Renderer.Impl;

import :Renderer;
import :InstanceStore;
import :MaterialStore;
import :MeshStore;
import :TextureAtlas;
import Core;
import RHI;

namespace Graphics
{
    Renderer::Renderer(const RendererConfig& config)
        : m_Config(config)
        , m_Instances(config.InstanceCapacity)
        , m_Meshes(config.VertexCapacity, config.IndexCapacity, config.VertexStride, config.IndexWidth)
        , m_Atlas(config.Atlas)
        , m_Materials(config.MaterialCapacity, m_Atlas)
    {
        Core::Log::Info("Renderer: {} instances, {} vertices x {} B, {} indices x {} B, {} materials",
                        config.InstanceCapacity, config.VertexCapacity, config.VertexStride,
                        config.IndexCapacity, config.IndexWidth, config.MaterialCapacity);
    }

    void Renderer::RegisterPipeline(const std::string& name, const RHI::PipelineHandle& pipeline)
    {
        if (m_Pipelines.contains(name))
            Core::Log::Warn("Renderer: pipeline '{}' replaced", name);
        m_Pipelines[name] = pipeline;
    }

    const RHI::PipelineHandle* Renderer::FindPipeline(const std::string& name) const
    {
        auto it = m_Pipelines.find(name);
        return it != m_Pipelines.end() ? &it->second : nullptr;
    }

    void Renderer::BindDevice(RHI::VulkanDevice& device)
    {
        if (m_Device)
        {
            Core::Log::Warn("Renderer: device already bound");
            return;
        }

        m_Device = &device;
        m_Instances.Bind(device);
        m_Meshes.Bind(device);
        m_Atlas.Bind(device);
        m_Materials.Bind(device);
    }

    void Renderer::Flush()
    {
        m_Instances.Flush();
        m_Meshes.Flush();
        m_Atlas.Flush();
        m_Materials.Flush();
    }
}
