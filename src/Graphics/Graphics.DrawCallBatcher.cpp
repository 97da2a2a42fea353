module;

#include <cstdint>
#include <format>
#include <string>
#include <utility>
#include <vector>

#include "RHI.Vulkan.hpp"

module Graphics:DrawCallBatcher.Impl;

import :DrawCallBatcher;
import :GpuLayouts;
import :InstanceStore;
import :MeshStore;
import :Renderer;
import Core;
import RHI;

namespace Graphics
{
    DrawCallBatcher::DrawCallBatcher(const Renderer& renderer, std::string label)
        : m_Renderer(renderer)
        , m_Label(std::move(label))
    {
    }

    uint32_t DrawCallBatcher::AddModel(const std::string& modelName, const MeshResource& mesh,
                                       const std::string& pipelineName, AllocationId allocation)
    {
        const MeshStore& meshes = m_Renderer.GetMeshStore();

        DrawCallDescriptor drawCall{};
        drawCall.Id = static_cast<uint32_t>(m_DrawCalls.size());
        drawCall.Label = std::format("SceneGraph[{}]::DrawCall#{}[{}]", m_Label, drawCall.Id, modelName);
        drawCall.PipelineName = pipelineName;
        drawCall.VertexPointer = mesh.VertexPointer;
        drawCall.VertexCount = mesh.VertexCount;
        drawCall.IndexType = meshes.GetIndexType();
        drawCall.IndexPointer = mesh.IndexPointer;
        drawCall.IndexOffset = mesh.IndexOffset;
        drawCall.IndexCount = mesh.IndexCount;
        drawCall.Allocation = allocation;

        if (!m_Renderer.FindPipeline(pipelineName))
            Core::Log::Warn("{}: pipeline '{}' is not registered yet", drawCall.Label, pipelineName);

        m_DrawCalls.push_back(std::move(drawCall));
        return m_DrawCalls.back().Id;
    }

    DrawCallDescriptor DrawCallBatcher::Snapshot(const DrawCallDescriptor& drawCall) const
    {
        const InstanceStore& instances = m_Renderer.GetInstanceStore();
        const MeshStore& meshes = m_Renderer.GetMeshStore();

        DrawCallDescriptor result = drawCall;
        result.VertexBuffer = meshes.GetVertexBuffer().GetHandle();
        result.IndexBuffer = meshes.GetIndexBuffer().GetHandle();
        result.InstanceBuffer = instances.GetActiveBuffer().GetHandle();

        if (const RHI::PipelineHandle* pipeline = m_Renderer.FindPipeline(drawCall.PipelineName))
            result.Pipeline = *pipeline;

        if (const Allocation* allocation = instances.GetAllocation(drawCall.Allocation))
        {
            result.InstanceCount = allocation->NumActive;
            result.InstancePointer = VkDeviceSize(allocation->InstanceIndexBase) * sizeof(GpuActiveEntry);
        }
        return result;
    }

    std::vector<DrawCallDescriptor> DrawCallBatcher::DrawCallList() const
    {
        std::vector<DrawCallDescriptor> result;
        result.reserve(m_DrawCalls.size());
        for (const auto& drawCall : m_DrawCalls)
            result.push_back(Snapshot(drawCall));
        return result;
    }

    std::vector<DrawCallDescriptor> DrawCallBatcher::Submissions() const
    {
        std::vector<DrawCallDescriptor> result;
        for (const auto& drawCall : m_DrawCalls)
        {
            DrawCallDescriptor snapshot = Snapshot(drawCall);
            if (snapshot.InstanceCount == 0)
                continue;
            result.push_back(std::move(snapshot));
        }
        return result;
    }

    uint32_t DrawCallBatcher::Record(VkCommandBuffer cmd, VkDescriptorSet descriptorSet) const
    {
        VkPipeline currentPipeline = VK_NULL_HANDLE;
        VkBuffer currentVertexBuffer = VK_NULL_HANDLE;
        VkBuffer currentIndexBuffer = VK_NULL_HANDLE;
        uint32_t draws = 0;

        for (const DrawCallDescriptor& call : Submissions())
        {
            if (!call.Pipeline.IsValid())
            {
                Core::Log::Error("{}: pipeline '{}' is missing, draw skipped", call.Label, call.PipelineName);
                continue;
            }

            if (call.VertexBuffer == VK_NULL_HANDLE || call.IndexBuffer == VK_NULL_HANDLE ||
                call.InstanceBuffer == VK_NULL_HANDLE)
            {
                Core::Log::Error("{}: buffers are not bound to a device, draw skipped", call.Label);
                continue;
            }

            if (call.Pipeline.Pipeline != currentPipeline)
            {
                vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, call.Pipeline.Pipeline);
                if (descriptorSet != VK_NULL_HANDLE)
                {
                    vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS,
                                            call.Pipeline.Layout,
                                            0, 1, &descriptorSet,
                                            0, nullptr);
                }
                currentPipeline = call.Pipeline.Pipeline;
            }

            // Indices are rebased onto the shared buffer, so vertices bind at 0.
            if (call.VertexBuffer != currentVertexBuffer)
            {
                const VkDeviceSize offset = 0;
                vkCmdBindVertexBuffers(cmd, RHI::SceneVertexLayout::VertexBinding, 1, &call.VertexBuffer, &offset);
                currentVertexBuffer = call.VertexBuffer;
            }

            if (call.IndexBuffer != currentIndexBuffer)
            {
                vkCmdBindIndexBuffer(cmd, call.IndexBuffer, 0, call.IndexType);
                currentIndexBuffer = call.IndexBuffer;
            }

            vkCmdBindVertexBuffers(cmd, RHI::SceneVertexLayout::InstanceBinding, 1,
                                   &call.InstanceBuffer, &call.InstancePointer);

            vkCmdDrawIndexed(cmd, call.IndexCount, call.InstanceCount, call.IndexOffset, 0, 0);
            ++draws;
        }
        return draws;
    }
}
