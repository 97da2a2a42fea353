module;

#include <cstdint>
#include <string>
#include <vector>

#include "RHI.Vulkan.hpp"

export module Graphics:DrawCallBatcher;

import :InstanceStore;
import :MeshStore;
import :Renderer;
import RHI;

export namespace Graphics
{
    // One indexed-instanced draw covering every active instance of a model.
    //
    // Everything but InstanceCount/InstancePointer is fixed when the model is
    // registered. Those two are copied from the model's allocation whenever a
    // snapshot is taken. Buffer handles and the pipeline are resolved at
    // snapshot time too, so they pick up a device bound after registration.
    struct DrawCallDescriptor
    {
        uint32_t Id = 0;
        std::string Label;
        std::string PipelineName;
        RHI::PipelineHandle Pipeline{};

        VkBuffer VertexBuffer = VK_NULL_HANDLE;
        VkDeviceSize VertexPointer = 0;
        uint32_t VertexCount = 0;

        VkBuffer IndexBuffer = VK_NULL_HANDLE;
        VkIndexType IndexType = VK_INDEX_TYPE_UINT32;
        VkDeviceSize IndexPointer = 0;
        uint32_t IndexOffset = 0;
        uint32_t IndexCount = 0;

        VkBuffer InstanceBuffer = VK_NULL_HANDLE;
        AllocationId Allocation = 0;
        uint32_t InstanceCount = 0;
        VkDeviceSize InstancePointer = 0; // byte offset of the allocation in the active buffer
    };

    class DrawCallBatcher
    {
    public:
        DrawCallBatcher(const Renderer& renderer, std::string label);

        DrawCallBatcher(const DrawCallBatcher&) = delete;
        DrawCallBatcher& operator=(const DrawCallBatcher&) = delete;

        // Returns the new descriptor id. Descriptors are never removed.
        uint32_t AddModel(const std::string& modelName, const MeshResource& mesh,
                          const std::string& pipelineName, AllocationId allocation);

        // All descriptors, in registration order.
        [[nodiscard]] std::vector<DrawCallDescriptor> DrawCallList() const;
        // Descriptors with at least one active instance, in registration order.
        [[nodiscard]] std::vector<DrawCallDescriptor> Submissions() const;
        [[nodiscard]] size_t Size() const { return m_DrawCalls.size(); }

        // Issues one vkCmdDrawIndexed per submission. Pipeline and descriptor
        // set are only rebound when the pipeline changes. Returns the number
        // of draws recorded.
        uint32_t Record(VkCommandBuffer cmd, VkDescriptorSet descriptorSet) const;

    private:
        [[nodiscard]] DrawCallDescriptor Snapshot(const DrawCallDescriptor& drawCall) const;

        const Renderer& m_Renderer;
        std::string m_Label;
        std::vector<DrawCallDescriptor> m_DrawCalls;
    };
}
