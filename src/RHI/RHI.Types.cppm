module;
#include "RHI.Vulkan.hpp"
#include <array>
#include <cstdint>

export module RHI:Types;

export namespace RHI {

    // Interleaved scene vertex (64 bytes) plus a per-instance uint32 stream
    // carrying the storage slot of each drawn instance.
    //
    //   offset  0: position  float3
    //   offset 12: normal    float3
    //   offset 24: uv        float2
    //   offset 32: tangent   float4
    //   offset 48: color     float4
    struct SceneVertexLayout {
        static constexpr uint32_t VertexStride = 64;
        static constexpr uint32_t InstanceStride = sizeof(uint32_t);

        static constexpr uint32_t VertexBinding = 0;
        static constexpr uint32_t InstanceBinding = 1;

        static std::array<VkVertexInputBindingDescription, 2> GetBindings() {
            std::array<VkVertexInputBindingDescription, 2> bindings{};

            bindings[0].binding = VertexBinding;
            bindings[0].stride = VertexStride;
            bindings[0].inputRate = VK_VERTEX_INPUT_RATE_VERTEX;

            bindings[1].binding = InstanceBinding;
            bindings[1].stride = InstanceStride;
            bindings[1].inputRate = VK_VERTEX_INPUT_RATE_INSTANCE;

            return bindings;
        }

        static std::array<VkVertexInputAttributeDescription, 6> GetAttributes() {
            std::array<VkVertexInputAttributeDescription, 6> attributes{};

            attributes[0] = {0, VertexBinding, VK_FORMAT_R32G32B32_SFLOAT, 0};
            attributes[1] = {1, VertexBinding, VK_FORMAT_R32G32B32_SFLOAT, 12};
            attributes[2] = {2, VertexBinding, VK_FORMAT_R32G32_SFLOAT, 24};
            attributes[3] = {3, VertexBinding, VK_FORMAT_R32G32B32A32_SFLOAT, 32};
            attributes[4] = {4, VertexBinding, VK_FORMAT_R32G32B32A32_SFLOAT, 48};

            // Location 5: storage slot index, fetched per instance
            attributes[5] = {5, InstanceBinding, VK_FORMAT_R32_UINT, 0};

            return attributes;
        }
    };

    // Compiled pipeline produced by the shader/pipeline collaborator.
    // The core only binds it; it never creates or destroys one.
    struct PipelineHandle {
        VkPipeline Pipeline = VK_NULL_HANDLE;
        VkPipelineLayout Layout = VK_NULL_HANDLE;

        [[nodiscard]] bool IsValid() const { return Pipeline != VK_NULL_HANDLE; }
    };
}
