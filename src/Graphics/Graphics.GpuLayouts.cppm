module;

#include <cstddef>
#include <cstdint>

#include <glm/glm.hpp>

export module Graphics:GpuLayouts;

// Byte layouts shared with the shader bindings. Every struct here is copied
// into a GPU buffer as raw bytes, so field order, offsets and sizes are fixed.

export namespace Graphics
{
    // Storage buffer record, one per instance storage slot.
    struct GpuInstanceRecord
    {
        glm::mat4 ModelView{1.0f};   // offset 0
        uint32_t MaterialSlot = 0;   // offset 64
        uint32_t Pad0 = 0;
        uint32_t Pad1 = 0;
        uint32_t Pad2 = 0;
    };

    static_assert(sizeof(GpuInstanceRecord) == 80);
    static_assert(offsetof(GpuInstanceRecord, ModelView) == 0);
    static_assert(offsetof(GpuInstanceRecord, MaterialSlot) == 64);

    // Active (instance) buffer entry: the storage slot of one drawn instance.
    using GpuActiveEntry = uint32_t;
    static_assert(sizeof(GpuActiveEntry) == 4);

    enum class TextureChannel : uint32_t
    {
        Color = 0,
        Normal = 1,
        Specular = 2,
        Emissive = 3,
        Count = 4
    };

    struct GpuMaterialRecord
    {
        glm::vec4 Ambient{0.0f};      // offset 0
        glm::vec4 Diffuse{0.0f};      // offset 16
        glm::vec4 Specular{0.0f};     // offset 32
        glm::vec4 Emissive{0.0f};     // offset 48
        uint32_t Textures[4] = {};    // offset 64, sub-texture ids, 0 = none
        float Shininess = 0.0f;       // offset 80
        uint32_t Pad0 = 0;
        uint32_t Pad1 = 0;
        uint32_t Pad2 = 0;
    };

    static_assert(sizeof(GpuMaterialRecord) == 96);
    static_assert(offsetof(GpuMaterialRecord, Ambient) == 0);
    static_assert(offsetof(GpuMaterialRecord, Diffuse) == 16);
    static_assert(offsetof(GpuMaterialRecord, Specular) == 32);
    static_assert(offsetof(GpuMaterialRecord, Emissive) == 48);
    static_assert(offsetof(GpuMaterialRecord, Textures) == 64);
    static_assert(offsetof(GpuMaterialRecord, Shininess) == 80);

    enum class LightType : uint32_t
    {
        Point = 0,
        Directional = 1,
        Spot = 2
    };

    // Lighting buffer: a 16-byte header followed by tightly packed records.
    struct GpuLightingHeader
    {
        uint32_t Count = 0;           // offset 0
        uint32_t Pad0 = 0;
        uint32_t Pad1 = 0;
        uint32_t Pad2 = 0;
    };

    static_assert(sizeof(GpuLightingHeader) == 16);

    struct GpuLightRecord
    {
        LightType Type = LightType::Point;  // offset 0
        uint32_t Pad0 = 0;
        uint32_t Pad1 = 0;
        uint32_t Pad2 = 0;
        glm::vec4 Position{0.0f};     // offset 16, view space
        glm::vec4 Direction{0.0f};    // offset 32, view space
        glm::vec4 Attenuation{0.0f};  // offset 48
        glm::vec4 Ambient{0.0f};      // offset 64
        glm::vec4 Diffuse{0.0f};      // offset 80
        glm::vec4 Specular{0.0f};     // offset 96
        glm::vec2 Cone{0.0f};         // offset 112, inner/outer cutoff
        glm::vec2 Pad3{0.0f};
    };

    static_assert(sizeof(GpuLightRecord) == 128);
    static_assert(offsetof(GpuLightRecord, Type) == 0);
    static_assert(offsetof(GpuLightRecord, Position) == 16);
    static_assert(offsetof(GpuLightRecord, Direction) == 32);
    static_assert(offsetof(GpuLightRecord, Attenuation) == 48);
    static_assert(offsetof(GpuLightRecord, Ambient) == 64);
    static_assert(offsetof(GpuLightRecord, Diffuse) == 80);
    static_assert(offsetof(GpuLightRecord, Specular) == 96);
    static_assert(offsetof(GpuLightRecord, Cone) == 112);

    constexpr size_t kLightRecordsOffset = sizeof(GpuLightingHeader);

    // Atlas metadata, indexed by sub-texture id.
    struct GpuAtlasRecord
    {
        glm::vec4 Region{0.0f};       // offset 0, normalized x, y, w, h of the inner image
        uint32_t Layer = 0;           // offset 16
        uint32_t Pad0 = 0;
        uint32_t Pad1 = 0;
        uint32_t Pad2 = 0;
    };

    static_assert(sizeof(GpuAtlasRecord) == 32);
    static_assert(offsetof(GpuAtlasRecord, Region) == 0);
    static_assert(offsetof(GpuAtlasRecord, Layer) == 16);

    // Per-scene-graph uniform block.
    struct GpuSceneUniforms
    {
        glm::mat4 View{1.0f};         // offset 0
        glm::mat4 Projection{1.0f};   // offset 64
    };

    static_assert(sizeof(GpuSceneUniforms) == 128);
    static_assert(offsetof(GpuSceneUniforms, Projection) == 64);
}
