module;

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

export module Graphics:LightingStore;

import :GpuLayouts;
import Core;
import RHI;

export namespace Graphics
{
    using LightId = uint32_t;

    // Unset fields keep their value. Position only applies to point and spot
    // lights, Direction to directional and spot lights, Cone to spot lights.
    struct LightSourceDescriptor
    {
        std::optional<LightType> Type;
        std::optional<glm::vec4> Position;
        std::optional<glm::vec4> Direction;
        std::optional<glm::vec4> Attenuation;
        std::optional<glm::vec4> Ambient;
        std::optional<glm::vec4> Diffuse;
        std::optional<glm::vec4> Specular;
        std::optional<glm::vec2> Cone;
    };

    // World-space light. Converted to view space by UpdateBuffer().
    struct LightSource
    {
        LightId Id = 0;
        std::optional<uint32_t> Slot;

        LightType Type = LightType::Point;
        glm::vec4 Position{0.0f, 0.0f, 0.0f, 1.0f};
        glm::vec4 Direction{0.0f, 0.0f, -1.0f, 0.0f};
        glm::vec4 Attenuation{1.0f, 0.0f, 0.0f, 0.0f};
        glm::vec4 Ambient{0.0f, 0.0f, 0.0f, 1.0f};
        glm::vec4 Diffuse{1.0f};
        glm::vec4 Specular{1.0f};
        glm::vec2 Cone{0.0f};
    };

    // Active lights are kept dense: deactivating one pulls every later light
    // down by a slot, so the shader loops over [0, count).
    class LightingStore
    {
    public:
        explicit LightingStore(uint32_t capacity);

        LightingStore(const LightingStore&) = delete;
        LightingStore& operator=(const LightingStore&) = delete;

        [[nodiscard]] LightId CreateLightSource(const LightSourceDescriptor& descriptor = {});
        Core::Result ApplyDescriptor(LightId id, const LightSourceDescriptor& descriptor);
        Core::Result ApplyTransform(LightId id, const glm::mat4& world);

        Core::Result Activate(LightId id);
        Core::Result Deactivate(LightId id);
        Core::Result RemoveLightSource(LightId id);

        // Writes the count and every active record with view-space vectors.
        void UpdateBuffer(const glm::mat4& view);

        [[nodiscard]] const LightSource* GetLightSource(LightId id) const;
        [[nodiscard]] uint32_t GetActiveCount() const { return static_cast<uint32_t>(m_Active.size()); }
        [[nodiscard]] uint32_t GetCapacity() const { return m_Capacity; }
        [[nodiscard]] const std::vector<LightId>& GetActiveLights() const { return m_Active; }

        [[nodiscard]] RHI::MirroredBuffer& GetBuffer() { return m_Buffer; }
        [[nodiscard]] const RHI::MirroredBuffer& GetBuffer() const { return m_Buffer; }

        void Bind(RHI::VulkanDevice& device);
        void Flush();

    private:
        [[nodiscard]] LightSource* Find(LightId id);

        uint32_t m_Capacity = 0;
        std::unordered_map<LightId, LightSource> m_Lights;
        std::vector<LightId> m_Active; // index = slot
        LightId m_NextLightId = 0;

        RHI::MirroredBuffer m_Buffer;
    };
}
