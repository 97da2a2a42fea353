module;

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

export module Graphics:MaterialStore;

import :GpuLayouts;
import :TextureAtlas;
import Core;
import RHI;

export namespace Graphics
{
    using MaterialId = uint32_t;

    // Per channel: nullopt leaves the binding alone, an empty string clears
    // it, anything else is looked up as an atlas label.
    struct MaterialTexturesDescriptor
    {
        std::optional<std::string> Color;
        std::optional<std::string> Normal;
        std::optional<std::string> Specular;
        std::optional<std::string> Emissive;
    };

    // Unset fields keep their current value.
    struct MaterialDescriptor
    {
        std::optional<std::string> Name;
        std::optional<glm::vec4> Ambient;
        std::optional<glm::vec4> Diffuse;
        std::optional<glm::vec4> Specular;
        std::optional<glm::vec4> Emissive;
        std::optional<float> Shininess;
        MaterialTexturesDescriptor Textures;
    };

    struct Material
    {
        MaterialId Id = 0;
        std::string Name;
        std::optional<uint32_t> Slot; // buffer slot while active

        glm::vec4 Ambient{0.0f, 0.0f, 0.0f, 1.0f};
        glm::vec4 Diffuse{1.0f};
        glm::vec4 Specular{1.0f};
        glm::vec4 Emissive{0.0f, 0.0f, 0.0f, 1.0f};
        float Shininess = 0.0f;
        std::array<SubTextureId, 4> Textures{}; // indexed by TextureChannel

        uint32_t Usage = 0;
    };

    // Materials live on the CPU; only the active subset occupies slots of the
    // GPU buffer. Instances reference materials by slot, so a slot keeps its
    // position for as long as it is in use and is never compacted.
    //
    // Property changes are not mirrored automatically; call Update()/UpdateAll()
    // after editing an active material.
    class MaterialStore
    {
    public:
        MaterialStore(uint32_t capacity, const TextureAtlas& atlas);

        MaterialStore(const MaterialStore&) = delete;
        MaterialStore& operator=(const MaterialStore&) = delete;

        [[nodiscard]] Core::Expected<MaterialId> CreateMaterial(const MaterialDescriptor& descriptor = {});

        Core::Result ApplyDescriptor(MaterialId id, const MaterialDescriptor& descriptor);
        Core::Result ApplyTextures(MaterialId id, const MaterialTexturesDescriptor& descriptor);

        Core::Result Activate(MaterialId id);
        // Refused while the material is in use.
        Core::Result Deactivate(MaterialId id);

        // Activates on demand, bumps the usage count and returns the slot.
        [[nodiscard]] Core::Expected<uint32_t> Use(MaterialId id);
        [[nodiscard]] Core::Expected<uint32_t> UseByName(const std::string& name);

        Core::Result Release(MaterialId id, bool deactivate = true);
        Core::Result ReleaseByName(const std::string& name, bool deactivate = true);

        Core::Result Update(MaterialId id);
        void UpdateAll();

        [[nodiscard]] const Material* GetMaterial(MaterialId id) const;
        [[nodiscard]] const Material* FindMaterial(const std::string& name) const;
        [[nodiscard]] uint32_t GetActiveCount() const { return m_Slots.LiveCount(); }
        [[nodiscard]] uint32_t GetCapacity() const { return m_Slots.Capacity(); }

        [[nodiscard]] RHI::MirroredBuffer& GetBuffer() { return m_Buffer; }
        [[nodiscard]] const RHI::MirroredBuffer& GetBuffer() const { return m_Buffer; }

        void Bind(RHI::VulkanDevice& device);
        void Flush();

    private:
        [[nodiscard]] Material* Find(MaterialId id);
        [[nodiscard]] Core::Expected<std::array<SubTextureId, 4>> ResolveTextures(
            const std::array<SubTextureId, 4>& current, const MaterialTexturesDescriptor& descriptor) const;
        void WriteRecord(const Material& material);

        const TextureAtlas& m_Atlas;
        Core::SlotAllocator m_Slots;

        std::unordered_map<MaterialId, Material> m_Materials;
        MaterialId m_NextMaterialId = 0;

        RHI::MirroredBuffer m_Buffer;
    };
}
