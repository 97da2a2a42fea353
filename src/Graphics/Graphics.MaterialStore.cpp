module;

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

module Graphics:MaterialStore.Impl;

import :MaterialStore;
import :GpuLayouts;
import :TextureAtlas;

import Core;
import RHI;

namespace Graphics
{
    MaterialStore::MaterialStore(uint32_t capacity, const TextureAtlas& atlas)
        : m_Atlas(atlas)
        , m_Slots(capacity)
        , m_Buffer("MaterialStore.Materials", size_t(capacity) * sizeof(GpuMaterialRecord),
                   VK_BUFFER_USAGE_STORAGE_BUFFER_BIT)
    {
    }

    Material* MaterialStore::Find(MaterialId id)
    {
        auto it = m_Materials.find(id);
        return it != m_Materials.end() ? &it->second : nullptr;
    }

    const Material* MaterialStore::GetMaterial(MaterialId id) const
    {
        auto it = m_Materials.find(id);
        return it != m_Materials.end() ? &it->second : nullptr;
    }

    const Material* MaterialStore::FindMaterial(const std::string& name) const
    {
        // Material counts are small; a linear scan matches creation order.
        const Material* found = nullptr;
        for (const auto& [id, material] : m_Materials)
        {
            if (material.Name == name && (!found || material.Id < found->Id))
                found = &material;
        }
        return found;
    }

    Core::Expected<MaterialId> MaterialStore::CreateMaterial(const MaterialDescriptor& descriptor)
    {
        Material material{};
        material.Id = m_NextMaterialId;

        auto textures = ResolveTextures(material.Textures, descriptor.Textures);
        if (!textures)
            return Core::Err<MaterialId>(textures.error());

        m_NextMaterialId++;
        m_Materials.emplace(material.Id, material);

        if (auto applied = ApplyDescriptor(material.Id, descriptor); !applied)
            return Core::Err<MaterialId>(applied.error());

        return material.Id;
    }

    Core::Result MaterialStore::ApplyDescriptor(MaterialId id, const MaterialDescriptor& descriptor)
    {
        Material* material = Find(id);
        if (!material)
            return Core::Err(Core::ErrorCode::InvalidHandle);

        // Resolve first so an unknown texture leaves the material untouched.
        auto textures = ResolveTextures(material->Textures, descriptor.Textures);
        if (!textures)
            return Core::Err(textures.error());

        material->Name = descriptor.Name.value_or(material->Name);
        material->Ambient = descriptor.Ambient.value_or(material->Ambient);
        material->Diffuse = descriptor.Diffuse.value_or(material->Diffuse);
        material->Specular = descriptor.Specular.value_or(material->Specular);
        material->Emissive = descriptor.Emissive.value_or(material->Emissive);
        material->Shininess = descriptor.Shininess.value_or(material->Shininess);
        material->Textures = *textures;
        return Core::Ok();
    }

    Core::Result MaterialStore::ApplyTextures(MaterialId id, const MaterialTexturesDescriptor& descriptor)
    {
        Material* material = Find(id);
        if (!material)
            return Core::Err(Core::ErrorCode::InvalidHandle);

        auto textures = ResolveTextures(material->Textures, descriptor);
        if (!textures)
            return Core::Err(textures.error());

        material->Textures = *textures;
        return Core::Ok();
    }

    Core::Expected<std::array<SubTextureId, 4>> MaterialStore::ResolveTextures(
        const std::array<SubTextureId, 4>& current, const MaterialTexturesDescriptor& descriptor) const
    {
        std::array<SubTextureId, 4> result = current;
        const std::optional<std::string>* channels[4] = {
            &descriptor.Color, &descriptor.Normal, &descriptor.Specular, &descriptor.Emissive};

        for (size_t i = 0; i < 4; ++i)
        {
            const std::optional<std::string>& name = *channels[i];
            if (!name)
                continue;

            if (name->empty())
            {
                result[i] = kNoSubTexture;
                continue;
            }

            const SubTexture* texture = m_Atlas.FindSubTexture(*name);
            if (!texture)
            {
                Core::Log::Error("MaterialStore: No such texture: '{}'", *name);
                return Core::Err<std::array<SubTextureId, 4>>(Core::ErrorCode::InvalidArgument);
            }
            result[i] = texture->Id;
        }
        return result;
    }

    Core::Result MaterialStore::Activate(MaterialId id)
    {
        Material* material = Find(id);
        if (!material)
            return Core::Err(Core::ErrorCode::InvalidHandle);

        if (material->Slot)
        {
            Core::Log::Warn("MaterialStore: material {} ('{}') is already active", id, material->Name);
            return Core::Err(Core::ErrorCode::InvalidOperation);
        }

        auto slot = m_Slots.AllocateLowest();
        if (!slot)
        {
            Core::Log::Error("MaterialStore: Materials buffer is full (capacity = {})", m_Slots.Capacity());
            return Core::Err(slot.error());
        }

        material->Slot = *slot;
        WriteRecord(*material);
        return Core::Ok();
    }

    Core::Result MaterialStore::Deactivate(MaterialId id)
    {
        Material* material = Find(id);
        if (!material)
            return Core::Err(Core::ErrorCode::InvalidHandle);

        if (!material->Slot)
        {
            Core::Log::Warn("MaterialStore: material {} ('{}') is already inactive", id, material->Name);
            return Core::Err(Core::ErrorCode::InvalidOperation);
        }

        if (material->Usage > 0)
        {
            Core::Log::Warn("MaterialStore: cannot deactivate material {} ('{}') while in use ({} users)",
                            id, material->Name, material->Usage);
            return Core::Err(Core::ErrorCode::InvalidOperation);
        }

        const uint32_t slot = *material->Slot;
        m_Buffer.Fill(size_t(slot) * sizeof(GpuMaterialRecord), sizeof(GpuMaterialRecord));
        material->Slot.reset();
        return m_Slots.Free(slot);
    }

    Core::Expected<uint32_t> MaterialStore::Use(MaterialId id)
    {
        Material* material = Find(id);
        if (!material)
            return Core::Err<uint32_t>(Core::ErrorCode::InvalidHandle);

        if (!material->Slot)
        {
            if (auto activated = Activate(id); !activated)
                return Core::Err<uint32_t>(activated.error());
        }

        material->Usage++;
        return *material->Slot;
    }

    Core::Expected<uint32_t> MaterialStore::UseByName(const std::string& name)
    {
        const Material* material = FindMaterial(name);
        if (!material)
        {
            Core::Log::Error("MaterialStore: Invalid material name: '{}'", name);
            return Core::Err<uint32_t>(Core::ErrorCode::InvalidHandle);
        }
        return Use(material->Id);
    }

    Core::Result MaterialStore::Release(MaterialId id, bool deactivate)
    {
        Material* material = Find(id);
        if (!material)
            return Core::Err(Core::ErrorCode::InvalidHandle);

        if (!material->Slot || material->Usage == 0)
        {
            Core::Log::Warn("MaterialStore: cannot release material {} ('{}'): not in use", id, material->Name);
            return Core::Err(Core::ErrorCode::InvalidOperation);
        }

        material->Usage--;
        if (material->Usage == 0 && deactivate)
            return Deactivate(id);

        return Core::Ok();
    }

    Core::Result MaterialStore::ReleaseByName(const std::string& name, bool deactivate)
    {
        const Material* material = FindMaterial(name);
        if (!material)
            return Core::Err(Core::ErrorCode::InvalidHandle);
        return Release(material->Id, deactivate);
    }

    Core::Result MaterialStore::Update(MaterialId id)
    {
        const Material* material = GetMaterial(id);
        if (!material)
            return Core::Err(Core::ErrorCode::InvalidHandle);

        // Inactive materials have no slot to refresh.
        if (material->Slot)
            WriteRecord(*material);
        return Core::Ok();
    }

    void MaterialStore::UpdateAll()
    {
        for (const auto& [id, material] : m_Materials)
        {
            if (material.Slot)
                WriteRecord(material);
        }
    }

    void MaterialStore::WriteRecord(const Material& material)
    {
        GpuMaterialRecord record{};
        record.Ambient = material.Ambient;
        record.Diffuse = material.Diffuse;
        record.Specular = material.Specular;
        record.Emissive = material.Emissive;
        for (size_t i = 0; i < material.Textures.size(); ++i)
            record.Textures[i] = material.Textures[i];
        record.Shininess = material.Shininess;

        m_Buffer.WriteValue(size_t(*material.Slot) * sizeof(GpuMaterialRecord), record);
    }

    void MaterialStore::Bind(RHI::VulkanDevice& device)
    {
        m_Buffer.Bind(device);
    }

    void MaterialStore::Flush()
    {
        m_Buffer.Flush();
    }
}
