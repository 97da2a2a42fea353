module;

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

module Graphics:LightingStore.Impl;

import :LightingStore;
import :GpuLayouts;

import Core;
import RHI;

namespace Graphics
{
    LightingStore::LightingStore(uint32_t capacity)
        : m_Capacity(capacity)
        , m_Buffer("LightingStore.Lights", kLightRecordsOffset + size_t(capacity) * sizeof(GpuLightRecord),
                   VK_BUFFER_USAGE_STORAGE_BUFFER_BIT)
    {
        m_Active.reserve(capacity);
    }

    LightSource* LightingStore::Find(LightId id)
    {
        auto it = m_Lights.find(id);
        return it != m_Lights.end() ? &it->second : nullptr;
    }

    const LightSource* LightingStore::GetLightSource(LightId id) const
    {
        auto it = m_Lights.find(id);
        return it != m_Lights.end() ? &it->second : nullptr;
    }

    LightId LightingStore::CreateLightSource(const LightSourceDescriptor& descriptor)
    {
        LightSource light{};
        light.Id = m_NextLightId++;
        m_Lights.emplace(light.Id, light);
        (void)ApplyDescriptor(light.Id, descriptor);
        return light.Id;
    }

    Core::Result LightingStore::ApplyDescriptor(LightId id, const LightSourceDescriptor& descriptor)
    {
        LightSource* light = Find(id);
        if (!light)
            return Core::Err(Core::ErrorCode::InvalidHandle);

        light->Type = descriptor.Type.value_or(light->Type);
        light->Attenuation = descriptor.Attenuation.value_or(light->Attenuation);
        light->Ambient = descriptor.Ambient.value_or(light->Ambient);
        light->Diffuse = descriptor.Diffuse.value_or(light->Diffuse);
        light->Specular = descriptor.Specular.value_or(light->Specular);

        switch (light->Type)
        {
        case LightType::Point:
            light->Position = descriptor.Position.value_or(light->Position);
            break;
        case LightType::Directional:
            light->Direction = descriptor.Direction.value_or(light->Direction);
            break;
        case LightType::Spot:
            light->Position = descriptor.Position.value_or(light->Position);
            light->Direction = descriptor.Direction.value_or(light->Direction);
            light->Cone = descriptor.Cone.value_or(light->Cone);
            break;
        }
        return Core::Ok();
    }

    Core::Result LightingStore::ApplyTransform(LightId id, const glm::mat4& world)
    {
        LightSource* light = Find(id);
        if (!light)
            return Core::Err(Core::ErrorCode::InvalidHandle);

        if (light->Type == LightType::Directional || light->Type == LightType::Spot)
            light->Direction = world * glm::vec4(0.0f, 0.0f, -1.0f, 0.0f);

        if (light->Type == LightType::Point || light->Type == LightType::Spot)
            light->Position = glm::vec4(glm::vec3(world[3]), 1.0f);

        return Core::Ok();
    }

    Core::Result LightingStore::Activate(LightId id)
    {
        LightSource* light = Find(id);
        if (!light)
            return Core::Err(Core::ErrorCode::InvalidHandle);

        if (light->Slot)
        {
            Core::Log::Warn("LightingStore: light {} is already active", id);
            return Core::Err(Core::ErrorCode::InvalidOperation);
        }

        if (m_Active.size() >= m_Capacity)
        {
            Core::Log::Error("LightingStore: Lighting buffer is full (capacity = {})", m_Capacity);
            return Core::Err(Core::ErrorCode::CapacityExceeded);
        }

        light->Slot = static_cast<uint32_t>(m_Active.size());
        m_Active.push_back(id);
        return Core::Ok();
    }

    Core::Result LightingStore::Deactivate(LightId id)
    {
        LightSource* light = Find(id);
        if (!light)
            return Core::Err(Core::ErrorCode::InvalidHandle);

        if (!light->Slot)
        {
            Core::Log::Warn("LightingStore: light {} is already inactive", id);
            return Core::Err(Core::ErrorCode::InvalidOperation);
        }

        const uint32_t slot = *light->Slot;
        light->Slot.reset();
        m_Active.erase(m_Active.begin() + slot);

        for (uint32_t i = slot; i < m_Active.size(); ++i)
            m_Lights.at(m_Active[i]).Slot = i;

        return Core::Ok();
    }

    Core::Result LightingStore::RemoveLightSource(LightId id)
    {
        const LightSource* light = GetLightSource(id);
        if (!light)
            return Core::Err(Core::ErrorCode::InvalidHandle);

        if (light->Slot)
        {
            if (auto deactivated = Deactivate(id); !deactivated)
                return deactivated;
        }

        m_Lights.erase(id);
        return Core::Ok();
    }

    void LightingStore::UpdateBuffer(const glm::mat4& view)
    {
        GpuLightingHeader header{};
        header.Count = static_cast<uint32_t>(m_Active.size());
        m_Buffer.WriteValue(0, header);

        for (uint32_t slot = 0; slot < m_Active.size(); ++slot)
        {
            const LightSource& light = m_Lights.at(m_Active[slot]);

            GpuLightRecord record{};
            record.Type = light.Type;
            record.Position = view * light.Position;
            record.Direction = view * light.Direction;
            record.Attenuation = light.Attenuation;
            record.Ambient = light.Ambient;
            record.Diffuse = light.Diffuse;
            record.Specular = light.Specular;
            record.Cone = light.Cone;

            m_Buffer.WriteValue(kLightRecordsOffset + size_t(slot) * sizeof(GpuLightRecord), record);
        }

        // Clear the record vacated by the last compaction, if any.
        if (m_Active.size() < m_Capacity)
        {
            m_Buffer.Fill(kLightRecordsOffset + m_Active.size() * sizeof(GpuLightRecord), sizeof(GpuLightRecord));
        }
    }

    void LightingStore::Bind(RHI::VulkanDevice& device)
    {
        m_Buffer.Bind(device);
    }

    void LightingStore::Flush()
    {
        m_Buffer.Flush();
    }
}
