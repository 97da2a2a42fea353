module;

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

module Graphics:InstanceStore.Impl;

import :InstanceStore;
import :GpuLayouts;

import Core;
import RHI;

namespace Graphics
{
    InstanceStore::InstanceStore(uint32_t capacity)
        : m_Capacity(capacity)
        , m_StorageSlots(capacity)
        , m_InstanceBySlot(capacity)
        , m_StorageBuffer("InstanceStore.Storage", size_t(capacity) * sizeof(GpuInstanceRecord),
                          VK_BUFFER_USAGE_STORAGE_BUFFER_BIT)
        , m_ActiveBuffer("InstanceStore.Active", size_t(capacity) * sizeof(GpuActiveEntry),
                         VK_BUFFER_USAGE_VERTEX_BUFFER_BIT)
    {
    }

    Core::Expected<AllocationId> InstanceStore::RegisterAllocation(uint32_t capacity)
    {
        if (capacity > m_Capacity - m_ReservedCapacity)
        {
            Core::Log::Error("InstanceStore: Instance buffer is full (requested {}, reserved {}/{})",
                             capacity, m_ReservedCapacity, m_Capacity);
            return Core::Err<AllocationId>(Core::ErrorCode::CapacityExceeded);
        }

        Allocation allocation{};
        allocation.Id = static_cast<AllocationId>(m_Allocations.size());
        allocation.InstanceIndexBase = m_ReservedCapacity;
        allocation.Capacity = capacity;
        m_Allocations.push_back(allocation);

        m_ReservedCapacity += capacity;
        return allocation.Id;
    }

    Core::Expected<InstanceId> InstanceStore::AddInstance(AllocationId allocationId, const InstanceData& data, bool activate)
    {
        if (allocationId >= m_Allocations.size())
            return Core::Err<InstanceId>(Core::ErrorCode::InvalidHandle);

        Allocation& allocation = m_Allocations[allocationId];
        if (allocation.NumInstances >= allocation.Capacity)
        {
            Core::Log::Error("InstanceStore: allocation {} is full ({} instances)", allocationId, allocation.Capacity);
            return Core::Err<InstanceId>(Core::ErrorCode::AllocationFull);
        }

        // Reservations never exceed capacity, so a full storage arena here
        // means a bookkeeping bug rather than a caller error.
        auto slot = m_StorageSlots.Allocate();
        if (!slot)
        {
            Core::Log::Error("InstanceStore: Out of storage slots (capacity = {})", m_Capacity);
            return Core::Err<InstanceId>(slot.error());
        }

        InstanceRecord record{};
        record.Id = m_NextInstanceId++;
        record.Allocation = allocationId;
        record.StorageSlot = *slot;
        m_Instances.emplace(record.Id, record);
        allocation.NumInstances++;

        WriteStorage(record.StorageSlot, data);

        if (activate)
        {
            if (auto result = ActivateInstance(record.Id); !result)
                return Core::Err<InstanceId>(result.error());
        }

        return record.Id;
    }

    Core::Result InstanceStore::ActivateInstance(InstanceId id)
    {
        auto it = m_Instances.find(id);
        if (it == m_Instances.end())
            return Core::Err(Core::ErrorCode::InvalidHandle);

        InstanceRecord& record = it->second;
        if (record.InstanceSlot)
        {
            Core::Log::Warn("InstanceStore: instance {} is already active", id);
            return Core::Err(Core::ErrorCode::InvalidOperation);
        }

        Allocation& allocation = m_Allocations[record.Allocation];
        const uint32_t instanceSlot = allocation.InstanceIndexBase + allocation.NumActive;

        WriteActiveEntry(instanceSlot, record.StorageSlot);
        m_InstanceBySlot[instanceSlot] = id;
        record.InstanceSlot = instanceSlot;
        allocation.NumActive++;

        return Core::Ok();
    }

    Core::Result InstanceStore::DeactivateInstance(InstanceId id)
    {
        auto it = m_Instances.find(id);
        if (it == m_Instances.end())
            return Core::Err(Core::ErrorCode::InvalidHandle);

        InstanceRecord& record = it->second;
        if (!record.InstanceSlot)
        {
            Core::Log::Warn("InstanceStore: instance {} is already inactive", id);
            return Core::Err(Core::ErrorCode::InvalidOperation);
        }

        Allocation& allocation = m_Allocations[record.Allocation];
        const uint32_t removed = *record.InstanceSlot;
        const uint32_t end = allocation.InstanceIndexBase + allocation.NumActive;

        // Shift the later entries of this allocation down by one.
        const uint32_t tail = end - removed - 1;
        if (tail > 0)
        {
            m_ActiveBuffer.Move(size_t(removed) * sizeof(GpuActiveEntry),
                                size_t(removed + 1) * sizeof(GpuActiveEntry),
                                size_t(tail) * sizeof(GpuActiveEntry));
        }

        for (uint32_t slot = removed; slot + 1 < end; ++slot)
        {
            const InstanceId moved = *m_InstanceBySlot[slot + 1];
            m_InstanceBySlot[slot] = moved;
            m_Instances.at(moved).InstanceSlot = slot;
        }

        m_ActiveBuffer.Fill(size_t(end - 1) * sizeof(GpuActiveEntry), sizeof(GpuActiveEntry));
        m_InstanceBySlot[end - 1].reset();

        record.InstanceSlot.reset();
        allocation.NumActive--;

        return Core::Ok();
    }

    Core::Result InstanceStore::UpdateInstanceData(InstanceId id, const InstanceData& data)
    {
        auto it = m_Instances.find(id);
        if (it == m_Instances.end())
            return Core::Err(Core::ErrorCode::InvalidHandle);

        WriteStorage(it->second.StorageSlot, data);
        return Core::Ok();
    }

    Core::Result InstanceStore::RemoveInstance(InstanceId id)
    {
        auto it = m_Instances.find(id);
        if (it == m_Instances.end())
            return Core::Err(Core::ErrorCode::InvalidHandle);

        if (it->second.InstanceSlot)
        {
            if (auto result = DeactivateInstance(id); !result)
                return result;
        }

        const InstanceRecord record = it->second;
        m_StorageBuffer.Fill(size_t(record.StorageSlot) * sizeof(GpuInstanceRecord), sizeof(GpuInstanceRecord));
        if (auto freed = m_StorageSlots.Free(record.StorageSlot); !freed)
            return freed;

        m_Allocations[record.Allocation].NumInstances--;
        m_Instances.erase(it);
        return Core::Ok();
    }

    std::optional<InstanceData> InstanceStore::ReadInstanceData(InstanceId id) const
    {
        const InstanceRecord* record = GetInstance(id);
        if (!record)
            return std::nullopt;

        const auto gpu = m_StorageBuffer.ReadValue<GpuInstanceRecord>(size_t(record->StorageSlot) * sizeof(GpuInstanceRecord));
        return InstanceData{gpu.ModelView, gpu.MaterialSlot};
    }

    const InstanceRecord* InstanceStore::GetInstance(InstanceId id) const
    {
        auto it = m_Instances.find(id);
        return it != m_Instances.end() ? &it->second : nullptr;
    }

    const Allocation* InstanceStore::GetAllocation(AllocationId id) const
    {
        return id < m_Allocations.size() ? &m_Allocations[id] : nullptr;
    }

    std::vector<uint32_t> InstanceStore::GetActiveSlots(AllocationId id) const
    {
        std::vector<uint32_t> slots;
        const Allocation* allocation = GetAllocation(id);
        if (!allocation)
            return slots;

        slots.reserve(allocation->NumActive);
        for (uint32_t i = 0; i < allocation->NumActive; ++i)
        {
            const size_t offset = size_t(allocation->InstanceIndexBase + i) * sizeof(GpuActiveEntry);
            slots.push_back(m_ActiveBuffer.ReadValue<GpuActiveEntry>(offset));
        }
        return slots;
    }

    void InstanceStore::Bind(RHI::VulkanDevice& device)
    {
        m_StorageBuffer.Bind(device);
        m_ActiveBuffer.Bind(device);
    }

    void InstanceStore::Flush()
    {
        m_StorageBuffer.Flush();
        m_ActiveBuffer.Flush();
    }

    void InstanceStore::WriteStorage(uint32_t storageSlot, const InstanceData& data)
    {
        GpuInstanceRecord gpu{};
        gpu.ModelView = data.ModelView;
        gpu.MaterialSlot = data.MaterialSlot;
        m_StorageBuffer.WriteValue(size_t(storageSlot) * sizeof(GpuInstanceRecord), gpu);
    }

    void InstanceStore::WriteActiveEntry(uint32_t instanceSlot, uint32_t storageSlot)
    {
        m_ActiveBuffer.WriteValue<GpuActiveEntry>(size_t(instanceSlot) * sizeof(GpuActiveEntry), storageSlot);
    }
}
