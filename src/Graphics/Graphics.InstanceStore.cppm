module;

#include <cstdint>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

export module Graphics:InstanceStore;

import :GpuLayouts;
import Core;
import RHI;

export namespace Graphics
{
    using InstanceId = uint32_t;
    using AllocationId = uint32_t;

    // Payload written into an instance's storage slot.
    struct InstanceData
    {
        glm::mat4 ModelView{1.0f};
        uint32_t MaterialSlot = 0;

        friend bool operator==(const InstanceData&, const InstanceData&) = default;
    };

    struct InstanceRecord
    {
        InstanceId Id = 0;
        AllocationId Allocation = 0;
        uint32_t StorageSlot = 0;
        std::optional<uint32_t> InstanceSlot; // position in the active buffer; empty = inactive
    };

    // A model group's fixed reservation in the active buffer.
    struct Allocation
    {
        AllocationId Id = 0;
        uint32_t InstanceIndexBase = 0;
        uint32_t Capacity = 0;
        uint32_t NumInstances = 0;
        uint32_t NumActive = 0;
    };

    // Two GPU buffers driven from one arena:
    //  - storage buffer: GpuInstanceRecord per storage slot ("exists");
    //  - active buffer:  dense storage-slot indices per allocation ("drawn"),
    //    bound as the per-instance vertex stream of instanced draws.
    //
    // For every allocation, entries [InstanceIndexBase, InstanceIndexBase + NumActive)
    // of the active buffer hold the storage slots of its active instances in
    // activation order.
    class InstanceStore
    {
    public:
        explicit InstanceStore(uint32_t capacity);

        InstanceStore(const InstanceStore&) = delete;
        InstanceStore& operator=(const InstanceStore&) = delete;

        // Reserves 'capacity' active-buffer entries for one model group.
        [[nodiscard]] Core::Expected<AllocationId> RegisterAllocation(uint32_t capacity);

        [[nodiscard]] Core::Expected<InstanceId> AddInstance(AllocationId allocation, const InstanceData& data, bool activate = true);

        Core::Result ActivateInstance(InstanceId id);
        Core::Result DeactivateInstance(InstanceId id);
        Core::Result UpdateInstanceData(InstanceId id, const InstanceData& data);

        // Deactivates if needed and returns the storage slot to the free list.
        // The id itself is retired for good.
        Core::Result RemoveInstance(InstanceId id);

        [[nodiscard]] std::optional<InstanceData> ReadInstanceData(InstanceId id) const;

        [[nodiscard]] const InstanceRecord* GetInstance(InstanceId id) const;
        [[nodiscard]] const Allocation* GetAllocation(AllocationId id) const;
        [[nodiscard]] std::vector<uint32_t> GetActiveSlots(AllocationId id) const;

        [[nodiscard]] uint32_t GetCapacity() const { return m_Capacity; }
        [[nodiscard]] uint32_t GetReservedCapacity() const { return m_ReservedCapacity; }
        [[nodiscard]] size_t GetInstanceCount() const { return m_Instances.size(); }
        [[nodiscard]] const Core::SlotAllocator& GetStorageSlots() const { return m_StorageSlots; }

        [[nodiscard]] RHI::MirroredBuffer& GetStorageBuffer() { return m_StorageBuffer; }
        [[nodiscard]] RHI::MirroredBuffer& GetActiveBuffer() { return m_ActiveBuffer; }
        [[nodiscard]] const RHI::MirroredBuffer& GetStorageBuffer() const { return m_StorageBuffer; }
        [[nodiscard]] const RHI::MirroredBuffer& GetActiveBuffer() const { return m_ActiveBuffer; }

        void Bind(RHI::VulkanDevice& device);
        void Flush();

    private:
        void WriteStorage(uint32_t storageSlot, const InstanceData& data);
        void WriteActiveEntry(uint32_t instanceSlot, uint32_t storageSlot);

        uint32_t m_Capacity = 0;
        uint32_t m_ReservedCapacity = 0;

        Core::SlotAllocator m_StorageSlots;
        std::vector<Allocation> m_Allocations;
        std::unordered_map<InstanceId, InstanceRecord> m_Instances;
        // Reverse map: active-buffer entry -> owning instance. Kept so the
        // compaction shift can repoint the records it moves.
        std::vector<std::optional<InstanceId>> m_InstanceBySlot;
        InstanceId m_NextInstanceId = 0;

        RHI::MirroredBuffer m_StorageBuffer;
        RHI::MirroredBuffer m_ActiveBuffer;
    };
}
