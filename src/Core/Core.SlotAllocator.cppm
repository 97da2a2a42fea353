module;

#include <algorithm>
#include <cstdint>
#include <vector>

export module Core.SlotAllocator;

import Core.Error;

export namespace Core
{
    // Fixed-capacity arena of integer slots.
    //
    // Slots come from the free list first and only then from the high-water
    // mark, so a vacated slot is always reissued before the arena grows.
    // Allocate() takes the most recently freed slot; AllocateLowest() the
    // lowest one.
    // Capacity never changes after construction. Not thread-safe; each store
    // owns its allocator and is driven from a single thread.
    class SlotAllocator
    {
    public:
        explicit SlotAllocator(uint32_t capacity)
            : m_Capacity(capacity)
            , m_Live(capacity, 0u)
        {
            m_FreeSlots.reserve(capacity);
        }

        [[nodiscard]] Expected<uint32_t> Allocate()
        {
            uint32_t slot = 0;
            if (!m_FreeSlots.empty())
            {
                slot = m_FreeSlots.back();
                m_FreeSlots.pop_back();
            }
            else
            {
                if (m_NextSlot >= m_Capacity)
                    return Err<uint32_t>(ErrorCode::CapacityExceeded);
                slot = m_NextSlot++;
            }

            m_Live[slot] = 1u;
            ++m_LiveCount;
            return slot;
        }

        // Reissues the lowest vacated slot instead of the most recent one, so
        // records stay packed toward the front of the buffer.
        [[nodiscard]] Expected<uint32_t> AllocateLowest()
        {
            if (m_FreeSlots.empty())
                return Allocate();

            auto lowest = std::min_element(m_FreeSlots.begin(), m_FreeSlots.end());
            const uint32_t slot = *lowest;
            m_FreeSlots.erase(lowest);

            m_Live[slot] = 1u;
            ++m_LiveCount;
            return slot;
        }

        Result Free(uint32_t slot)
        {
            if (!IsLive(slot))
                return Err(ErrorCode::InvalidHandle);

            m_Live[slot] = 0u;
            --m_LiveCount;
            m_FreeSlots.push_back(slot);
            return Ok();
        }

        [[nodiscard]] bool IsLive(uint32_t slot) const
        {
            return slot < m_NextSlot && m_Live[slot] != 0u;
        }

        [[nodiscard]] uint32_t Capacity() const { return m_Capacity; }
        [[nodiscard]] uint32_t HighWaterMark() const { return m_NextSlot; }
        [[nodiscard]] uint32_t LiveCount() const { return m_LiveCount; }
        [[nodiscard]] uint32_t FreeCount() const { return m_Capacity - m_LiveCount; }

    private:
        uint32_t m_Capacity = 0;
        uint32_t m_NextSlot = 0;
        uint32_t m_LiveCount = 0;
        std::vector<uint32_t> m_FreeSlots;
        std::vector<uint8_t> m_Live;
    };
}
