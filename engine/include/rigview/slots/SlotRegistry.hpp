#pragma once

#include "rigview/core/common.hpp"
#include "rigview/slots/SlotRecord.hpp"

#include <array>
#include <type_traits>
#include <vector>

namespace rigview::slots
{
    /**
     * @brief The single-view slot plus the fixed 5x5 grid of slot records.
     *
     * Records change only by whole-value replacement; update() runs a pure
     * transformation over a copy and stores the result. No I/O.
     */
    class SlotRegistry
    {
    public:
        SlotRegistry();

        const SlotRecord& get(SlotId id) const;
        void set(SlotRecord record);

        template <typename Fn>
        const SlotRecord& update(SlotId id, Fn&& fn)
        {
            static_assert(std::is_invocable_r_v<SlotRecord, Fn, SlotRecord>,
                          "update() expects SlotRecord(SlotRecord)");
            SlotRecord next = std::forward<Fn>(fn)(get(id));
            RIGVIEW_ASSERT(next.id == id, "update() must not change slot identity");
            next.id = id;
            set(std::move(next));
            return get(id);
        }

        // Grid slots in row-major order.
        std::vector<SlotId> gridSlots() const;
        // Single slot first, then the grid.
        std::vector<SlotId> allSlots() const;

        const std::array<SlotRecord, stage::kGridCellCount>& gridRecords() const { return m_grid; }

    private:
        SlotRecord& recordFor(SlotId id);

        SlotRecord m_single;
        std::array<SlotRecord, stage::kGridCellCount> m_grid;
    };
}
