#include "rigview/slots/SlotRegistry.hpp"

#include <stdexcept>

namespace rigview::slots
{
    SlotRegistry::SlotRegistry()
        : m_single(SlotRecord::empty(SlotId::single()))
    {
        for (int i = 0; i < stage::kGridCellCount; ++i)
        {
            m_grid[util::sz(i)] = SlotRecord::empty(SlotId::grid(stage::GridCell::fromIndex(i)));
        }
    }

    const SlotRecord& SlotRegistry::get(SlotId id) const
    {
        if (id.isSingle())
        {
            return m_single;
        }
        if (!id.cell.isValid())
        {
            throw std::out_of_range("Slot " + id.key() + " is outside the grid");
        }
        return m_grid[util::sz(id.cell.index())];
    }

    SlotRecord& SlotRegistry::recordFor(SlotId id)
    {
        return const_cast<SlotRecord&>(std::as_const(*this).get(id));
    }

    void SlotRegistry::set(SlotRecord record)
    {
        recordFor(record.id) = std::move(record);
    }

    std::vector<SlotId> SlotRegistry::gridSlots() const
    {
        std::vector<SlotId> ids;
        ids.reserve(m_grid.size());
        for (const auto& record : m_grid)
        {
            ids.push_back(record.id);
        }
        return ids;
    }

    std::vector<SlotId> SlotRegistry::allSlots() const
    {
        std::vector<SlotId> ids;
        ids.reserve(m_grid.size() + 1);
        ids.push_back(SlotId::single());
        for (const auto& record : m_grid)
        {
            ids.push_back(record.id);
        }
        return ids;
    }
}
