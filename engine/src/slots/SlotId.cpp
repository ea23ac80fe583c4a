#include "rigview/slots/SlotId.hpp"
#include "rigview/core/logger.hpp"

namespace rigview::slots
{
    std::string SlotId::key() const
    {
        if (isSingle())
        {
            return "single";
        }
        return fmt::format("slot-{}-{}", cell.row, cell.col);
    }

    std::string SlotId::label() const
    {
        if (isSingle())
        {
            return "Single";
        }
        return fmt::format("R{}C{}", cell.row + 1, cell.col + 1);
    }
}
