#pragma once

#include "rigview/stage/GridLayout.hpp"

#include <compare>
#include <cstdint>
#include <string>

namespace rigview::slots
{
    // Either the implicit single-view slot or one cell of the grid.
    struct SlotId
    {
        enum class Kind : uint8_t
        {
            Single,
            Grid
        };

        Kind kind = Kind::Single;
        stage::GridCell cell{};

        static constexpr SlotId single() { return {Kind::Single, {}}; }
        static constexpr SlotId grid(int row, int col) { return {Kind::Grid, {row, col}}; }
        static constexpr SlotId grid(stage::GridCell c) { return {Kind::Grid, c}; }

        constexpr bool isSingle() const { return kind == Kind::Single; }
        constexpr bool isGrid() const { return kind == Kind::Grid; }

        // "single" or "slot-<row>-<col>"; also used as the asset key prefix.
        std::string key() const;
        // "Single" or "R<row+1>C<col+1>".
        std::string label() const;

        constexpr auto operator<=>(const SlotId&) const = default;
    };
}
