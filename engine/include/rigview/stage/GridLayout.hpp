#pragma once

#include "rigview/stage/Rect.hpp"

#include <glm/vec2.hpp>
#include <compare>
#include <optional>

namespace rigview::stage
{
    inline constexpr int kGridRows = 5;
    inline constexpr int kGridCols = 5;
    inline constexpr int kGridCellCount = kGridRows * kGridCols;

    struct GridCell
    {
        int row = 0;
        int col = 0;

        constexpr bool isValid() const { return row >= 0 && row < kGridRows && col >= 0 && col < kGridCols; }
        constexpr int index() const { return row * kGridCols + col; }
        static constexpr GridCell fromIndex(int index) { return {index / kGridCols, index % kGridCols}; }

        constexpr auto operator<=>(const GridCell&) const = default;
    };

    // Derived from the viewport size and cell size; never stored.
    struct GridMetrics
    {
        float cellSize = 0.0F;
        float gridSize = 0.0F;
        float left = 0.0F;
        float top = 0.0F;

        Rect extent() const { return {left, top, gridSize, gridSize}; }
    };

    // Centers a kGridRows x kGridCols grid of square cells in the viewport.
    // Cell size and origin are snapped to 1/256 px so cell edges are exact.
    GridMetrics computeGridMetrics(glm::vec2 viewportSize, float cellSize);

    // Cell containing `point`, or nullopt outside [left, left + gridSize).
    std::optional<GridCell> hitTest(const GridMetrics& metrics, glm::vec2 point);

    // Full cell area; the cell owns [left, left + cellSize).
    Rect cellRect(const GridMetrics& metrics, GridCell cell);

    // Cell area shrunk by `gap` and centered, as drawn by the guide.
    Rect cellDrawRect(const GridMetrics& metrics, GridCell cell, float gap);

    glm::vec2 cellCenter(const GridMetrics& metrics, GridCell cell);
}
