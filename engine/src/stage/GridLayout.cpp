#include "rigview/stage/GridLayout.hpp"

#include <algorithm>
#include <cmath>

namespace rigview::stage
{
    namespace
    {
        // Cell size and grid origin are snapped to 1/256 px. With viewports
        // below 2^15 px every cell edge is then an exact float, so edges
        // shared by neighbouring cells compare equal.
        constexpr float kLayoutQuantum = 1.0F / 256.0F;

        float snap(float value)
        {
            return std::round(value / kLayoutQuantum) * kLayoutQuantum;
        }

        float cellEdge(float origin, float cellSize, int index)
        {
            return origin + static_cast<float>(index) * cellSize;
        }

        // Largest index whose leading edge is <= p. `p` is inside the grid.
        int locate(float origin, float cellSize, float p, int count)
        {
            int index = std::clamp(static_cast<int>(std::floor((p - origin) / cellSize)), 0, count - 1);
            while (index > 0 && p < cellEdge(origin, cellSize, index))
            {
                --index;
            }
            while (index + 1 < count && p >= cellEdge(origin, cellSize, index + 1))
            {
                ++index;
            }
            return index;
        }
    }

    GridMetrics computeGridMetrics(glm::vec2 viewportSize, float cellSize)
    {
        GridMetrics metrics;
        metrics.cellSize = snap(std::max(cellSize, 0.0F));
        metrics.gridSize = metrics.cellSize * static_cast<float>(kGridCols);
        metrics.left = snap(viewportSize.x / 2.0F - metrics.gridSize / 2.0F);
        metrics.top = snap(viewportSize.y / 2.0F - metrics.gridSize / 2.0F);
        return metrics;
    }

    std::optional<GridCell> hitTest(const GridMetrics& metrics, glm::vec2 point)
    {
        if (metrics.cellSize <= 0.0F || !metrics.extent().contains(point))
        {
            return std::nullopt;
        }

        return GridCell{locate(metrics.top, metrics.cellSize, point.y, kGridRows),
                        locate(metrics.left, metrics.cellSize, point.x, kGridCols)};
    }

    Rect cellRect(const GridMetrics& metrics, GridCell cell)
    {
        const float x = cellEdge(metrics.left, metrics.cellSize, cell.col);
        const float y = cellEdge(metrics.top, metrics.cellSize, cell.row);
        // Far edges are the neighbour's leading edges.
        return {x, y,
                cellEdge(metrics.left, metrics.cellSize, cell.col + 1) - x,
                cellEdge(metrics.top, metrics.cellSize, cell.row + 1) - y};
    }

    Rect cellDrawRect(const GridMetrics& metrics, GridCell cell, float gap)
    {
        const float drawSize = std::max(metrics.cellSize - gap, 0.0F);
        const float offset = (metrics.cellSize - drawSize) / 2.0F;
        const Rect full = cellRect(metrics, cell);
        return {full.x + offset, full.y + offset, drawSize, drawSize};
    }

    glm::vec2 cellCenter(const GridMetrics& metrics, GridCell cell)
    {
        return cellRect(metrics, cell).center();
    }
}
