#pragma once

#include "rigview/slots/SlotId.hpp"
#include "rigview/stage/GridLayout.hpp"
#include "rigview/stage/Overlay.hpp"
#include "rigview/stage/RenderStage.hpp"

#include <cstdint>
#include <glm/vec2.hpp>
#include <optional>
#include <string_view>

namespace rigview::slots
{
    class SlotArena;
}

namespace rigview::stage
{
    enum class PresentationMode
    {
        Single,
        Grid
    };

    constexpr std::string_view toString(PresentationMode mode)
    {
        return mode == PresentationMode::Single ? "single" : "grid";
    }

    struct StageStyle
    {
        float cellSize = 120.0F;
        float cellGap = 3.0F;
        float cellRadius = 8.0F;
        uint32_t outlineColor = 0xff6b6b;
        bool outlinesVisible = true;
    };

    inline constexpr float kMinCellSize = 40.0F;
    inline constexpr float kMaxCellSize = 400.0F;

    /**
     * @brief Keeps the render stage's children in line with the mode and the arena.
     *
     * Never creates or destroys rigs; it attaches, detaches, positions and
     * decorates what the arena holds. Owns the grid guide and hover overlays.
     */
    class StageSynchronizer
    {
    public:
        StageSynchronizer(RenderStage& stage, const slots::SlotArena& arena, StageStyle style = {});

        StageSynchronizer(const StageSynchronizer&) = delete;
        StageSynchronizer& operator=(const StageSynchronizer&) = delete;

        void setMode(PresentationMode mode);
        PresentationMode mode() const { return m_mode; }

        // Detach everything, then attach what the current mode shows.
        void sync();

        // Per-frame: redraw outlines from live rig bounds.
        void tick();

        void onViewportResized();

        // Clamped to [kMinCellSize, kMaxCellSize].
        void setCellSize(float cellSize);
        float cellSize() const { return m_style.cellSize; }

        // Hiding clears the grid outlines but keeps them alive.
        void setOutlinesVisible(bool visible);
        bool outlinesVisible() const { return m_style.outlinesVisible; }

        // Pointer input in client coordinates. A press inside the grid
        // while outlines are showing hides them once.
        std::optional<GridCell> pointerDown(glm::vec2 clientPoint);
        std::optional<GridCell> pointerMove(glm::vec2 clientPoint);
        void pointerLeave();

        // Re-center the single rig or re-position grid rigs after a scale/skin change.
        void relayout();

        // Called before the coordinator destroys a slot's rig and outline.
        void detachSlot(slots::SlotId id);

        GridMetrics gridMetrics() const;
        const Overlay& guide() const { return m_guide; }
        const Overlay& hover() const { return m_hover; }
        std::optional<GridCell> hoveredCell() const { return m_hoveredCell; }
        const StageStyle& style() const { return m_style; }

    private:
        void drawGuide();
        void drawHover(std::optional<GridCell> cell);
        void layoutGridRigs();
        void centerSingleRig();
        void redrawOutline(slots::SlotId id);
        void clearGridOutlines();

        RenderStage& m_stage;
        const slots::SlotArena& m_arena;
        StageStyle m_style;
        PresentationMode m_mode = PresentationMode::Single;

        Overlay m_guide{"grid-guide", zorder::kGuide};
        Overlay m_hover{"grid-hover", zorder::kHover};
        std::optional<GridCell> m_hoveredCell;
    };
}
