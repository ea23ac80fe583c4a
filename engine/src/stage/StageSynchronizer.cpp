#include "rigview/stage/StageSynchronizer.hpp"
#include "rigview/core/logger.hpp"
#include "rigview/slots/SlotArena.hpp"

#include <algorithm>

namespace rigview::stage
{
    namespace
    {
        constexpr FillStyle kCellShadow{0x15121c, 0.55F};
        constexpr FillStyle kCellFill{0x2a2233, 1.0F};
        constexpr StrokeStyle kGridBorder{1.0F, 0x2f241e, 0.35F};
        constexpr FillStyle kHoverFill{0xff7a4a, 0.12F};
        constexpr StrokeStyle kHoverStroke{1.0F, 0xff7a4a, 0.35F};
        constexpr glm::vec2 kShadowOffset{2.0F, 4.0F};
        constexpr float kOutlineAlpha = 0.85F;
    }

    StageSynchronizer::StageSynchronizer(RenderStage& stage, const slots::SlotArena& arena, StageStyle style)
        : m_stage(stage), m_arena(arena), m_style(style)
    {
        m_style.cellSize = std::clamp(m_style.cellSize, kMinCellSize, kMaxCellSize);
    }

    GridMetrics StageSynchronizer::gridMetrics() const
    {
        return computeGridMetrics(m_stage.viewportSize(), m_style.cellSize);
    }

    void StageSynchronizer::setMode(PresentationMode mode)
    {
        if (m_mode != mode)
        {
            core::Logger::info("Presentation mode: {}", toString(mode));
        }
        m_mode = mode;
        if (mode != PresentationMode::Grid)
        {
            drawHover(std::nullopt);
        }
        sync();
    }

    void StageSynchronizer::sync()
    {
        m_stage.detachAll();

        if (m_mode == PresentationMode::Single)
        {
            const auto single = slots::SlotId::single();
            if (auto* rig = m_arena.instance(single))
            {
                m_stage.attach(*rig);
                centerSingleRig();
                if (auto* outline = m_arena.outline(single))
                {
                    m_stage.attach(*outline);
                    redrawOutline(single);
                }
            }
            return;
        }

        drawGuide();
        m_stage.attach(m_guide);
        m_stage.attach(m_hover);

        m_arena.forEachBound([this](slots::SlotId id, RigInstance& rig, Overlay*)
        {
            if (id.isGrid())
            {
                m_stage.attach(rig);
            }
        });

        if (m_style.outlinesVisible)
        {
            m_arena.forEachBound([this](slots::SlotId id, RigInstance&, Overlay* outline)
            {
                if (id.isGrid() && outline != nullptr)
                {
                    m_stage.attach(*outline);
                }
            });
        }

        layoutGridRigs();

        if (m_style.outlinesVisible)
        {
            tick();
        }
    }

    void StageSynchronizer::tick()
    {
        if (m_mode == PresentationMode::Single)
        {
            redrawOutline(slots::SlotId::single());
            return;
        }

        if (!m_style.outlinesVisible)
        {
            return;
        }

        for (const auto id : m_arena.boundSlots())
        {
            if (id.isGrid())
            {
                redrawOutline(id);
            }
        }
    }

    void StageSynchronizer::redrawOutline(slots::SlotId id)
    {
        auto* rig = m_arena.instance(id);
        auto* outline = m_arena.outline(id);
        if (rig == nullptr || outline == nullptr || !m_stage.isAttached(*rig))
        {
            return;
        }

        outline->clear();
        outline->rect(rig->screenBounds(), StrokeStyle{1.0F, m_style.outlineColor, kOutlineAlpha});
    }

    void StageSynchronizer::onViewportResized()
    {
        if (m_mode == PresentationMode::Single)
        {
            centerSingleRig();
            return;
        }

        drawGuide();
        layoutGridRigs();
        drawHover(m_hoveredCell);
    }

    void StageSynchronizer::setCellSize(float cellSize)
    {
        const float clamped = std::clamp(cellSize, kMinCellSize, kMaxCellSize);
        if (clamped != cellSize)
        {
            core::Logger::warn("Grid cell size {} clamped to {}", cellSize, clamped);
        }
        m_style.cellSize = clamped;

        if (m_mode != PresentationMode::Grid)
        {
            return;
        }
        drawGuide();
        layoutGridRigs();
        drawHover(std::nullopt);
    }

    void StageSynchronizer::setOutlinesVisible(bool visible)
    {
        m_style.outlinesVisible = visible;
        if (!visible)
        {
            clearGridOutlines();
        }
        if (m_mode == PresentationMode::Grid)
        {
            sync();
        }
    }

    void StageSynchronizer::clearGridOutlines()
    {
        m_arena.forEachBound([](slots::SlotId id, RigInstance&, Overlay* outline)
        {
            if (id.isGrid() && outline != nullptr)
            {
                outline->clear();
            }
        });
    }

    std::optional<GridCell> StageSynchronizer::pointerDown(glm::vec2 clientPoint)
    {
        if (m_mode != PresentationMode::Grid)
        {
            return std::nullopt;
        }

        const auto cell = hitTest(gridMetrics(), m_stage.clientToViewport(clientPoint));
        if (cell && m_style.outlinesVisible)
        {
            core::Logger::debug("First press in grid, hiding outlines");
            m_style.outlinesVisible = false;
            clearGridOutlines();
            sync();
        }
        return cell;
    }

    std::optional<GridCell> StageSynchronizer::pointerMove(glm::vec2 clientPoint)
    {
        if (m_mode != PresentationMode::Grid)
        {
            drawHover(std::nullopt);
            return std::nullopt;
        }

        const auto cell = hitTest(gridMetrics(), m_stage.clientToViewport(clientPoint));
        drawHover(cell);
        return cell;
    }

    void StageSynchronizer::pointerLeave()
    {
        drawHover(std::nullopt);
    }

    void StageSynchronizer::relayout()
    {
        if (m_mode == PresentationMode::Single)
        {
            centerSingleRig();
        }
        else
        {
            layoutGridRigs();
        }
    }

    void StageSynchronizer::detachSlot(slots::SlotId id)
    {
        if (auto* rig = m_arena.instance(id); rig != nullptr && m_stage.isAttached(*rig))
        {
            m_stage.detach(*rig);
        }
        if (auto* outline = m_arena.outline(id); outline != nullptr && m_stage.isAttached(*outline))
        {
            m_stage.detach(*outline);
        }
    }

    void StageSynchronizer::drawGuide()
    {
        const auto metrics = gridMetrics();

        m_guide.clear();
        for (int index = 0; index < kGridCellCount; ++index)
        {
            const Rect cell = cellDrawRect(metrics, GridCell::fromIndex(index), m_style.cellGap);
            const Rect shadow{cell.x + kShadowOffset.x, cell.y + kShadowOffset.y, cell.width, cell.height};
            m_guide.roundRect(shadow, m_style.cellRadius, kCellShadow);
            m_guide.roundRect(cell, m_style.cellRadius, kCellFill);
        }
        m_guide.rect(metrics.extent(), kGridBorder);
        m_guide.setHitArea(metrics.extent());
    }

    void StageSynchronizer::drawHover(std::optional<GridCell> cell)
    {
        m_hoveredCell = cell;
        m_hover.clear();
        if (!cell)
        {
            return;
        }
        const Rect r = cellDrawRect(gridMetrics(), *cell, m_style.cellGap);
        m_hover.roundRect(r, m_style.cellRadius, kHoverFill, kHoverStroke);
    }

    void StageSynchronizer::layoutGridRigs()
    {
        const auto metrics = gridMetrics();
        m_arena.forEachBound([&metrics](slots::SlotId id, RigInstance& rig, Overlay*)
        {
            if (id.isGrid())
            {
                rig.setPosition(cellCenter(metrics, id.cell));
            }
        });
    }

    void StageSynchronizer::centerSingleRig()
    {
        auto* rig = m_arena.instance(slots::SlotId::single());
        if (rig == nullptr)
        {
            return;
        }
        rig->setPivot(rig->localBounds().center());
        rig->setPosition(m_stage.viewportSize() / 2.0F);
    }
}
