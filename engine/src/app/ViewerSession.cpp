#include "rigview/app/ViewerSession.hpp"
#include "rigview/app/ViewerConfig.hpp"
#include "rigview/assets/RigFileSet.hpp"
#include "rigview/core/logger.hpp"

namespace rigview::app
{
    namespace
    {
        stage::StageStyle styleFromConfig()
        {
            stage::StageStyle style;
            style.cellSize = grid_cell_size.get();
            style.cellGap = grid_cell_gap.get();
            style.cellRadius = grid_cell_radius.get();
            style.outlinesVisible = grid_outlines_visible.get();
            style.outlineColor = static_cast<uint32_t>(outline_color.get()) & 0xffffffU;
            return style;
        }
    }

    ViewerSession::ViewerSession(assets::AssetManager& assets,
                                 stage::RigRuntime& runtime,
                                 stage::RenderStage& stage,
                                 assets::TransientUriRegistry& uris)
        : m_binder(assets, runtime, uris),
          m_synchronizer(stage, m_arena, styleFromConfig()),
          m_coordinator(m_registry, m_arena, m_binder, stage, m_synchronizer)
    {
        m_synchronizer.sync();
        core::Logger::info("Viewer session started (cell size {}, outlines {})",
                           m_synchronizer.cellSize(), m_synchronizer.outlinesVisible() ? "on" : "off");
    }

    ViewerSession::~ViewerSession()
    {
        shutdown();
    }

    void ViewerSession::shutdown()
    {
        m_coordinator.shutdown();
    }

    void ViewerSession::setMode(stage::PresentationMode mode)
    {
        m_synchronizer.setMode(mode);
    }

    slots::SlotId ViewerSession::currentSlot() const
    {
        return mode() == stage::PresentationMode::Single ? slots::SlotId::single() : m_activeSlot;
    }

    void ViewerSession::setActiveSlot(stage::GridCell cell)
    {
        if (!cell.isValid())
        {
            core::Logger::warn("Ignoring active slot outside the grid ({}, {})", cell.row, cell.col);
            return;
        }
        m_activeSlot = slots::SlotId::grid(cell);
    }

    float ViewerSession::loadScale() const
    {
        if (mode() == stage::PresentationMode::Single)
        {
            return single_scale.get();
        }
        return grid_multi_scale.get() ? grid_scale.get() : m_registry.get(m_activeSlot).scale;
    }

    uint64_t ViewerSession::load(const assets::RigDescriptor& descriptor, slots::LoadCallback onSettled)
    {
        const auto slot = currentSlot();
        core::Logger::info("Loading {} into {}", descriptor.skeleton.name, slot.label());
        return m_coordinator.load(slot, descriptor, loadScale(), std::move(onSettled));
    }

    bool ViewerSession::fillEmpty(const assets::RigDescriptor& descriptor, slots::FillCallback onFinished)
    {
        const float scale = grid_multi_scale.get() ? grid_scale.get() : m_registry.get(m_activeSlot).scale;
        return m_coordinator.fillEmpty(descriptor, scale, std::move(onFinished));
    }

    size_t ViewerSession::clearGrid()
    {
        return m_coordinator.clearAll();
    }

    void ViewerSession::clearCurrent()
    {
        m_coordinator.clear(currentSlot());
    }

    void ViewerSession::reportIncompleteSelection()
    {
        m_coordinator.reportError(currentSlot(), assets::kIncompleteSelectionMessage);
    }

    bool ViewerSession::setAnimation(const std::string& name)
    {
        return m_coordinator.setAnimation(currentSlot(), name);
    }

    bool ViewerSession::setSkin(const std::string& name)
    {
        return m_coordinator.setSkin(currentSlot(), name);
    }

    void ViewerSession::setLooping(bool looping)
    {
        m_coordinator.setLooping(currentSlot(), looping);
    }

    void ViewerSession::setPlaying(bool playing)
    {
        m_coordinator.setPlaying(currentSlot(), playing);
    }

    void ViewerSession::setScale(float scale)
    {
        if (mode() == stage::PresentationMode::Single)
        {
            single_scale.set(scale);
            m_coordinator.setScale(slots::SlotId::single(), scale);
            return;
        }

        if (grid_multi_scale.get())
        {
            grid_scale.set(scale);
            m_coordinator.setScaleAll(scale);
        }
        else
        {
            m_coordinator.setScale(m_activeSlot, scale);
        }
    }

    void ViewerSession::setMultiScale(bool enabled)
    {
        grid_multi_scale.set(enabled);
    }

    bool ViewerSession::multiScale() const
    {
        return grid_multi_scale.get();
    }

    void ViewerSession::setCellSize(float cellSize)
    {
        m_synchronizer.setCellSize(cellSize);
        grid_cell_size.set(m_synchronizer.cellSize());
    }

    void ViewerSession::setOutlinesVisible(bool visible)
    {
        grid_outlines_visible.set(visible);
        m_synchronizer.setOutlinesVisible(visible);
    }

    void ViewerSession::pointerDown(glm::vec2 clientPoint)
    {
        if (auto cell = m_synchronizer.pointerDown(clientPoint))
        {
            setActiveSlot(*cell);
        }
    }

    void ViewerSession::pointerMove(glm::vec2 clientPoint)
    {
        m_synchronizer.pointerMove(clientPoint);
    }

    void ViewerSession::pointerLeave()
    {
        m_synchronizer.pointerLeave();
    }

    void ViewerSession::onViewportResized()
    {
        m_synchronizer.onViewportResized();
    }

    void ViewerSession::frame()
    {
        m_synchronizer.tick();
    }
}
