#pragma once

#include "rigview/assets/AssetBinder.hpp"
#include "rigview/assets/RigDescriptor.hpp"
#include "rigview/slots/LifecycleCoordinator.hpp"
#include "rigview/slots/SlotArena.hpp"
#include "rigview/slots/SlotRegistry.hpp"
#include "rigview/stage/StageSynchronizer.hpp"

#include <glm/vec2.hpp>
#include <optional>
#include <string>

namespace rigview::assets
{
    class AssetManager;
    class TransientUriRegistry;
}

namespace rigview::app
{
    /**
     * @brief One viewer window's worth of state: slots, lifecycle and stage.
     *
     * Wires the binder, coordinator and synchronizer to the caller's asset
     * manager, rig runtime and render stage, and applies the viewer's
     * selection and scale policies on top. The collaborators must outlive
     * the session.
     */
    class ViewerSession
    {
    public:
        ViewerSession(assets::AssetManager& assets,
                      stage::RigRuntime& runtime,
                      stage::RenderStage& stage,
                      assets::TransientUriRegistry& uris);
        ~ViewerSession();

        ViewerSession(const ViewerSession&) = delete;
        ViewerSession& operator=(const ViewerSession&) = delete;

        void setMode(stage::PresentationMode mode);
        stage::PresentationMode mode() const { return m_synchronizer.mode(); }

        // Single slot in single mode, the active grid slot otherwise.
        slots::SlotId currentSlot() const;
        slots::SlotId activeSlot() const { return m_activeSlot; }
        void setActiveSlot(stage::GridCell cell);

        uint64_t load(const assets::RigDescriptor& descriptor, slots::LoadCallback onSettled = {});
        bool fillEmpty(const assets::RigDescriptor& descriptor, slots::FillCallback onFinished = {});
        size_t clearGrid();
        void clearCurrent();
        void reportIncompleteSelection();

        bool setAnimation(const std::string& name);
        bool setSkin(const std::string& name);
        void setLooping(bool looping);
        void setPlaying(bool playing);
        void setScale(float scale);
        void setMultiScale(bool enabled);
        bool multiScale() const;

        void setCellSize(float cellSize);
        void setOutlinesVisible(bool visible);

        void pointerDown(glm::vec2 clientPoint);
        void pointerMove(glm::vec2 clientPoint);
        void pointerLeave();
        void onViewportResized();
        void frame();

        void shutdown();

        const slots::SlotRecord& record(slots::SlotId id) const { return m_registry.get(id); }
        const slots::SlotRegistry& registry() const { return m_registry; }
        const slots::SlotArena& arena() const { return m_arena; }
        slots::LifecycleCoordinator& coordinator() { return m_coordinator; }
        stage::StageSynchronizer& synchronizer() { return m_synchronizer; }

    private:
        float loadScale() const;

        slots::SlotRegistry m_registry;
        slots::SlotArena m_arena;
        assets::AssetBinder m_binder;
        stage::StageSynchronizer m_synchronizer;
        slots::LifecycleCoordinator m_coordinator;

        slots::SlotId m_activeSlot = slots::SlotId::grid(0, 0);
    };
}
