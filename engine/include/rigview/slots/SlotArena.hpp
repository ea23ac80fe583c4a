#pragma once

#include "rigview/assets/AssetBundle.hpp"
#include "rigview/slots/SlotId.hpp"
#include "rigview/stage/Overlay.hpp"
#include "rigview/stage/RigInstance.hpp"

#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace rigview::slots
{
    class LifecycleCoordinator;

    /**
     * @brief Owning tables for live rigs, their bundles and their outlines.
     *
     * Everyone may look; only LifecycleCoordinator installs and retires.
     * A slot is in the instance table iff it is in the bundle table.
     */
    class SlotArena
    {
    public:
        SlotArena() = default;
        ~SlotArena() = default;

        SlotArena(const SlotArena&) = delete;
        SlotArena& operator=(const SlotArena&) = delete;

        stage::RigInstance* instance(SlotId id) const;
        stage::Overlay* outline(SlotId id) const;
        const assets::AssetBundle* bundle(SlotId id) const;

        bool hasInstance(SlotId id) const { return m_instances.contains(id); }
        bool hasBundle(SlotId id) const { return m_bundles.contains(id); }

        // Slots holding a rig, ordered single first then row-major.
        std::vector<SlotId> boundSlots() const;
        size_t boundCount() const { return m_instances.size(); }

        void forEachBound(const std::function<void(SlotId, stage::RigInstance&, stage::Overlay*)>& fn) const;

    private:
        friend class LifecycleCoordinator;

        struct Retired
        {
            assets::AssetBundle bundle;
            std::unique_ptr<stage::RigInstance> instance;
            std::unique_ptr<stage::Overlay> outline;
        };

        void install(SlotId id,
                     std::unique_ptr<stage::RigInstance> instance,
                     assets::AssetBundle bundle,
                     std::unique_ptr<stage::Overlay> outline);

        Retired retire(SlotId id);

        std::map<SlotId, std::unique_ptr<stage::RigInstance>> m_instances;
        std::map<SlotId, assets::AssetBundle> m_bundles;
        std::map<SlotId, std::unique_ptr<stage::Overlay>> m_outlines;
    };
}
