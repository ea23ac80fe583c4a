#include "rigview/slots/SlotArena.hpp"
#include "rigview/core/common.hpp"

namespace rigview::slots
{
    stage::RigInstance* SlotArena::instance(SlotId id) const
    {
        auto it = m_instances.find(id);
        return it != m_instances.end() ? it->second.get() : nullptr;
    }

    stage::Overlay* SlotArena::outline(SlotId id) const
    {
        auto it = m_outlines.find(id);
        return it != m_outlines.end() ? it->second.get() : nullptr;
    }

    const assets::AssetBundle* SlotArena::bundle(SlotId id) const
    {
        auto it = m_bundles.find(id);
        return it != m_bundles.end() ? &it->second : nullptr;
    }

    std::vector<SlotId> SlotArena::boundSlots() const
    {
        std::vector<SlotId> ids;
        ids.reserve(m_instances.size());
        for (const auto& [id, instance] : m_instances)
        {
            ids.push_back(id);
        }
        return ids;
    }

    void SlotArena::forEachBound(const std::function<void(SlotId, stage::RigInstance&, stage::Overlay*)>& fn) const
    {
        for (const auto& [id, instance] : m_instances)
        {
            fn(id, *instance, outline(id));
        }
    }

    void SlotArena::install(SlotId id,
                            std::unique_ptr<stage::RigInstance> instance,
                            assets::AssetBundle bundle,
                            std::unique_ptr<stage::Overlay> outline)
    {
        RIGVIEW_ASSERT(!hasInstance(id) && !hasBundle(id), "Slot must be retired before install");
        RIGVIEW_ASSERT(instance != nullptr, "Cannot install a null rig");

        m_bundles.emplace(id, std::move(bundle));
        m_instances.emplace(id, std::move(instance));
        if (outline)
        {
            m_outlines.emplace(id, std::move(outline));
        }
    }

    SlotArena::Retired SlotArena::retire(SlotId id)
    {
        Retired retired;
        if (auto it = m_instances.find(id); it != m_instances.end())
        {
            retired.instance = std::move(it->second);
            m_instances.erase(it);
        }
        if (auto it = m_bundles.find(id); it != m_bundles.end())
        {
            retired.bundle = std::move(it->second);
            m_bundles.erase(it);
        }
        if (auto it = m_outlines.find(id); it != m_outlines.end())
        {
            retired.outline = std::move(it->second);
            m_outlines.erase(it);
        }
        return retired;
    }
}
