#pragma once

#include "rigview/assets/AssetBinder.hpp"
#include "rigview/assets/RigDescriptor.hpp"
#include "rigview/slots/SlotArena.hpp"
#include "rigview/slots/SlotRegistry.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rigview::stage
{
    class RenderStage;
    class StageSynchronizer;
}

namespace rigview::slots
{
    enum class LoadOutcome
    {
        Bound,
        Failed,
        // A newer load or a clear overtook this one; the result was released unseen.
        Superseded
    };

    constexpr std::string_view toString(LoadOutcome outcome)
    {
        switch (outcome)
        {
        case LoadOutcome::Bound:      return "Bound";
        case LoadOutcome::Failed:     return "Failed";
        case LoadOutcome::Superseded: return "Superseded";
        default:                      return "Unknown";
        }
    }

    struct FillSummary
    {
        size_t attempted = 0;
        size_t bound = 0;
        size_t failed = 0;
        size_t superseded = 0;
    };

    using LoadCallback = std::function<void(SlotId, LoadOutcome)>;
    using FillCallback = std::function<void(const FillSummary&)>;

    /**
     * @brief Sole mutator of the slot arena: binds, replaces and retires rigs.
     *
     * Every load bumps the slot's generation; a completion is installed only
     * while its generation is still current, anything else is released
     * without being attached. Bind failures end up in the slot record and
     * never escape. Must be driven from the main thread.
     *
     * The asset manager behind the binder must outlive any load still in
     * flight when the coordinator goes away.
     */
    class LifecycleCoordinator
    {
    public:
        LifecycleCoordinator(SlotRegistry& registry,
                             SlotArena& arena,
                             assets::AssetBinder& binder,
                             stage::RenderStage& stage,
                             stage::StageSynchronizer& synchronizer);
        ~LifecycleCoordinator();

        LifecycleCoordinator(const LifecycleCoordinator&) = delete;
        LifecycleCoordinator& operator=(const LifecycleCoordinator&) = delete;

        // Returns the generation assigned to this load, 0 after shutdown().
        // `onSettled` runs after the slot is updated; anything it throws
        // propagates out of the completion that delivered it.
        uint64_t load(SlotId id,
                      const assets::RigDescriptor& descriptor,
                      std::optional<float> scaleOverride = std::nullopt,
                      LoadCallback onSettled = {});

        // Retires the slot's rig (if any) and resets it to Empty. Loads in
        // flight for the slot become stale.
        void clear(SlotId id);

        // clear() on every grid slot holding a rig. Returns how many were cleared.
        size_t clearAll();

        // Loads `descriptor` into every vacant grid slot, one after another.
        // Returns false if a fill is already running.
        bool fillEmpty(const assets::RigDescriptor& descriptor,
                       std::optional<float> scale,
                       FillCallback onFinished = {});
        bool isFilling() const { return m_fill != nullptr; }

        bool setAnimation(SlotId id, const std::string& name);
        bool setSkin(SlotId id, const std::string& name);
        void setLooping(SlotId id, bool looping);
        void setPlaying(SlotId id, bool playing);
        void setScale(SlotId id, float scale);
        // Every grid slot, bound or not.
        void setScaleAll(float scale);

        // Shows `message` on the slot without touching its rig.
        void reportError(SlotId id, std::string message);

        // Releases every live rig, bundle and outline; pending completions
        // are dropped. Idempotent.
        void shutdown();
        bool isShutdown() const { return m_shutdown; }

        uint64_t loadsStarted() const { return m_loadsStarted; }

    private:
        struct FillJob;

        // Applies a finished bind to the slot's record; the caller reports the
        // returned outcome to the load's callback.
        LoadOutcome settle(SlotId id, uint64_t generation, assets::BindOutcome outcome);
        void fail(SlotId id, const assets::BindError& error);
        void install(SlotId id, assets::BindResult result);
        bool retire(SlotId id);
        void fillNext();

        SlotRegistry& m_registry;
        SlotArena& m_arena;
        assets::AssetBinder& m_binder;
        stage::RenderStage& m_stage;
        stage::StageSynchronizer& m_synchronizer;

        // Completion lambdas hold a weak reference; resetting it abandons them.
        std::shared_ptr<bool> m_alive = std::make_shared<bool>(true);
        std::shared_ptr<FillJob> m_fill;
        uint64_t m_loadsStarted = 0;
        bool m_shutdown = false;
    };
}
