#include "rigview/slots/LifecycleCoordinator.hpp"
#include "rigview/core/common.hpp"
#include "rigview/core/logger.hpp"
#include "rigview/stage/RenderStage.hpp"
#include "rigview/stage/StageSynchronizer.hpp"

#include <algorithm>
#include <fmt/ranges.h>
#include <utility>

namespace rigview::slots
{
    struct LifecycleCoordinator::FillJob
    {
        assets::RigDescriptor descriptor;
        std::optional<float> scale;
        std::vector<SlotId> targets;
        size_t next = 0;
        FillSummary summary;
        FillCallback onFinished;
    };

    LifecycleCoordinator::LifecycleCoordinator(SlotRegistry& registry,
                                               SlotArena& arena,
                                               assets::AssetBinder& binder,
                                               stage::RenderStage& stage,
                                               stage::StageSynchronizer& synchronizer)
        : m_registry(registry),
          m_arena(arena),
          m_binder(binder),
          m_stage(stage),
          m_synchronizer(synchronizer)
    {
    }

    LifecycleCoordinator::~LifecycleCoordinator()
    {
        shutdown();
    }

    uint64_t LifecycleCoordinator::load(SlotId id,
                                        const assets::RigDescriptor& descriptor,
                                        std::optional<float> scaleOverride,
                                        LoadCallback onSettled)
    {
        if (m_shutdown)
        {
            core::Logger::warn("[{}] Load ignored, coordinator is shut down", id.key());
            return 0;
        }

        const SlotRecord& record = m_registry.update(id, [&scaleOverride](SlotRecord r)
        {
            ++r.generation;
            r.state.tryTransition(SlotPhase::Loading);
            r.status = kStatusLoading;
            r.error.reset();
            r.animations.clear();
            r.selectedAnimation.clear();
            r.skins.clear();
            r.selectedSkin.clear();
            if (scaleOverride)
            {
                r.scale = *scaleOverride;
            }
            return r;
        });
        const uint64_t generation = record.generation;
        ++m_loadsStarted;

        core::Logger::debug("[{}] Load started (generation {})", id.key(), generation);

        if (!m_stage.isReady())
        {
            const LoadOutcome settled = settle(id, generation, core::Unexpected(assets::BindError::rendererUnavailable()));
            if (onSettled)
            {
                onSettled(id, settled);
            }
            return generation;
        }

        std::weak_ptr<bool> alive = m_alive;
        m_binder.bind(descriptor, id.key(),
                      [this, alive, id, generation, onSettled = std::move(onSettled)](assets::BindOutcome outcome) mutable
        {
            if (alive.expired())
            {
                // Coordinator is gone; the outcome's bundle releases itself.
                return;
            }
            const LoadOutcome settled = settle(id, generation, std::move(outcome));
            if (onSettled)
            {
                onSettled(id, settled);
            }
        });

        return generation;
    }

    LoadOutcome LifecycleCoordinator::settle(SlotId id, uint64_t generation, assets::BindOutcome outcome)
    {
        const uint64_t current = m_registry.get(id).generation;
        if (generation != current)
        {
            core::Logger::debug("[{}] Dropping superseded load (generation {}, current {})",
                                id.key(), generation, current);
            if (outcome)
            {
                outcome->instance.reset();
                outcome->bundle.release();
            }
            return LoadOutcome::Superseded;
        }

        if (!outcome)
        {
            fail(id, outcome.error());
            return LoadOutcome::Failed;
        }

        if (!m_stage.isReady())
        {
            outcome->instance.reset();
            outcome->bundle.release();
            fail(id, assets::BindError::rendererUnavailable());
            return LoadOutcome::Failed;
        }

        retire(id);
        install(id, std::move(*outcome));
        return LoadOutcome::Bound;
    }

    void LifecycleCoordinator::fail(SlotId id, const assets::BindError& error)
    {
        core::Logger::warn("[{}] Load failed ({}): {}", id.key(), assets::toString(error.code), error.message);

        if (retire(id))
        {
            m_synchronizer.sync();
        }

        m_registry.update(id, [&error](SlotRecord r)
        {
            r.state.tryTransition(SlotPhase::Failed);
            r.hasRig = false;
            r.status = kStatusFailed;
            r.error = error.message;
            r.animations.clear();
            r.selectedAnimation.clear();
            r.skins.clear();
            r.selectedSkin.clear();
            return r;
        });
    }

    void LifecycleCoordinator::install(SlotId id, assets::BindResult result)
    {
        const SlotRecord& record = m_registry.get(id);
        stage::RigInstance& rig = *result.instance;

        rig.setDebugName(id.key());
        rig.setZIndex(stage::zorder::kRig);
        rig.setScale(record.scale);

        const std::string skin = result.skinNames.empty() ? std::string{} : result.skinNames.front();
        const std::string animation = result.animationNames.empty() ? std::string{} : result.animationNames.front();
        if (!skin.empty())
        {
            rig.setSkin(skin);
        }
        if (!animation.empty())
        {
            rig.setAnimation(animation, record.looping);
        }
        rig.setTimeScale(record.playing ? 1.0F : 0.0F);

        auto outline = std::make_unique<stage::Overlay>(id.key() + "-outline", stage::zorder::kOutline);

        core::Logger::info("[{}] Rig bound: {} animations, {} skins, keys [{}]",
                           id.label(), result.animationNames.size(), result.skinNames.size(),
                           fmt::join(result.bundle.keys(), ", "));

        m_registry.update(id, [&](SlotRecord r)
        {
            r.state.tryTransition(SlotPhase::Bound);
            r.hasRig = true;
            r.animations = std::move(result.animationNames);
            r.skins = std::move(result.skinNames);
            r.selectedAnimation = animation;
            r.selectedSkin = skin;
            r.status = kStatusLoaded;
            r.error.reset();
            return r;
        });

        m_arena.install(id, std::move(result.instance), std::move(result.bundle), std::move(outline));
        m_synchronizer.sync();
    }

    bool LifecycleCoordinator::retire(SlotId id)
    {
        if (!m_arena.hasInstance(id) && !m_arena.hasBundle(id))
        {
            return false;
        }

        m_synchronizer.detachSlot(id);
        auto retired = m_arena.retire(id);

        const size_t keyCount = retired.bundle.keys().size();
        const size_t uriCount = retired.bundle.uris().size();

        retired.outline.reset();
        retired.instance.reset();
        retired.bundle.release();

        core::Logger::debug("[{}] Retired rig, released {} keys and {} URIs", id.key(), keyCount, uriCount);
        return true;
    }

    void LifecycleCoordinator::clear(SlotId id)
    {
        const bool hadRig = retire(id);

        m_registry.update(id, [](SlotRecord r)
        {
            SlotRecord next = SlotRecord::empty(r.id);
            next.generation = r.generation + 1;
            next.looping = r.looping;
            next.playing = r.playing;
            next.scale = r.scale;
            return next;
        });

        if (hadRig)
        {
            core::Logger::info("[{}] Slot cleared", id.label());
            m_synchronizer.sync();
        }
    }

    size_t LifecycleCoordinator::clearAll()
    {
        size_t cleared = 0;
        for (const auto id : m_arena.boundSlots())
        {
            if (id.isGrid())
            {
                clear(id);
                ++cleared;
            }
        }
        if (cleared > 0)
        {
            core::Logger::info("Cleared {} grid slots", cleared);
        }
        return cleared;
    }

    bool LifecycleCoordinator::fillEmpty(const assets::RigDescriptor& descriptor,
                                         std::optional<float> scale,
                                         FillCallback onFinished)
    {
        if (m_shutdown)
        {
            return false;
        }
        if (m_fill)
        {
            core::Logger::warn("Fill already running ({} of {} slots)", m_fill->next, m_fill->targets.size());
            return false;
        }

        auto job = std::make_shared<FillJob>();
        job->descriptor = descriptor;
        job->scale = scale;
        job->onFinished = std::move(onFinished);
        for (const auto id : m_registry.gridSlots())
        {
            if (m_registry.get(id).state.isVacant())
            {
                job->targets.push_back(id);
            }
        }

        core::Logger::info("Filling {} empty grid slots", job->targets.size());
        m_fill = std::move(job);
        fillNext();
        return true;
    }

    void LifecycleCoordinator::fillNext()
    {
        while (m_fill && m_fill->next < m_fill->targets.size())
        {
            const SlotId id = m_fill->targets[m_fill->next++];
            if (!m_registry.get(id).state.isVacant())
            {
                core::Logger::debug("[{}] No longer empty, skipped by fill", id.key());
                continue;
            }

            ++m_fill->summary.attempted;
            std::weak_ptr<FillJob> weakJob = m_fill;
            load(id, m_fill->descriptor, m_fill->scale, [this, weakJob](SlotId, LoadOutcome outcome)
            {
                auto job = weakJob.lock();
                if (!job || job != m_fill)
                {
                    return;
                }
                switch (outcome)
                {
                case LoadOutcome::Bound:      ++job->summary.bound; break;
                case LoadOutcome::Failed:     ++job->summary.failed; break;
                case LoadOutcome::Superseded: ++job->summary.superseded; break;
                }
                fillNext();
            });
            return;
        }

        if (!m_fill)
        {
            return;
        }

        auto job = std::move(m_fill);
        m_fill.reset();
        core::Logger::info("Fill finished: {} attempted, {} bound, {} failed",
                           job->summary.attempted, job->summary.bound, job->summary.failed);
        if (job->onFinished)
        {
            job->onFinished(job->summary);
        }
    }

    bool LifecycleCoordinator::setAnimation(SlotId id, const std::string& name)
    {
        const SlotRecord& record = m_registry.get(id);
        auto* rig = m_arena.instance(id);
        if (rig == nullptr || std::find(record.animations.begin(), record.animations.end(), name) == record.animations.end())
        {
            core::Logger::warn("[{}] Unknown animation '{}'", id.key(), name);
            return false;
        }

        rig->setAnimation(name, record.looping);
        m_registry.update(id, [&name](SlotRecord r)
        {
            r.selectedAnimation = name;
            return r;
        });
        return true;
    }

    bool LifecycleCoordinator::setSkin(SlotId id, const std::string& name)
    {
        const SlotRecord& record = m_registry.get(id);
        auto* rig = m_arena.instance(id);
        if (rig == nullptr || std::find(record.skins.begin(), record.skins.end(), name) == record.skins.end())
        {
            core::Logger::warn("[{}] Unknown skin '{}'", id.key(), name);
            return false;
        }

        rig->setSkin(name);
        m_registry.update(id, [&name](SlotRecord r)
        {
            r.selectedSkin = name;
            return r;
        });
        m_synchronizer.relayout();
        return true;
    }

    void LifecycleCoordinator::setLooping(SlotId id, bool looping)
    {
        const SlotRecord& record = m_registry.update(id, [looping](SlotRecord r)
        {
            r.looping = looping;
            return r;
        });

        auto* rig = m_arena.instance(id);
        if (rig != nullptr && !record.selectedAnimation.empty())
        {
            rig->setAnimation(record.selectedAnimation, looping);
        }
    }

    void LifecycleCoordinator::setPlaying(SlotId id, bool playing)
    {
        m_registry.update(id, [playing](SlotRecord r)
        {
            r.playing = playing;
            return r;
        });

        if (auto* rig = m_arena.instance(id))
        {
            rig->setTimeScale(playing ? 1.0F : 0.0F);
        }
    }

    void LifecycleCoordinator::setScale(SlotId id, float scale)
    {
        if (!(scale > 0.0F))
        {
            core::Logger::warn("[{}] Ignoring non-positive scale {}", id.key(), scale);
            return;
        }

        m_registry.update(id, [scale](SlotRecord r)
        {
            r.scale = scale;
            return r;
        });

        if (auto* rig = m_arena.instance(id))
        {
            rig->setScale(scale);
            m_synchronizer.relayout();
        }
    }

    void LifecycleCoordinator::setScaleAll(float scale)
    {
        if (!(scale > 0.0F))
        {
            core::Logger::warn("Ignoring non-positive grid scale {}", scale);
            return;
        }

        for (const auto id : m_registry.gridSlots())
        {
            m_registry.update(id, [scale](SlotRecord r)
            {
                r.scale = scale;
                return r;
            });
            if (auto* rig = m_arena.instance(id))
            {
                rig->setScale(scale);
            }
        }
        m_synchronizer.relayout();
    }

    void LifecycleCoordinator::reportError(SlotId id, std::string message)
    {
        core::Logger::warn("[{}] {}", id.key(), message);
        m_registry.update(id, [&message](SlotRecord r)
        {
            r.error = std::move(message);
            return r;
        });
    }

    void LifecycleCoordinator::shutdown()
    {
        if (m_shutdown)
        {
            return;
        }
        m_shutdown = true;
        m_alive.reset();
        m_fill.reset();

        size_t released = 0;
        for (const auto id : m_arena.boundSlots())
        {
            if (retire(id))
            {
                ++released;
            }
        }

        for (const auto id : m_registry.allSlots())
        {
            m_registry.update(id, [](SlotRecord r)
            {
                SlotRecord next = SlotRecord::empty(r.id);
                next.generation = r.generation + 1;
                return next;
            });
        }

        if (released > 0)
        {
            m_synchronizer.sync();
        }
        core::Logger::info("Lifecycle shut down, released {} rigs", released);
    }
}
