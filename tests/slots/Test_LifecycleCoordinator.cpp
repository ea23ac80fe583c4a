#include <doctest/doctest.h>
#include "../TestRig.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <vector>

using namespace rigview;
using namespace rigview::slots;

namespace {

struct SettleLog {
    std::vector<LoadOutcome> outcomes;

    LoadCallback callback() {
        return [this](SlotId, LoadOutcome outcome) { outcomes.push_back(outcome); };
    }
};

} // namespace

TEST_CASE("Load binds a rig into the slot") {
    test::SlotCore core;
    const auto id = SlotId::grid(1, 3);
    SettleLog log;

    const auto generation = core.coordinator.load(id, test::heroDescriptor(), 0.75F, log.callback());
    CHECK(generation == 1);

    const auto& loading = core.registry.get(id);
    CHECK(loading.phase() == SlotPhase::Loading);
    CHECK(loading.status == kStatusLoading);
    CHECK(loading.scale == doctest::Approx(0.75F));
    CHECK_FALSE(core.arena.hasInstance(id));

    core.pump();

    REQUIRE(log.outcomes == std::vector<LoadOutcome>{LoadOutcome::Bound});
    const auto& record = core.registry.get(id);
    CHECK(record.phase() == SlotPhase::Bound);
    CHECK(record.hasRig);
    CHECK(record.status == kStatusLoaded);
    CHECK_FALSE(record.error.has_value());
    CHECK(record.animations == std::vector<std::string>{"idle", "walk"});
    CHECK(record.selectedAnimation == "idle");
    CHECK(record.selectedSkin == "default");

    auto* rig = core.arena.instance(id);
    REQUIRE(rig != nullptr);
    CHECK(rig->scale() == doctest::Approx(0.75F));
    CHECK(rig->currentAnimation() == "idle");
    CHECK(rig->isLooping());
    CHECK(rig->currentSkin() == "default");
    CHECK(rig->timeScale() == doctest::Approx(1.0F));
    CHECK(rig->zIndex() == stage::zorder::kRig);
    REQUIRE(core.arena.outline(id) != nullptr);
    CHECK(core.arena.outline(id)->zIndex() == stage::zorder::kOutline);
    CHECK(core.ownershipConsistent());
}

TEST_CASE("Slot settings apply to a fresh rig") {
    test::SlotCore core;
    const auto id = SlotId::single();
    core.coordinator.setLooping(id, false);
    core.coordinator.setPlaying(id, false);

    core.coordinator.load(id, test::heroDescriptor());
    core.pump();

    auto* rig = core.arena.instance(id);
    REQUIRE(rig != nullptr);
    CHECK_FALSE(rig->isLooping());
    CHECK(rig->timeScale() == doctest::Approx(0.0F));

    SUBCASE("A rig without animations or skins still binds") {
        core.runtime.setProfile({{}, {}, {0.0F, 0.0F, 10.0F, 10.0F}});
        core.coordinator.load(id, test::heroDescriptor());
        core.pump();
        CHECK(core.registry.get(id).phase() == SlotPhase::Bound);
        CHECK(core.registry.get(id).selectedAnimation.empty());
        CHECK(core.arena.instance(id)->currentAnimation().empty());
    }
}

TEST_CASE("Rapid double load applies only the newer result") {
    test::SlotCore core;
    const auto id = SlotId::single();
    SettleLog first;
    SettleLog second;

    const auto g1 = core.coordinator.load(id, test::heroDescriptor(), std::nullopt, first.callback());
    const auto g2 = core.coordinator.load(id, test::heroDescriptor(), std::nullopt, second.callback());
    CHECK(g2 > g1);
    REQUIRE(core.assets.pendingLoadCount() == 2);
    CHECK(core.assets.registeredCount() == 4);

    SUBCASE("Older completes first") {
        REQUIRE(core.assets.completeLoad(0));
        CHECK(first.outcomes == std::vector<LoadOutcome>{LoadOutcome::Superseded});
        CHECK_FALSE(core.arena.hasInstance(id));
        CHECK(core.registry.get(id).phase() == SlotPhase::Loading);
        CHECK_FALSE(core.registry.get(id).error.has_value());

        REQUIRE(core.assets.completeLoad(0));
        CHECK(second.outcomes == std::vector<LoadOutcome>{LoadOutcome::Bound});
    }

    SUBCASE("Newer completes first") {
        REQUIRE(core.assets.completeLoad(1));
        CHECK(second.outcomes == std::vector<LoadOutcome>{LoadOutcome::Bound});
        auto* bound = core.arena.instance(id);
        REQUIRE(bound != nullptr);

        REQUIRE(core.assets.completeLoad(0));
        CHECK(first.outcomes == std::vector<LoadOutcome>{LoadOutcome::Superseded});
        // The stale result never displaced the bound rig.
        CHECK(core.arena.instance(id) == bound);
    }

    core.pump();
    CHECK(core.registry.get(id).phase() == SlotPhase::Bound);
    CHECK(core.registry.get(id).generation == g2);
    CHECK(core.arena.boundCount() == 1);
    CHECK(core.assets.registeredCount() == 2);
    CHECK(core.uris.liveCount() == 2);
    CHECK(core.runtime.liveInstances() == 1);
    CHECK(core.ownershipConsistent());

    const auto* bundle = core.arena.bundle(id);
    REQUIRE(bundle != nullptr);
    for (const auto& key : bundle->keys()) {
        CHECK(core.assets.isRegistered(key));
    }
}

TEST_CASE("Reload retires the previous rig before installing") {
    test::SlotCore core;
    const auto id = SlotId::grid(0, 0);
    core.coordinator.load(id, test::heroDescriptor());
    core.pump();
    const auto oldKeys = core.arena.bundle(id)->keys();

    core.coordinator.load(id, test::heroDescriptor());
    // The old rig stays until the new one is ready.
    CHECK(core.arena.hasInstance(id));
    CHECK(core.ownershipConsistent());

    core.pump();
    CHECK(core.arena.boundCount() == 1);
    CHECK(core.runtime.liveInstances() == 1);
    for (const auto& key : oldKeys) {
        CHECK_FALSE(core.assets.isRegistered(key));
    }
    CHECK(core.assets.registeredCount() == 2);
    CHECK(core.uris.liveCount() == 2);
}

TEST_CASE("Clear releases everything attributable to the slot") {
    test::SlotCore core;
    const auto id = SlotId::grid(2, 2);
    const auto other = SlotId::grid(3, 3);
    core.coordinator.load(id, test::heroDescriptor());
    core.coordinator.load(other, test::heroDescriptor());
    core.pump();
    const auto keys = core.arena.bundle(id)->keys();
    const auto uris = core.arena.bundle(id)->uris();

    core.coordinator.setScale(id, 1.5F);
    core.coordinator.clear(id);

    for (const auto& key : keys) {
        CHECK_FALSE(core.assets.isRegistered(key));
    }
    for (const auto& uri : uris) {
        CHECK_FALSE(core.uris.isLive(uri));
    }
    CHECK(core.assets.registeredCount() == 2);
    CHECK(core.uris.liveCount() == 2);
    CHECK(core.arena.outline(id) == nullptr);

    const auto& record = core.registry.get(id);
    CHECK(record.phase() == SlotPhase::Empty);
    CHECK(record.status == kStatusEmpty);
    CHECK_FALSE(record.hasRig);
    CHECK(record.animations.empty());
    CHECK(record.scale == doctest::Approx(1.5F));
    CHECK(core.ownershipConsistent());

    SUBCASE("Clearing during a load makes the load stale") {
        SettleLog log;
        core.coordinator.load(id, test::heroDescriptor(), std::nullopt, log.callback());
        core.coordinator.clear(id);
        core.pump();
        CHECK(log.outcomes == std::vector<LoadOutcome>{LoadOutcome::Superseded});
        CHECK_FALSE(core.arena.hasInstance(id));
        CHECK(core.registry.get(id).phase() == SlotPhase::Empty);
        CHECK(core.assets.registeredCount() == 2);
    }

    SUBCASE("Clearing an empty slot is harmless") {
        core.coordinator.clear(SlotId::grid(4, 0));
        CHECK(core.registry.get(SlotId::grid(4, 0)).phase() == SlotPhase::Empty);
    }
}

TEST_CASE("ClearAll resets every bound grid slot") {
    test::SlotCore core;
    core.coordinator.load(SlotId::single(), test::heroDescriptor());
    for (int i = 0; i < 5; ++i) {
        core.coordinator.load(SlotId::grid(i, i), test::heroDescriptor());
    }
    core.pump();
    REQUIRE(core.arena.boundCount() == 6);

    CHECK(core.coordinator.clearAll() == 5);
    CHECK(core.arena.boundCount() == 1);
    CHECK(core.arena.hasInstance(SlotId::single()));
    CHECK(core.assets.registeredCount() == 2);
    CHECK(core.runtime.liveInstances() == 1);
    CHECK(core.coordinator.clearAll() == 0);
}

TEST_CASE("Bind failures end up in the slot record") {
    test::SlotCore core;
    const auto id = SlotId::grid(0, 1);
    SettleLog log;

    SUBCASE("Missing pages") {
        core.coordinator.load(id, test::makeDescriptor({"page1", "page2"}, {"page1.png"}), std::nullopt, log.callback());
        core.pump();
        CHECK(core.registry.get(id).error == "Missing atlas pages: page2");
    }

    SUBCASE("Instantiation") {
        core.runtime.failNextInstantiation("unsupported skeleton version");
        core.coordinator.load(id, test::heroDescriptor(), std::nullopt, log.callback());
        core.pump();
        CHECK(core.registry.get(id).error == "unsupported skeleton version");
    }

    SUBCASE("Renderer not ready") {
        core.stage.setReady(false);
        core.coordinator.load(id, test::heroDescriptor(), std::nullopt, log.callback());
        CHECK(core.registry.get(id).error == "Renderer is not ready.");
        CHECK(core.assets.loadsRequested() == 0);
    }

    SUBCASE("A failed reload retires the previous rig") {
        core.coordinator.load(id, test::heroDescriptor());
        core.pump();
        REQUIRE(core.arena.hasInstance(id));

        core.assets.failNextLoad("connection reset");
        core.coordinator.load(id, test::heroDescriptor(), std::nullopt, log.callback());
        core.pump();
        CHECK(core.registry.get(id).error == "connection reset");
    }

    REQUIRE(log.outcomes == std::vector<LoadOutcome>{LoadOutcome::Failed});
    const auto& record = core.registry.get(id);
    CHECK(record.phase() == SlotPhase::Failed);
    CHECK(record.status == kStatusFailed);
    CHECK_FALSE(record.hasRig);
    CHECK(record.state.isVacant());
    CHECK_FALSE(core.arena.hasInstance(id));
    CHECK(core.assets.registeredCount() == 0);
    CHECK(core.uris.liveCount() == 0);
    CHECK(core.runtime.liveInstances() == 0);
    CHECK(core.ownershipConsistent());
}

TEST_CASE("Fill empty loads every vacant grid slot in sequence") {
    test::SlotCore core;
    for (const auto id : {SlotId::grid(0, 0), SlotId::grid(2, 2), SlotId::grid(4, 4)}) {
        core.coordinator.load(id, test::heroDescriptor());
    }
    core.pump();
    REQUIRE(core.arena.boundCount() == 3);

    const auto loadsBefore = core.coordinator.loadsStarted();
    std::optional<FillSummary> summary;

    SUBCASE("All succeed") {
        REQUIRE(core.coordinator.fillEmpty(test::heroDescriptor(), 0.5F,
                                           [&summary](const FillSummary& s) { summary = s; }));
        CHECK(core.coordinator.isFilling());
        CHECK_FALSE(core.coordinator.fillEmpty(test::heroDescriptor(), 0.5F));

        size_t maxInFlight = 0;
        do {
            maxInFlight = std::max(maxInFlight, core.assets.pendingLoadCount());
        } while (core.assets.update() > 0);

        CHECK(maxInFlight == 1);
        REQUIRE(summary.has_value());
        CHECK(summary->attempted == 22);
        CHECK(summary->bound == 22);
        CHECK(core.coordinator.loadsStarted() - loadsBefore == 22);
        CHECK(core.arena.boundCount() == 25);
        CHECK_FALSE(core.coordinator.isFilling());

        CHECK(core.registry.get(SlotId::grid(0, 1)).scale == doctest::Approx(0.5F));
        CHECK(core.registry.get(SlotId::grid(0, 0)).scale == doctest::Approx(1.0F));
        CHECK_FALSE(core.arena.hasInstance(SlotId::single()));
    }

    SUBCASE("One failure does not stop the rest") {
        core.assets.failNextLoad("corrupt page");
        core.coordinator.fillEmpty(test::heroDescriptor(), std::nullopt,
                                   [&summary](const FillSummary& s) { summary = s; });
        core.pump();

        REQUIRE(summary.has_value());
        CHECK(summary->attempted == 22);
        CHECK(summary->failed == 1);
        CHECK(summary->bound == 21);
        CHECK(core.arena.boundCount() == 24);
        // Targets run in row-major order; R1C2 was first.
        CHECK(core.registry.get(SlotId::grid(0, 1)).error == "corrupt page");
        CHECK(core.ownershipConsistent());
    }

    SUBCASE("Slots taken mid-fill are skipped") {
        core.coordinator.fillEmpty(test::heroDescriptor(), std::nullopt,
                                   [&summary](const FillSummary& s) { summary = s; });
        core.coordinator.load(SlotId::grid(4, 3), test::heroDescriptor());
        core.pump();

        REQUIRE(summary.has_value());
        CHECK(summary->attempted == 21);
        CHECK(core.arena.boundCount() == 25);
    }

    SUBCASE("Failed slots count as vacant") {
        core.coordinator.clearAll();
        core.assets.failNextLoad("nope");
        core.coordinator.load(SlotId::grid(1, 1), test::heroDescriptor());
        core.pump();
        REQUIRE(core.registry.get(SlotId::grid(1, 1)).phase() == SlotPhase::Failed);

        core.coordinator.fillEmpty(test::heroDescriptor(), std::nullopt,
                                   [&summary](const FillSummary& s) { summary = s; });
        core.pump();
        REQUIRE(summary.has_value());
        CHECK(summary->attempted == 25);
        CHECK_FALSE(core.registry.get(SlotId::grid(1, 1)).error.has_value());
    }
}

TEST_CASE("Exceptions from completion callbacks reach the caller") {
    test::SlotCore core;

    SUBCASE("Load callback") {
        const auto id = SlotId::grid(2, 2);
        core.coordinator.load(id, test::heroDescriptor(), std::nullopt,
                              [](SlotId, LoadOutcome) { throw std::runtime_error("viewer callback failed"); });

        CHECK_THROWS_AS(core.pump(), std::runtime_error);

        // The slot was settled before the callback ran.
        CHECK(core.registry.get(id).phase() == SlotPhase::Bound);
        CHECK(core.arena.hasInstance(id));
        CHECK(core.ownershipConsistent());

        const auto other = SlotId::grid(0, 0);
        core.coordinator.load(other, test::heroDescriptor());
        core.pump();
        CHECK(core.registry.get(other).phase() == SlotPhase::Bound);
    }

    SUBCASE("Fill finished callback") {
        REQUIRE(core.coordinator.fillEmpty(test::heroDescriptor(), std::nullopt,
                                           [](const FillSummary&) { throw std::runtime_error("summary rejected"); }));

        CHECK_THROWS_AS(core.pump(), std::runtime_error);

        CHECK_FALSE(core.coordinator.isFilling());
        for (const auto id : core.registry.gridSlots()) {
            CHECK(core.registry.get(id).phase() == SlotPhase::Bound);
        }
        CHECK(core.ownershipConsistent());
        CHECK(core.coordinator.fillEmpty(test::heroDescriptor(), std::nullopt));
    }
}

TEST_CASE("Rig controls") {
    test::SlotCore core;
    const auto id = SlotId::single();
    core.coordinator.load(id, test::heroDescriptor());
    core.pump();
    auto* rig = dynamic_cast<headless::HeadlessRig*>(core.arena.instance(id));
    REQUIRE(rig != nullptr);

    CHECK(core.coordinator.setAnimation(id, "walk"));
    CHECK(rig->currentAnimation() == "walk");
    CHECK(core.registry.get(id).selectedAnimation == "walk");
    CHECK_FALSE(core.coordinator.setAnimation(id, "fly"));
    CHECK(rig->currentAnimation() == "walk");

    core.coordinator.setLooping(id, false);
    CHECK_FALSE(rig->isLooping());
    CHECK(rig->currentAnimation() == "walk");

    const auto resets = rig->setupPoseResets();
    CHECK(core.coordinator.setSkin(id, "default"));
    CHECK(rig->setupPoseResets() == resets + 1);
    CHECK_FALSE(core.coordinator.setSkin(id, "gold"));

    core.coordinator.setPlaying(id, false);
    CHECK(rig->timeScale() == doctest::Approx(0.0F));
    core.coordinator.setPlaying(id, true);
    CHECK(rig->timeScale() == doctest::Approx(1.0F));

    core.coordinator.setScale(id, 2.0F);
    CHECK(rig->scale() == doctest::Approx(2.0F));
    core.coordinator.setScale(id, 0.0F);
    CHECK(rig->scale() == doctest::Approx(2.0F));

    SUBCASE("Controls on an empty slot only touch the record") {
        const auto empty = SlotId::grid(3, 0);
        CHECK_FALSE(core.coordinator.setAnimation(empty, "idle"));
        core.coordinator.setScale(empty, 0.25F);
        CHECK(core.registry.get(empty).scale == doctest::Approx(0.25F));
    }

    SUBCASE("Scale all touches every grid slot") {
        core.coordinator.load(SlotId::grid(1, 1), test::heroDescriptor());
        core.pump();
        core.coordinator.setScaleAll(0.4F);
        CHECK(core.arena.instance(SlotId::grid(1, 1))->scale() == doctest::Approx(0.4F));
        CHECK(core.registry.get(SlotId::grid(4, 4)).scale == doctest::Approx(0.4F));
        CHECK(rig->scale() == doctest::Approx(2.0F));
    }
}

TEST_CASE("Shutdown releases every live rig and drops pending loads") {
    test::HeadlessBackend backend;
    {
        slots::SlotRegistry registry;
        slots::SlotArena arena;
        assets::AssetBinder binder(backend.assets, backend.runtime, backend.uris);
        stage::StageSynchronizer synchronizer(backend.stage, arena);
        slots::LifecycleCoordinator coordinator(registry, arena, binder, backend.stage, synchronizer);

        coordinator.load(SlotId::single(), test::heroDescriptor());
        coordinator.load(SlotId::grid(0, 0), test::heroDescriptor());
        backend.pump();
        SettleLog pending;
        coordinator.load(SlotId::grid(0, 1), test::heroDescriptor(), std::nullopt, pending.callback());
        REQUIRE(backend.assets.pendingLoadCount() == 1);

        coordinator.shutdown();
        CHECK(coordinator.isShutdown());
        CHECK(arena.boundCount() == 0);
        CHECK(backend.runtime.liveInstances() == 0);
        CHECK(backend.stage.childCount() == 0);
        CHECK(coordinator.load(SlotId::single(), test::heroDescriptor()) == 0);

        // The abandoned load completes into nothing and releases itself.
        backend.pump();
        CHECK(pending.outcomes.empty());
        CHECK(backend.runtime.liveInstances() == 0);
    }
    CHECK(backend.assets.registeredCount() == 0);
    CHECK(backend.uris.liveCount() == 0);
}
