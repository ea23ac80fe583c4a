#include <doctest/doctest.h>
#include "rigview/slots/SlotRegistry.hpp"

#include <set>
#include <stdexcept>

using namespace rigview::slots;

TEST_CASE("Slot identity") {
    CHECK(SlotId::single().key() == "single");
    CHECK(SlotId::single().label() == "Single");
    CHECK(SlotId::grid(0, 0).key() == "slot-0-0");
    CHECK(SlotId::grid(0, 0).label() == "R1C1");
    CHECK(SlotId::grid(4, 2).key() == "slot-4-2");
    CHECK(SlotId::grid(4, 2).label() == "R5C3");
    CHECK(SlotId::single() < SlotId::grid(0, 0));
    CHECK(SlotId::grid(0, 4) < SlotId::grid(1, 0));
}

TEST_CASE("SlotRegistry") {
    SlotRegistry registry;

    SUBCASE("Twenty-five grid slots plus the single slot, all empty") {
        const auto grid = registry.gridSlots();
        CHECK(grid.size() == 25);
        CHECK(grid.front() == SlotId::grid(0, 0));
        CHECK(grid.back() == SlotId::grid(4, 4));
        CHECK(std::set<SlotId>(grid.begin(), grid.end()).size() == 25);

        const auto all = registry.allSlots();
        CHECK(all.size() == 26);
        CHECK(all.front() == SlotId::single());

        for (const auto id : all) {
            const auto& record = registry.get(id);
            CHECK(record.id == id);
            CHECK(record.phase() == SlotPhase::Empty);
            CHECK(record.status == kStatusEmpty);
            CHECK_FALSE(record.hasRig);
            CHECK(record.generation == 0);
        }
    }

    SUBCASE("Update replaces the whole record") {
        const auto id = SlotId::grid(2, 1);
        const auto& updated = registry.update(id, [](SlotRecord r) {
            r.scale = 0.5F;
            r.status = kStatusLoading;
            ++r.generation;
            return r;
        });
        CHECK(updated.scale == doctest::Approx(0.5F));
        CHECK(registry.get(id).generation == 1);
        CHECK(registry.get(SlotId::grid(1, 2)).generation == 0);
        CHECK(registry.get(SlotId::single()).generation == 0);
    }

    SUBCASE("Set stores by the record's own id") {
        auto record = SlotRecord::empty(SlotId::single());
        record.error = "boom";
        registry.set(record);
        CHECK(registry.get(SlotId::single()).error == "boom");
    }

    SUBCASE("Cells outside the grid are rejected") {
        CHECK_THROWS_AS(registry.get(SlotId::grid(5, 0)), std::out_of_range);
        CHECK_THROWS_AS(registry.get(SlotId::grid(0, -1)), std::out_of_range);
    }
}
