#pragma once

#include "rigview/slots/SlotId.hpp"
#include "rigview/slots/SlotStateMachine.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rigview::slots
{
    inline constexpr const char* kStatusEmpty = "Empty slot.";
    inline constexpr const char* kStatusLoading = "Loading assets...";
    inline constexpr const char* kStatusLoaded = "Rig loaded.";
    inline constexpr const char* kStatusFailed = "Load failed.";

    // Plain value: readers always get a complete snapshot.
    struct SlotRecord
    {
        SlotId id;
        SlotStateMachine state;
        bool hasRig = false;

        std::vector<std::string> animations;
        std::string selectedAnimation;
        std::vector<std::string> skins;
        std::string selectedSkin;

        bool looping = true;
        bool playing = true;
        float scale = 1.0F;

        std::string status = kStatusEmpty;
        std::optional<std::string> error;

        // Bumped whenever a load starts (and on clear); completions carrying
        // an older value are stale.
        uint64_t generation = 0;

        SlotPhase phase() const { return state.getCurrentState(); }

        static SlotRecord empty(SlotId id)
        {
            SlotRecord record;
            record.id = id;
            return record;
        }
    };
}
