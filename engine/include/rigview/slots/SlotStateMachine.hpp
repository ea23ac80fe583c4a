#pragma once

#include <string_view>

namespace rigview::slots {

enum class SlotPhase {
    Empty,
    Loading,
    Bound,
    Failed
};

class SlotStateMachine {
public:
    SlotStateMachine() = default;

    SlotPhase getCurrentState() const { return m_currentState; }

    bool tryTransition(SlotPhase newState) {
        // Self-transition: Loading -> Loading is a superseding load
        if (m_currentState == newState) {
            return true;
        }

        bool valid = false;
        switch (m_currentState) {
        case SlotPhase::Empty:
            valid = (newState == SlotPhase::Loading);
            break;
        case SlotPhase::Loading:
            // Empty covers a clear while the load is in flight
            valid = (newState == SlotPhase::Bound || newState == SlotPhase::Failed ||
                     newState == SlotPhase::Empty);
            break;
        case SlotPhase::Bound:
            valid = (newState == SlotPhase::Loading || newState == SlotPhase::Empty);
            break;
        case SlotPhase::Failed:
            // Failed behaves like Empty, with the error still visible
            valid = (newState == SlotPhase::Loading || newState == SlotPhase::Empty);
            break;
        }

        if (valid) {
            m_currentState = newState;
            return true;
        }

        return false;
    }

    // Empty or Failed: no bound rig and no load in flight
    bool isVacant() const {
        return m_currentState == SlotPhase::Empty || m_currentState == SlotPhase::Failed;
    }

    static constexpr std::string_view stateToString(SlotPhase state) {
        switch (state) {
        case SlotPhase::Empty:   return "Empty";
        case SlotPhase::Loading: return "Loading";
        case SlotPhase::Bound:   return "Bound";
        case SlotPhase::Failed:  return "Failed";
        default:                 return "Unknown";
        }
    }

private:
    SlotPhase m_currentState = SlotPhase::Empty;
};

} // namespace rigview::slots
