#pragma once
#include <string>

#include "evdev/key_code.hpp"

namespace Wake {

// What ended a Sleeper::wait()
enum class Stimulant {
    IntervalTick,
    ExitKeyPressed
};

struct WakeupReason {
    Stimulant stimulant = Stimulant::IntervalTick;
    Evdev::KeyCode key;   // only meaningful for ExitKeyPressed

    static WakeupReason intervalTick() { return { Stimulant::IntervalTick, Evdev::KeyCode() }; }
    static WakeupReason exitKeyPressed(Evdev::KeyCode code) { return { Stimulant::ExitKeyPressed, code }; }

    bool isExitKey() const { return stimulant == Stimulant::ExitKeyPressed; }
};

bool operator==(const WakeupReason& a, const WakeupReason& b);
bool operator!=(const WakeupReason& a, const WakeupReason& b);

std::string toString(const WakeupReason& reason);

} // namespace Wake
