#include "wake.hpp"

namespace Wake {

bool operator==(const WakeupReason& a, const WakeupReason& b) {
    if (a.stimulant != b.stimulant) return false;
    return a.stimulant != Stimulant::ExitKeyPressed || a.key == b.key;
}

bool operator!=(const WakeupReason& a, const WakeupReason& b) {
    return !(a == b);
}

std::string toString(const WakeupReason& reason) {
    switch (reason.stimulant) {
        case Stimulant::IntervalTick:   return "IntervalTick";
        case Stimulant::ExitKeyPressed: return "ExitKeyPressed(" + reason.key.name() + ")";
    }
    return "Unknown";
}

} // namespace Wake
