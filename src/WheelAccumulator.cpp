#include "macrorec/WheelAccumulator.hpp"

#include "macrorec/Errors.hpp"

namespace macrorec {

WheelAccumulator::WheelAccumulator(int unitsPerNotch)
    : unitsPerNotch(unitsPerNotch) {
    if (unitsPerNotch <= 0) {
        throw ValueError("wheel units per notch must be a positive integer");
    }
}

int WheelAccumulator::add(int units) {
    if ((units > 0 && pending < 0) || (units < 0 && pending > 0)) {
        pending = 0;
    }
    pending += units;
    int notches = pending / unitsPerNotch;
    pending -= notches * unitsPerNotch;
    return notches;
}

void WheelAccumulator::reset() {
    pending = 0;
}

} // namespace macrorec
