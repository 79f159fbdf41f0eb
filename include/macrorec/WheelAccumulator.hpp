#pragma once

namespace macrorec {

// Converts raw wheel units into whole notches. High resolution wheels and
// touchpads report fractions of a notch; the remainder is carried into the
// next event until it adds up. Reversing direction drops the remainder.
class WheelAccumulator {
public:
    // Throws ValueError if unitsPerNotch <= 0.
    explicit WheelAccumulator(int unitsPerNotch = 120);

    // Returns the number of whole notches completed by this event, signed.
    int add(int units);

    void reset();

private:
    int unitsPerNotch;
    int pending = 0;
};

} // namespace macrorec
