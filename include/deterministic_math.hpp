#pragma once

#include "fixed_point.hpp"

#include <cstdint>

namespace pf {

class DeterministicMath {
public:
    // Rounds `value * 10^decimals` to an integer, ties away from zero, working on the exact
    // binary value of `value` instead of a formatted approximation of it.
    static std::int64_t roundScaled(double value, int decimals);

    static Fixed64 roundToFixed(double value);

    static double clamp(double value, double minValue, double maxValue);
};

} // namespace pf
