#include "payout.hpp"

#include "errors.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace pf {

namespace {

std::int64_t checkedStakeToInt64(std::uint64_t stake) {
    constexpr std::uint64_t maxStake =
        static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (stake > maxStake) {
        throw std::overflow_error("stake too large for signed accounting");
    }
    return static_cast<std::int64_t>(stake);
}

} // namespace

Paytable::Paytable(std::vector<Fixed64> multipliers)
    : multipliers_(std::move(multipliers)) {
    if (multipliers_.empty()) {
        throw InvalidInput("paytable must have at least one bin");
    }
    const Fixed64 zero;
    for (std::size_t i = 0; i < multipliers_.size(); ++i) {
        if (multipliers_[i] < zero) {
            throw InvalidInput("paytable multiplier for bin " + std::to_string(i) + " is negative");
        }
        std::size_t mirror = multipliers_.size() - 1 - i;
        if (multipliers_[i] != multipliers_[mirror]) {
            throw InvalidInput("paytable is not symmetric at bins " + std::to_string(i) + " and " +
                               std::to_string(mirror));
        }
    }
}

Paytable Paytable::standard() {
    const double table[] = { 16.0, 9.0, 2.0, 1.4, 1.1, 1.0, 0.5, 1.0, 1.1, 1.4, 2.0, 9.0, 16.0 };
    std::vector<Fixed64> multipliers;
    for (double value : table) {
        multipliers.push_back(Fixed64::fromDouble(value));
    }
    return Paytable(std::move(multipliers));
}

Fixed64 Paytable::multiplierFor(std::size_t landingIndex) const {
    if (landingIndex >= multipliers_.size()) {
        throw OutOfRange("landing index " + std::to_string(landingIndex) + " outside paytable of " +
                         std::to_string(multipliers_.size()) + " bins");
    }
    return multipliers_[landingIndex];
}

PayoutResult resolvePayout(std::uint64_t stakeCents, std::size_t landingIndex, const Paytable& table) {
    if (stakeCents == 0) {
        throw InvalidInput("stake must be positive");
    }
    std::int64_t stake = checkedStakeToInt64(stakeCents);
    Fixed64 multiplier = table.multiplierFor(landingIndex);

    __int128 scaled = static_cast<__int128>(stakeCents) * static_cast<__int128>(multiplier.raw());
    __int128 payout128 = scaled / Fixed64::kScale;
    constexpr __int128 maxInt64 = static_cast<__int128>(std::numeric_limits<std::int64_t>::max());
    if (payout128 > maxInt64) {
        throw std::overflow_error("grossPayout exceeds signed range");
    }

    auto gross = static_cast<std::uint64_t>(payout128);
    return PayoutResult{ multiplier, gross, static_cast<std::int64_t>(gross) - stake };
}

} // namespace pf
