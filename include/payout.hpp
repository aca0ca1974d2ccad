#pragma once

#include "fixed_point.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pf {

// Landing index -> multiplier. Symmetric by construction: entry i equals entry size-1-i.
class Paytable {
public:
    explicit Paytable(std::vector<Fixed64> multipliers);

    // 13 bins for the 12-row board: 16, 9, 2, 1.4, 1.1, 1, 0.5, 1, 1.1, 1.4, 2, 9, 16.
    static Paytable standard();

    Fixed64 multiplierFor(std::size_t landingIndex) const;

    std::size_t size() const { return multipliers_.size(); }
    const std::vector<Fixed64>& getMultipliers() const { return multipliers_; }

private:
    std::vector<Fixed64> multipliers_;
};

struct PayoutResult {
    Fixed64 multiplier;
    std::uint64_t grossPayoutCents;
    std::int64_t netChangeCents;
};

PayoutResult resolvePayout(std::uint64_t stakeCents, std::size_t landingIndex, const Paytable& table);

} // namespace pf
