#pragma once

#include "fairness.hpp"
#include "fixed_point.hpp"
#include "plinko.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace pf {

struct GameConfig;

struct VerificationRequest {
    SeedMaterial material;
    int columnChoice = 0;
    std::optional<std::string> publishedCommit;
    // Supplied together or not at all.
    std::optional<std::size_t> expectedLandingIndex;
    std::optional<std::string> expectedFingerprint;
};

struct VerificationReport {
    std::string commitDigest;
    std::string combinedSeed;
    PlinkoOutcome outcome;
    Fixed64 multiplier;
    std::optional<bool> commitMatches;
    std::optional<bool> outcomeMatches;

    // False if any supplied expectation failed to match.
    bool allMatch() const;
};

// Recomputes a round from revealed material alone, no operator state involved.
VerificationReport verifyRound(const VerificationRequest& request, const GameConfig& cfg);

} // namespace pf
