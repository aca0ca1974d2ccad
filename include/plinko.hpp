#pragma once

#include "board.hpp"
#include "path.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pf {

struct GameConfig;

struct PlinkoOutcome {
    Board board;
    std::string boardFingerprint;
    std::vector<PathDecision> path;
    std::size_t landingIndex;
};

// Pure function of its arguments: fresh generator from the combined seed, board, fingerprint,
// then the path on the same generator. Throws InvalidInput for a column outside [0, rowCount].
PlinkoOutcome computeOutcome(const std::string& combinedSeed,
                             int columnChoice,
                             std::size_t rowCount,
                             std::size_t centerColumn);
PlinkoOutcome computeOutcome(const std::string& combinedSeed, int columnChoice, const GameConfig& cfg);

struct ReplayResult {
    bool matches;
    PlinkoOutcome outcome;
};

// Both the landing index and the fingerprint must match; equal bins alone prove nothing about the board.
ReplayResult replayOutcome(const std::string& combinedSeed,
                           int columnChoice,
                           std::size_t rowCount,
                           std::size_t centerColumn,
                           std::size_t expectedLandingIndex,
                           const std::string& expectedFingerprint);

bool replay(const std::string& combinedSeed,
            int columnChoice,
            std::size_t rowCount,
            std::size_t centerColumn,
            std::size_t expectedLandingIndex,
            const std::string& expectedFingerprint);

} // namespace pf
