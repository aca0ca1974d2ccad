#include "plinko.hpp"

#include "errors.hpp"
#include "game_config.hpp"
#include "hash.hpp"
#include "rng.hpp"

namespace pf {

PlinkoOutcome computeOutcome(const std::string& combinedSeed,
                             int columnChoice,
                             std::size_t rowCount,
                             std::size_t centerColumn) {
    if (rowCount == 0) {
        throw InvalidInput("row count must be positive");
    }
    if (columnChoice < 0 || static_cast<std::size_t>(columnChoice) > rowCount) {
        throw InvalidInput("column choice " + std::to_string(columnChoice) + " outside [0, " +
                           std::to_string(rowCount) + "]");
    }
    if (centerColumn > rowCount) {
        throw InvalidInput("center column " + std::to_string(centerColumn) + " outside [0, " +
                           std::to_string(rowCount) + "]");
    }
    if (!isDigestHex(combinedSeed)) {
        throw InvalidInput("combined seed must be a 64 character hex digest");
    }

    Xorshift32 rng(combinedSeed);
    Board board = generateBoard(rng, rowCount);
    std::string fingerprint = boardFingerprint(board);
    PathResult path = simulatePath(board, columnChoice, rng, rowCount, centerColumn);

    return PlinkoOutcome{ std::move(board),
                          std::move(fingerprint),
                          std::move(path.decisions),
                          path.landingIndex };
}

PlinkoOutcome computeOutcome(const std::string& combinedSeed, int columnChoice, const GameConfig& cfg) {
    cfg.validate();
    return computeOutcome(combinedSeed, columnChoice, cfg.rows, cfg.centerColumn);
}

ReplayResult replayOutcome(const std::string& combinedSeed,
                           int columnChoice,
                           std::size_t rowCount,
                           std::size_t centerColumn,
                           std::size_t expectedLandingIndex,
                           const std::string& expectedFingerprint) {
    PlinkoOutcome outcome = computeOutcome(combinedSeed, columnChoice, rowCount, centerColumn);
    bool matches = outcome.landingIndex == expectedLandingIndex &&
                   outcome.boardFingerprint == expectedFingerprint;
    return ReplayResult{ matches, std::move(outcome) };
}

bool replay(const std::string& combinedSeed,
            int columnChoice,
            std::size_t rowCount,
            std::size_t centerColumn,
            std::size_t expectedLandingIndex,
            const std::string& expectedFingerprint) {
    return replayOutcome(combinedSeed, columnChoice, rowCount, centerColumn, expectedLandingIndex,
                         expectedFingerprint)
        .matches;
}

} // namespace pf
