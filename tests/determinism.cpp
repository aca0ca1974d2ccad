#include "errors.hpp"
#include "game_config.hpp"
#include "hash.hpp"
#include "plinko.hpp"
#include "test_vectors.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "determinism_test failure: " << msg << std::endl;
    std::exit(1);
}

bool samePath(const std::vector<pf::PathDecision>& a, const std::vector<pf::PathDecision>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i].row != b[i].row || a[i].pegIndex != b[i].pegIndex || a[i].leftBias != b[i].leftBias ||
            a[i].adjustedBias != b[i].adjustedBias || a[i].draw != b[i].draw ||
            a[i].decision != b[i].decision) {
            return false;
        }
    }
    return true;
}

} // namespace

int main() {
    using namespace pf;

    auto outcomeA =
        computeOutcome(vectors::kCombinedSeed, vectors::kColumn, vectors::kRows, vectors::kCenterColumn);
    auto outcomeB =
        computeOutcome(vectors::kCombinedSeed, vectors::kColumn, vectors::kRows, vectors::kCenterColumn);

    if (outcomeA.landingIndex != vectors::kLandingIndex) {
        fail("reference round landed in bin " + std::to_string(outcomeA.landingIndex));
    }
    if (outcomeA.boardFingerprint != vectors::kBoardFingerprint) {
        fail("reference round fingerprint changed");
    }
    if (outcomeA.boardFingerprint != outcomeB.boardFingerprint || outcomeA.landingIndex != outcomeB.landingIndex ||
        !samePath(outcomeA.path, outcomeB.path)) {
        fail("identical inputs produced different outcomes");
    }
    if (outcomeA.path.size() != vectors::kRows) {
        fail("path length differs from row count");
    }

    auto viaConfig = computeOutcome(vectors::kCombinedSeed, vectors::kColumn, defaultGameConfig());
    if (viaConfig.boardFingerprint != outcomeA.boardFingerprint || viaConfig.landingIndex != outcomeA.landingIndex) {
        fail("config overload disagrees with explicit parameters");
    }

    auto farLeft = computeOutcome(vectors::kCombinedSeed, 0, vectors::kRows, vectors::kCenterColumn);
    auto farRight = computeOutcome(vectors::kCombinedSeed, 12, vectors::kRows, vectors::kCenterColumn);
    if (farLeft.landingIndex == farRight.landingIndex) {
        fail("edge columns landed in the same bin for the reference seed");
    }
    if (farLeft.boardFingerprint != farRight.boardFingerprint) {
        fail("column choice must not influence the board");
    }

    for (int bad : { -1, 13, 100 }) {
        bool rejected = false;
        try {
            computeOutcome(vectors::kCombinedSeed, bad, vectors::kRows, vectors::kCenterColumn);
        } catch (const InvalidInput&) {
            rejected = true;
        }
        if (!rejected) {
            fail("column " + std::to_string(bad) + " not rejected");
        }
    }

    bool badSeedRejected = false;
    try {
        computeOutcome("not-a-digest", vectors::kColumn, vectors::kRows, vectors::kCenterColumn);
    } catch (const InvalidInput&) {
        badSeedRejected = true;
    }
    if (!badSeedRejected) {
        fail("malformed combined seed accepted");
    }

    if (!replay(vectors::kCombinedSeed, vectors::kColumn, vectors::kRows, vectors::kCenterColumn,
                vectors::kLandingIndex, vectors::kBoardFingerprint)) {
        fail("replay rejected the reference round");
    }
    if (replay(vectors::kCombinedSeed, vectors::kColumn, vectors::kRows, vectors::kCenterColumn,
               vectors::kLandingIndex + 1, vectors::kBoardFingerprint)) {
        fail("replay accepted a wrong landing index");
    }
    std::string wrongFingerprint = vectors::kBoardFingerprint;
    wrongFingerprint[0] = wrongFingerprint[0] == '0' ? '1' : '0';
    if (replay(vectors::kCombinedSeed, vectors::kColumn, vectors::kRows, vectors::kCenterColumn,
               vectors::kLandingIndex, wrongFingerprint)) {
        fail("replay accepted a wrong fingerprint");
    }
    auto detailed = replayOutcome(vectors::kCombinedSeed, vectors::kColumn, vectors::kRows,
                                  vectors::kCenterColumn, vectors::kLandingIndex, wrongFingerprint);
    if (detailed.matches || detailed.outcome.boardFingerprint != vectors::kBoardFingerprint) {
        fail("replayOutcome must report the recomputed outcome alongside the mismatch");
    }

    // Independent rounds on independent threads, each owning its generator.
    std::vector<std::string> seeds;
    for (int i = 0; i < 64; ++i) {
        seeds.push_back(sha256Hex("determinism-thread:" + std::to_string(i)));
    }
    std::vector<PlinkoOutcome> sequential;
    for (const auto& seed : seeds) {
        sequential.push_back(computeOutcome(seed, 3, vectors::kRows, vectors::kCenterColumn));
    }
    std::vector<PlinkoOutcome> parallel(seeds.size());
    std::vector<std::thread> workers;
    for (std::size_t t = 0; t < 4; ++t) {
        workers.emplace_back([&, t] {
            for (std::size_t i = t; i < seeds.size(); i += 4) {
                parallel[i] = computeOutcome(seeds[i], 3, vectors::kRows, vectors::kCenterColumn);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    for (std::size_t i = 0; i < seeds.size(); ++i) {
        if (parallel[i].boardFingerprint != sequential[i].boardFingerprint ||
            parallel[i].landingIndex != sequential[i].landingIndex || !samePath(parallel[i].path, sequential[i].path)) {
            fail("concurrent computation diverged for seed " + std::to_string(i));
        }
    }

    std::cout << "Determinism check passed. Fingerprint: " << outcomeA.boardFingerprint << "\n";
    return 0;
}
