#include "verifier.hpp"

#include "errors.hpp"
#include "game_config.hpp"

namespace pf {

bool VerificationReport::allMatch() const {
    if (commitMatches && !*commitMatches) {
        return false;
    }
    if (outcomeMatches && !*outcomeMatches) {
        return false;
    }
    return true;
}

VerificationReport verifyRound(const VerificationRequest& request, const GameConfig& cfg) {
    if (request.expectedLandingIndex.has_value() != request.expectedFingerprint.has_value()) {
        throw InvalidInput("expected landing index and board fingerprint must be supplied together");
    }
    cfg.validate();

    const SeedMaterial& material = request.material;
    std::string digest = commitDigest(material.operatorSecret, material.roundNonce);
    std::string combined = combineSeed(material);
    PlinkoOutcome outcome = computeOutcome(combined, request.columnChoice, cfg);
    Fixed64 multiplier = cfg.paytable.multiplierFor(outcome.landingIndex);

    VerificationReport report{ digest, combined, std::move(outcome), multiplier, std::nullopt, std::nullopt };
    if (request.publishedCommit) {
        report.commitMatches =
            verifyCommit(*request.publishedCommit, material.operatorSecret, material.roundNonce);
    }
    if (request.expectedLandingIndex) {
        report.outcomeMatches = report.outcome.landingIndex == *request.expectedLandingIndex &&
                                report.outcome.boardFingerprint == *request.expectedFingerprint;
    }
    return report;
}

} // namespace pf
