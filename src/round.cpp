#include "round.hpp"

#include "errors.hpp"
#include "fairness.hpp"
#include "plinko.hpp"
#include "secure_random.hpp"

namespace pf {

const char* roundPhaseName(RoundPhase phase) {
    switch (phase) {
    case RoundPhase::COMMITTED:
        return "COMMITTED";
    case RoundPhase::STARTED:
        return "STARTED";
    case RoundPhase::REVEALED:
        return "REVEALED";
    }
    return "UNKNOWN";
}

Round::Round(std::string operatorSecret, std::string roundNonce, GameConfig cfg)
    : config_(std::move(cfg))
    , operatorSecret_(operatorSecret)
    , roundNonce_(std::move(roundNonce))
    , commitment_()
    , phase_(RoundPhase::COMMITTED) {
    config_.validate();

    std::string secretText = operatorSecret_.reveal();
    std::string digest;
    try {
        digest = commitDigest(secretText, roundNonce_);
    } catch (...) {
        secureZero(secretText);
        throw;
    }
    secureZero(secretText);

    commitment_ = RoundCommitment{ std::move(digest), roundNonce_, config_.rows };
}

Round Round::create(GameConfig cfg) {
    return Round(generateOperatorSecret(), generateRoundNonce(), std::move(cfg));
}

RoundStart Round::start(const std::string& playerInput, int columnChoice, std::uint64_t stakeCents) {
    if (phase_ != RoundPhase::COMMITTED) {
        throw ProtocolViolation(std::string("round cannot start from phase ") + roundPhaseName(phase_));
    }
    if (playerInput.empty()) {
        throw InvalidInput("playerInput must not be empty");
    }
    if (stakeCents == 0) {
        throw InvalidInput("stake must be positive");
    }

    std::string secretText = operatorSecret_.reveal();
    std::string combined = combineSeed(secretText, playerInput, roundNonce_);
    secureZero(secretText);

    PlinkoOutcome outcome = computeOutcome(combined, columnChoice, config_);
    PayoutResult payout = resolvePayout(stakeCents, outcome.landingIndex, config_.paytable);

    playerInput_ = playerInput;
    combinedSeed_ = std::move(combined);
    phase_ = RoundPhase::STARTED;

    return RoundStart{ playerInput_,
                       columnChoice,
                       stakeCents,
                       std::move(outcome.boardFingerprint),
                       std::move(outcome.path),
                       outcome.landingIndex,
                       payout };
}

RoundReveal Round::reveal() {
    if (phase_ != RoundPhase::STARTED) {
        throw ProtocolViolation(std::string("round cannot reveal from phase ") + roundPhaseName(phase_));
    }
    phase_ = RoundPhase::REVEALED;
    return RoundReveal{ operatorSecret_.reveal(), roundNonce_, playerInput_, commitment_.commitDigest, combinedSeed_ };
}

} // namespace pf
