#pragma once

#include "game_config.hpp"
#include "path.hpp"
#include "payout.hpp"
#include "secure_memory.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pf {

enum class RoundPhase {
    COMMITTED,
    STARTED,
    REVEALED
};

const char* roundPhaseName(RoundPhase phase);

// Everything the player may see before supplying their input.
struct RoundCommitment {
    std::string commitDigest;
    std::string roundNonce;
    std::size_t rows;
};

// Result of the start step. Carries neither the operator secret nor the combined seed.
struct RoundStart {
    std::string playerInput;
    int columnChoice;
    std::uint64_t stakeCents;
    std::string boardFingerprint;
    std::vector<PathDecision> path;
    std::size_t landingIndex;
    PayoutResult payout;
};

struct RoundReveal {
    std::string operatorSecret;
    std::string roundNonce;
    std::string playerInput;
    std::string commitDigest;
    std::string combinedSeed;
};

// One round, COMMITTED -> STARTED -> REVEALED. The commitment exists from construction, so the
// combined seed can never be derived before it was publishable. Out-of-order calls throw
// ProtocolViolation and leave the round untouched.
class Round {
public:
    Round(std::string operatorSecret, std::string roundNonce, GameConfig cfg);

    // Fresh operator secret and nonce from libsodium.
    static Round create(GameConfig cfg);

    RoundPhase getPhase() const { return phase_; }
    const RoundCommitment& getCommitment() const { return commitment_; }
    const GameConfig& getConfig() const { return config_; }

    RoundStart start(const std::string& playerInput, int columnChoice, std::uint64_t stakeCents);
    RoundReveal reveal();

private:
    GameConfig config_;
    SecretText operatorSecret_;
    std::string roundNonce_;
    RoundCommitment commitment_;
    RoundPhase phase_;
    std::string playerInput_;
    std::string combinedSeed_;
};

} // namespace pf
