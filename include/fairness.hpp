#pragma once

#include <string>

namespace pf {

// The three inputs that determine a round. operatorSecret and roundNonce are fixed when the
// commitment is published; playerInput is fixed before the outcome is computed.
struct SeedMaterial {
    std::string operatorSecret;
    std::string playerInput;
    std::string roundNonce;
};

// SHA256(operatorSecret ":" roundNonce). Published before the player input is known.
std::string commitDigest(const std::string& operatorSecret, const std::string& roundNonce);

// SHA256(operatorSecret ":" playerInput ":" roundNonce). Root of all randomness for the round.
std::string combineSeed(const std::string& operatorSecret,
                        const std::string& playerInput,
                        const std::string& roundNonce);
std::string combineSeed(const SeedMaterial& material);

// Exact string comparison against a recomputed commitment. A mismatch is a finding, not an error.
bool verifyCommit(const std::string& publishedDigest,
                  const std::string& operatorSecret,
                  const std::string& roundNonce);

} // namespace pf
