#include "fairness.hpp"

#include "errors.hpp"
#include "hash.hpp"

#include <sstream>

namespace pf {

namespace {

constexpr char kFieldSeparator = ':';

void requireNonEmpty(const std::string& value, const char* field) {
    if (value.empty()) {
        throw InvalidInput(std::string(field) + " must not be empty");
    }
}

} // namespace

std::string commitDigest(const std::string& operatorSecret, const std::string& roundNonce) {
    requireNonEmpty(operatorSecret, "operatorSecret");
    requireNonEmpty(roundNonce, "roundNonce");

    std::ostringstream oss;
    oss << operatorSecret << kFieldSeparator << roundNonce;
    return sha256Hex(oss.str());
}

std::string combineSeed(const std::string& operatorSecret,
                        const std::string& playerInput,
                        const std::string& roundNonce) {
    requireNonEmpty(operatorSecret, "operatorSecret");
    requireNonEmpty(playerInput, "playerInput");
    requireNonEmpty(roundNonce, "roundNonce");

    std::ostringstream oss;
    oss << operatorSecret << kFieldSeparator << playerInput << kFieldSeparator << roundNonce;
    return sha256Hex(oss.str());
}

std::string combineSeed(const SeedMaterial& material) {
    return combineSeed(material.operatorSecret, material.playerInput, material.roundNonce);
}

bool verifyCommit(const std::string& publishedDigest,
                  const std::string& operatorSecret,
                  const std::string& roundNonce) {
    if (operatorSecret.empty() || roundNonce.empty()) {
        return false;
    }
    return commitDigest(operatorSecret, roundNonce) == publishedDigest;
}

} // namespace pf
