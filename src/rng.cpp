#include "rng.hpp"

#include "errors.hpp"
#include "hash.hpp"

namespace pf {

namespace {

constexpr double kTwoPow32 = 4294967296.0;

std::uint32_t hexDigitValue(char ch) {
    if (ch >= '0' && ch <= '9') {
        return static_cast<std::uint32_t>(ch - '0');
    }
    if (ch >= 'a' && ch <= 'f') {
        return static_cast<std::uint32_t>(ch - 'a' + 10);
    }
    return static_cast<std::uint32_t>(ch - 'A' + 10);
}

} // namespace

Xorshift32::Xorshift32(const std::string& combinedSeedHex)
    : Xorshift32(parseSeedState(combinedSeedHex)) {}

Xorshift32::Xorshift32(std::uint32_t state)
    : state_(state == 0 ? 1u : state)
    , drawCount_(0) {}

Xorshift32 Xorshift32::fromState(std::uint32_t state) {
    return Xorshift32(state);
}

std::uint32_t Xorshift32::parseSeedState(const std::string& combinedSeedHex) {
    if (combinedSeedHex.size() < kSeedHexChars) {
        throw InvalidInput("seed must carry at least 8 hex characters");
    }
    std::string prefix = combinedSeedHex.substr(0, kSeedHexChars);
    if (!isHexString(prefix)) {
        throw InvalidInput("seed prefix is not hexadecimal: " + prefix);
    }

    std::uint32_t value = 0;
    for (char ch : prefix) {
        value = (value << 4) | hexDigitValue(ch);
    }
    return value;
}

double Xorshift32::next() {
    std::uint32_t x = state_;
    x ^= x << 13;
    x ^= x >> 17;
    x ^= x << 5;
    state_ = x;
    ++drawCount_;
    return static_cast<double>(state_) / kTwoPow32;
}

std::vector<double> Xorshift32::nextN(std::size_t count) {
    std::vector<double> draws;
    draws.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        draws.push_back(next());
    }
    return draws;
}

} // namespace pf
