#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pf {

// xorshift32 (13, 17, 5). The only source of randomness for board generation and path
// simulation. One instance serves one round; board and path consume a single stream, so the
// generator is passed by reference and cannot be copied.
class Xorshift32 {
public:
    static constexpr std::size_t kSeedHexChars = 8;

    explicit Xorshift32(const std::string& combinedSeedHex);
    static Xorshift32 fromState(std::uint32_t state);

    Xorshift32(const Xorshift32&) = delete;
    Xorshift32& operator=(const Xorshift32&) = delete;
    Xorshift32(Xorshift32&&) = default;
    Xorshift32& operator=(Xorshift32&&) = default;

    // Advances the state and returns state / 2^32, in [0, 1).
    double next();
    std::vector<double> nextN(std::size_t count);

    std::uint32_t getState() const { return state_; }
    std::uint64_t getDrawCount() const { return drawCount_; }

    // First 8 hex characters of the seed, big-endian.
    static std::uint32_t parseSeedState(const std::string& combinedSeedHex);

private:
    explicit Xorshift32(std::uint32_t state);

    std::uint32_t state_;
    std::uint64_t drawCount_;
};

} // namespace pf
