#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pf {

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes);
std::string secureRandomHex(std::size_t numBytes);
std::uint32_t secureRandomBelow(std::uint32_t upperBound);

// 32 bytes of entropy as 64 lowercase hex characters.
std::string generateOperatorSecret();
// Decimal text of a uniform integer in [0, 1000000).
std::string generateRoundNonce();
// Default player input when the player supplies none: player-<unix millis>-<16 hex>.
std::string generatePlayerInput();

} // namespace pf
