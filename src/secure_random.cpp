#include "secure_random.hpp"

#include "secure_memory.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <sodium.h>

namespace pf {

namespace {

constexpr std::size_t kOperatorSecretBytes = 32;
constexpr std::uint32_t kRoundNonceBound = 1'000'000;
constexpr std::size_t kPlayerInputEntropyBytes = 8;

void ensureSodiumReady() {
    if (sodium_init() < 0) {
        throw std::runtime_error("Unable to initialize libsodium RNG");
    }
}

} // namespace

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes) {
    std::vector<std::uint8_t> buffer(numBytes);
    if (numBytes == 0) {
        return buffer;
    }

    ensureSodiumReady();
    randombytes_buf(buffer.data(), buffer.size());
    return buffer;
}

std::string secureRandomHex(std::size_t numBytes) {
    auto bytes = secureRandomBytes(numBytes);
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    secureZero(bytes.data(), bytes.size());
    return oss.str();
}

std::uint32_t secureRandomBelow(std::uint32_t upperBound) {
    if (upperBound < 2) {
        return 0;
    }
    ensureSodiumReady();
    return randombytes_uniform(upperBound);
}

std::string generateOperatorSecret() {
    return secureRandomHex(kOperatorSecretBytes);
}

std::string generateRoundNonce() {
    return std::to_string(secureRandomBelow(kRoundNonceBound));
}

std::string generatePlayerInput() {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
    std::ostringstream oss;
    oss << "player-" << millis << "-" << secureRandomHex(kPlayerInputEntropyBytes);
    return oss.str();
}

} // namespace pf
