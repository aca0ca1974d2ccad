#pragma once

#include <cstddef>
#include <string>

namespace pf {

constexpr std::size_t kDigestHexLength = 64;

// SHA-256 over the raw bytes of `input`, rendered as 64 lowercase hex characters.
std::string sha256Hex(const std::string& input);

bool isHexString(const std::string& value);
bool isDigestHex(const std::string& value);

} // namespace pf
