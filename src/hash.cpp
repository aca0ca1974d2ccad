#include "hash.hpp"

#include "picosha2.h"

#include <algorithm>
#include <cctype>
#include <vector>

namespace pf {

std::string sha256Hex(const std::string& input) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(input.begin(), input.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

bool isHexString(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isxdigit(ch) != 0;
    });
}

bool isDigestHex(const std::string& value) {
    return value.size() == kDigestHexLength && isHexString(value);
}

} // namespace pf
