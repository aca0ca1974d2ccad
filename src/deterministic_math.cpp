#include "deterministic_math.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include <boost/multiprecision/cpp_int.hpp>

namespace mp = boost::multiprecision;

namespace pf {
namespace {

constexpr int kMantissaBits = std::numeric_limits<double>::digits; // 53
constexpr int kMaxDecimals = 18;

mp::cpp_int powerOfTen(int exponent) {
    mp::cpp_int result = 1;
    for (int i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

} // namespace

std::int64_t DeterministicMath::roundScaled(double value, int decimals) {
    if (!std::isfinite(value)) {
        throw std::domain_error("Cannot round a non-finite value");
    }
    if (decimals < 0 || decimals > kMaxDecimals) {
        throw std::domain_error("Decimal places out of supported range");
    }
    if (value == 0.0) {
        return 0;
    }

    // value == mantissa * 2^binaryExponent, exactly.
    int exponent = 0;
    double fraction = std::frexp(std::fabs(value), &exponent);
    auto mantissa = static_cast<std::uint64_t>(std::ldexp(fraction, kMantissaBits));
    int binaryExponent = exponent - kMantissaBits;

    mp::cpp_int numerator = mp::cpp_int(mantissa) * powerOfTen(decimals);
    mp::cpp_int rounded;
    if (binaryExponent >= 0) {
        rounded = numerator << binaryExponent;
    } else {
        auto shift = static_cast<unsigned>(-binaryExponent);
        mp::cpp_int quotient = numerator >> shift;
        mp::cpp_int remainder = numerator - (quotient << shift);
        mp::cpp_int half = mp::cpp_int(1) << (shift - 1);
        rounded = remainder >= half ? quotient + 1 : quotient;
    }

    if (rounded > mp::cpp_int(std::numeric_limits<std::int64_t>::max())) {
        throw std::overflow_error("Rounded value exceeds 64-bit range");
    }
    auto magnitude = rounded.convert_to<std::int64_t>();
    return value < 0.0 ? -magnitude : magnitude;
}

Fixed64 DeterministicMath::roundToFixed(double value) {
    return Fixed64::fromRaw(roundScaled(value, Fixed64::kDecimals));
}

double DeterministicMath::clamp(double value, double minValue, double maxValue) {
    return std::max(minValue, std::min(maxValue, value));
}

} // namespace pf
