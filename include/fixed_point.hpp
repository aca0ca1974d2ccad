#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace pf {

// Six-decimal fixed point. Board biases and paytable multipliers live here so that
// equality, hashing and payout arithmetic never depend on binary floating point.
class Fixed64 {
public:
    static constexpr std::int64_t kScale = 1'000'000; // microunits
    static constexpr int kDecimals = 6;
    static constexpr std::int64_t kMaxWhole =
        std::numeric_limits<std::int64_t>::max() / kScale;

    Fixed64() : raw_(0) {}
    explicit Fixed64(std::int64_t whole) : raw_(scaleWhole(whole)) {}
    static Fixed64 fromRaw(std::int64_t raw) { return Fixed64(raw, RawTag{}); }
    static Fixed64 fromDouble(double value) {
        if (!std::isfinite(value)) {
            throw std::invalid_argument("Fixed64 cannot represent a non-finite value");
        }
        double scaled = std::round(value * static_cast<double>(kScale));
        if (scaled > static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
            return Fixed64(std::numeric_limits<std::int64_t>::max(), RawTag{});
        }
        if (scaled < static_cast<double>(std::numeric_limits<std::int64_t>::min())) {
            return Fixed64(std::numeric_limits<std::int64_t>::min(), RawTag{});
        }
        return Fixed64(static_cast<std::int64_t>(scaled), RawTag{});
    }

    // Correctly rounded: raw_ and kScale are both exact doubles for any bias or multiplier.
    double toDouble() const { return static_cast<double>(raw_) / static_cast<double>(kScale); }
    std::int64_t raw() const { return raw_; }

    // Shortest decimal text: "0.46878", "0.5", "16". Part of the board fingerprint format.
    std::string toString() const {
        std::uint64_t magnitude = raw_ < 0 ? static_cast<std::uint64_t>(-(raw_ + 1)) + 1
                                           : static_cast<std::uint64_t>(raw_);
        std::uint64_t whole = magnitude / static_cast<std::uint64_t>(kScale);
        std::uint64_t frac = magnitude % static_cast<std::uint64_t>(kScale);

        std::string out = raw_ < 0 ? "-" : "";
        out += std::to_string(whole);
        if (frac == 0) {
            return out;
        }

        std::string digits = std::to_string(frac);
        digits.insert(0, static_cast<std::size_t>(kDecimals) - digits.size(), '0');
        while (!digits.empty() && digits.back() == '0') {
            digits.pop_back();
        }
        out += '.';
        out += digits;
        return out;
    }

    Fixed64& operator+=(Fixed64 other) {
        __int128 wide = static_cast<__int128>(raw_) + static_cast<__int128>(other.raw_);
        raw_ = clampToInt64(wide);
        return *this;
    }

    bool operator<(Fixed64 other) const { return raw_ < other.raw_; }
    bool operator>(Fixed64 other) const { return raw_ > other.raw_; }
    bool operator==(Fixed64 other) const { return raw_ == other.raw_; }
    bool operator!=(Fixed64 other) const { return raw_ != other.raw_; }

private:
    struct RawTag {};
    explicit Fixed64(std::int64_t raw, RawTag) : raw_(raw) {}
    static std::int64_t clampToInt64(__int128 value) {
        if (value > static_cast<__int128>(std::numeric_limits<std::int64_t>::max())) {
            return std::numeric_limits<std::int64_t>::max();
        }
        if (value < static_cast<__int128>(std::numeric_limits<std::int64_t>::min())) {
            return std::numeric_limits<std::int64_t>::min();
        }
        return static_cast<std::int64_t>(value);
    }

    static std::int64_t scaleWhole(std::int64_t whole) {
        if (whole > kMaxWhole || whole < -kMaxWhole) {
            throw std::overflow_error("Fixed64 whole value out of range");
        }
        __int128 wide = static_cast<__int128>(whole) * static_cast<__int128>(kScale);
        return static_cast<std::int64_t>(wide);
    }

    std::int64_t raw_;
};

} // namespace pf
