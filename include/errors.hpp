#pragma once

#include <stdexcept>
#include <string>

namespace pf {

// Caller supplied something the engine cannot work with (bad column, empty seed, bad config).
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& what) : std::invalid_argument(what) {}
};

// An index fell outside a table or board. Upstream logic should make this unreachable.
class OutOfRange : public std::out_of_range {
public:
    explicit OutOfRange(const std::string& what) : std::out_of_range(what) {}
};

// Round lifecycle step invoked out of order.
class ProtocolViolation : public std::logic_error {
public:
    explicit ProtocolViolation(const std::string& what) : std::logic_error(what) {}
};

} // namespace pf
