#pragma once

#include "fixed_point.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pf {

class Xorshift32;

struct Peg {
    Fixed64 leftBias; // probability of deflecting toward bin 0, in [0.4, 0.6]
};

// Triangular board: row r holds r + 1 pegs.
struct Board {
    std::vector<std::vector<Peg>> rows;

    std::size_t rowCount() const { return rows.size(); }
    const Peg& peg(std::size_t row, std::size_t index) const;
};

constexpr double kBiasCenter = 0.5;
constexpr double kBiasSpread = 0.2;

// One draw per peg, row-major, left to right. The generator is left positioned right after
// the last peg so the path simulation continues the same stream.
Board generateBoard(Xorshift32& rng, std::size_t rowCount);

// {"rows":[[{"leftBias":0.422123}],[{"leftBias":0.552503},{"leftBias":0.408786}],...]}
std::string serializeBoard(const Board& board);

std::string boardFingerprint(const Board& board);

} // namespace pf
