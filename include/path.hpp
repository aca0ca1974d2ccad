#pragma once

#include <cstddef>
#include <vector>

namespace pf {

struct Board;
class Xorshift32;

enum class Direction {
    LEFT,  // toward bin 0
    RIGHT  // toward increasing bin index
};

const char* directionName(Direction direction);

struct PathDecision {
    std::size_t row;
    std::size_t pegIndex;
    double leftBias;
    double adjustedBias;
    double draw;
    Direction decision;
};

struct PathResult {
    std::vector<PathDecision> decisions;
    std::size_t landingIndex;
};

constexpr double kColumnBiasStep = 0.01;

// Walks the board one row at a time, drawing once per row from the stream board generation
// started. The peg consulted at row r is min(rights so far, r).
PathResult simulatePath(const Board& board,
                        int columnChoice,
                        Xorshift32& rng,
                        std::size_t rowCount,
                        std::size_t centerColumn);

} // namespace pf
