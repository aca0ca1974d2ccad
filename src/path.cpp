#include "path.hpp"

#include "board.hpp"
#include "deterministic_math.hpp"
#include "rng.hpp"

#include <algorithm>

namespace pf {

const char* directionName(Direction direction) {
    return direction == Direction::LEFT ? "LEFT" : "RIGHT";
}

PathResult simulatePath(const Board& board,
                        int columnChoice,
                        Xorshift32& rng,
                        std::size_t rowCount,
                        std::size_t centerColumn) {
    const double adjustment =
        static_cast<double>(columnChoice - static_cast<int>(centerColumn)) * kColumnBiasStep;

    PathResult result{ {}, 0 };
    result.decisions.reserve(rowCount);

    std::size_t position = 0;
    for (std::size_t r = 0; r < rowCount; ++r) {
        std::size_t pegIndex = std::min(position, r);
        double leftBias = board.peg(r, pegIndex).leftBias.toDouble();
        double adjustedBias = DeterministicMath::clamp(leftBias + adjustment, 0.0, 1.0);

        double draw = rng.next();
        Direction decision = draw < adjustedBias ? Direction::LEFT : Direction::RIGHT;
        if (decision == Direction::RIGHT) {
            ++position;
        }

        result.decisions.push_back(PathDecision{ r, pegIndex, leftBias, adjustedBias, draw, decision });
    }

    result.landingIndex = position;
    return result;
}

} // namespace pf
