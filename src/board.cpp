#include "board.hpp"

#include "deterministic_math.hpp"
#include "errors.hpp"
#include "hash.hpp"
#include "rng.hpp"

#include <sstream>

namespace pf {

const Peg& Board::peg(std::size_t row, std::size_t index) const {
    if (row >= rows.size()) {
        throw OutOfRange("board row " + std::to_string(row) + " outside board of " +
                         std::to_string(rows.size()) + " rows");
    }
    const auto& pegs = rows[row];
    if (index >= pegs.size()) {
        throw OutOfRange("peg " + std::to_string(index) + " outside row " + std::to_string(row));
    }
    return pegs[index];
}

Board generateBoard(Xorshift32& rng, std::size_t rowCount) {
    if (rowCount == 0) {
        throw InvalidInput("board needs at least one row");
    }

    Board board;
    board.rows.reserve(rowCount);
    for (std::size_t r = 0; r < rowCount; ++r) {
        std::vector<Peg> pegs;
        pegs.reserve(r + 1);
        for (std::size_t p = 0; p <= r; ++p) {
            double draw = rng.next();
            double leftBias = kBiasCenter + (draw - kBiasCenter) * kBiasSpread;
            pegs.push_back(Peg{ DeterministicMath::roundToFixed(leftBias) });
        }
        board.rows.push_back(std::move(pegs));
    }
    return board;
}

std::string serializeBoard(const Board& board) {
    std::ostringstream oss;
    oss << "{\"rows\":[";
    for (std::size_t r = 0; r < board.rows.size(); ++r) {
        if (r > 0) {
            oss << ',';
        }
        oss << '[';
        const auto& pegs = board.rows[r];
        for (std::size_t p = 0; p < pegs.size(); ++p) {
            if (p > 0) {
                oss << ',';
            }
            oss << "{\"leftBias\":" << pegs[p].leftBias.toString() << '}';
        }
        oss << ']';
    }
    oss << "]}";
    return oss.str();
}

std::string boardFingerprint(const Board& board) {
    return sha256Hex(serializeBoard(board));
}

} // namespace pf
