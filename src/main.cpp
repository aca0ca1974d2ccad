#include "errors.hpp"
#include "game_config.hpp"
#include "path.hpp"
#include "round.hpp"
#include "secure_random.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <limits>
#include <string>

using namespace pf;

namespace {

void printPaytable(const GameConfig& cfg) {
    std::cout << "Paytable (bin: multiplier):\n ";
    const auto& multipliers = cfg.paytable.getMultipliers();
    for (std::size_t i = 0; i < multipliers.size(); ++i) {
        std::cout << " " << i << ":" << multipliers[i].toString() << "x";
    }
    std::cout << "\n";
}

void printDrop(const GameConfig& cfg, const RoundStart& start) {
    for (const auto& step : start.path) {
        std::cout << "  row " << step.row << "  ";
        for (std::size_t pad = step.row; pad < cfg.rows; ++pad) {
            std::cout << " ";
        }
        for (std::size_t p = 0; p <= step.row; ++p) {
            std::cout << (p == step.pegIndex ? "o " : ". ");
        }
        std::cout << "  " << directionName(step.decision) << "\n";
    }
    std::cout << "  landed in bin " << start.landingIndex << "\n";
}

} // namespace

int main() {
    GameConfig cfg;
    try {
        cfg = gameConfigFromEnvironment();
    } catch (const std::exception& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return 1;
    }

    std::int64_t bankroll = 100'000; // cents
    std::cout << "Provably fair Plinko: " << cfg.rows << " rows, " << cfg.binCount() << " bins.\n";
    std::cout << "(set PF_ROWS/PF_PAYTABLE to override)\n";
    printPaytable(cfg);

    while (true) {
        if (bankroll <= 0) {
            std::cout << "\nYou are out of funds. Session over.\n";
            break;
        }

        Round round = Round::create(cfg);
        const auto& commitment = round.getCommitment();

        std::cout << "\n----------------------------------------\n";
        std::cout << "Bankroll: " << bankroll << " cents\n";
        std::cout << "=== COMMITMENT (published before your input) ===\n";
        std::cout << "Commit digest: " << commitment.commitDigest << "\n";
        std::cout << "Round nonce:   " << commitment.roundNonce << "\n";

        std::cout << "\nDrop column 0-" << cfg.rows << " (or -1 to quit): ";
        int column = 0;
        if (!(std::cin >> column)) {
            return 0;
        }
        if (column < 0) {
            std::cout << "Exiting.\n";
            break;
        }
        if (static_cast<std::size_t>(column) > cfg.rows) {
            std::cout << "Column out of range. Try again.\n";
            continue;
        }

        std::cout << "Stake in cents (max " << bankroll << "): ";
        std::uint64_t stake = 0;
        if (!(std::cin >> stake)) {
            return 0;
        }
        if (stake == 0 || stake > static_cast<std::uint64_t>(bankroll)) {
            std::cout << "Invalid stake. Try again.\n";
            continue;
        }

        std::cout << "Your player input (blank = random): ";
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        std::string playerInput;
        std::getline(std::cin, playerInput);
        if (playerInput.empty()) {
            playerInput = generatePlayerInput();
            std::cout << "Generated player input: " << playerInput << "\n";
        }

        RoundStart start{};
        try {
            start = round.start(playerInput, column, stake);
        } catch (const OutOfRange& ex) {
            std::cerr << "FATAL: engine invariant violated: " << ex.what() << "\n";
            return 1;
        } catch (const std::exception& ex) {
            std::cerr << "Round rejected: " << ex.what() << "\n";
            continue;
        }

        std::cout << "\n";
        printDrop(cfg, start);
        bankroll += start.payout.netChangeCents;
        std::cout << "Multiplier " << start.payout.multiplier.toString() << "x, payout "
                  << start.payout.grossPayoutCents << " cents, net " << start.payout.netChangeCents
                  << ", bankroll " << bankroll << "\n";
        std::cout << "Board fingerprint: " << start.boardFingerprint << "\n";

        RoundReveal reveal = round.reveal();
        std::cout << "\n=== PROVABLY FAIR REVEAL ===\n";
        std::cout << "Operator secret: " << reveal.operatorSecret << "\n";
        std::cout << "Player input:    " << reveal.playerInput << "\n";
        std::cout << "Round nonce:     " << reveal.roundNonce << "\n";
        std::cout << "Commit digest:   " << reveal.commitDigest << "\n";
        std::cout << "Combined seed:   " << reveal.combinedSeed << "\n";
        std::cout << "Verify with: pf_verify_round " << reveal.operatorSecret << " '" << reveal.playerInput
                  << "' " << reveal.roundNonce << " " << column << " --commit " << reveal.commitDigest
                  << " --landing " << start.landingIndex << " --fingerprint " << start.boardFingerprint
                  << "\n";
    }

    std::cout << "\nFinal bankroll: " << bankroll << " cents\n";
    return 0;
}
