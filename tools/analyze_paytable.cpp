#include "game_config.hpp"
#include "hash.hpp"
#include "plinko.hpp"

#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::size_t samples = 2000;
    if (argc > 1) {
        char* end = nullptr;
        long parsed = std::strtol(argv[1], &end, 10);
        if (end && *end == '\0' && parsed > 0) {
            samples = static_cast<std::size_t>(parsed);
        } else {
            std::cerr << "Invalid sample count provided. Using default of " << samples << ".\n";
        }
    }

    pf::GameConfig cfg;
    try {
        cfg = pf::gameConfigFromEnvironment();
    } catch (const std::exception& ex) {
        std::cerr << "Configuration error: " << ex.what() << '\n';
        return 1;
    }

    std::cout << "=== PAYTABLE ===\n";
    const auto& multipliers = cfg.paytable.getMultipliers();
    for (std::size_t i = 0; i < multipliers.size(); ++i) {
        std::cout << "  bin " << std::setw(2) << i << " : " << multipliers[i].toString() << "x\n";
    }

    // Seeds are hashes of a fixed label so every run reports the same numbers.
    std::vector<std::string> seeds;
    seeds.reserve(samples);
    for (std::size_t i = 0; i < samples; ++i) {
        seeds.push_back(pf::sha256Hex("paytable-analysis:" + std::to_string(i)));
    }

    std::cout << "\n=== EMPIRICAL RETURN TO PLAYER (" << samples << " seeds) ===\n";
    try {
        for (std::size_t column = 0; column <= cfg.rows; ++column) {
            std::vector<std::size_t> histogram(cfg.binCount(), 0);
            pf::Fixed64 total;
            for (const auto& seed : seeds) {
                auto outcome = pf::computeOutcome(seed, static_cast<int>(column), cfg);
                ++histogram[outcome.landingIndex];
                total += cfg.paytable.multiplierFor(outcome.landingIndex);
            }
            double rtp = total.toDouble() / static_cast<double>(samples);
            std::cout << "  column " << std::setw(2) << column << " : RTP " << std::fixed
                      << std::setprecision(4) << rtp * 100.0 << "%  bins";
            for (std::size_t count : histogram) {
                std::cout << ' ' << count;
            }
            std::cout << '\n';
        }
    } catch (const std::exception& ex) {
        std::cerr << "Analysis failed: " << ex.what() << '\n';
        return 1;
    }

    return 0;
}
