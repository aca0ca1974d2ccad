#include "game_config.hpp"
#include "path.hpp"
#include "verifier.hpp"

#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void usage() {
    std::cerr << "Usage: verify_round <operatorSecret> <playerInput> <roundNonce> <column>\n"
                 "                    [--commit <digest>] [--landing <index> --fingerprint <digest>]\n"
                 "Environment: PF_ROWS / PF_PAYTABLE must match the configuration the round used.\n";
}

int parseColumn(const std::string& text) {
    std::size_t consumed = 0;
    int column = std::stoi(text, &consumed);
    if (consumed != text.size()) {
        throw std::invalid_argument("column \"" + text + "\" is not an integer");
    }
    return column;
}

std::size_t parseLandingIndex(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("landing index \"" + text + "\" is not a non-negative integer");
    }
    return static_cast<std::size_t>(std::stoull(text));
}

const char* matchLabel(bool ok) {
    return ok ? "match" : "MISMATCH";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 5) {
        usage();
        return 1;
    }

    pf::VerificationRequest request;
    request.material = pf::SeedMaterial{ argv[1], argv[2], argv[3] };
    try {
        request.columnChoice = parseColumn(argv[4]);
        for (int i = 5; i < argc; ++i) {
            std::string flag = argv[i];
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + flag);
            }
            std::string value = argv[++i];
            if (flag == "--commit") {
                request.publishedCommit = value;
            } else if (flag == "--landing") {
                request.expectedLandingIndex = parseLandingIndex(value);
            } else if (flag == "--fingerprint") {
                request.expectedFingerprint = value;
            } else {
                throw std::invalid_argument("unknown option " + flag);
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "Argument error: " << ex.what() << '\n';
        usage();
        return 1;
    }

    pf::VerificationReport report;
    try {
        pf::GameConfig cfg = pf::gameConfigFromEnvironment();
        report = pf::verifyRound(request, cfg);
    } catch (const std::exception& ex) {
        std::cerr << "Verification failed: " << ex.what() << '\n';
        return 1;
    }

    std::cout << "Commit digest:     " << report.commitDigest << '\n';
    std::cout << "Combined seed:     " << report.combinedSeed << '\n';
    std::cout << "Board fingerprint: " << report.outcome.boardFingerprint << '\n';
    std::cout << "Landing index:     " << report.outcome.landingIndex << '\n';
    std::cout << "Multiplier:        " << report.multiplier.toString() << "x\n";
    std::cout << "Path:\n";
    std::cout << std::fixed << std::setprecision(10);
    for (const auto& step : report.outcome.path) {
        std::cout << "  row " << std::setw(2) << step.row << " peg " << std::setw(2) << step.pegIndex
                  << " bias " << step.leftBias << " adjusted " << step.adjustedBias << " draw "
                  << step.draw << " -> " << pf::directionName(step.decision) << '\n';
    }

    if (report.commitMatches) {
        std::cout << "Commitment: " << matchLabel(*report.commitMatches) << '\n';
    }
    if (report.outcomeMatches) {
        std::cout << "Outcome:    " << matchLabel(*report.outcomeMatches) << '\n';
    }
    return report.allMatch() ? 0 : 2;
}
