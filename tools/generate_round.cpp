#include "fairness.hpp"
#include "secure_random.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
    int count = 1;
    if (argc > 1) {
        char* end = nullptr;
        long parsed = std::strtol(argv[1], &end, 10);
        if (end && *end == '\0' && parsed > 0) {
            count = static_cast<int>(parsed);
        } else {
            std::cerr << "Invalid count provided. Using default of 1.\n";
        }
    }

    try {
        for (int i = 0; i < count; ++i) {
            std::string secret = pf::generateOperatorSecret();
            std::string nonce = pf::generateRoundNonce();
            std::cout << "operatorSecret=" << secret << " roundNonce=" << nonce
                      << " commitDigest=" << pf::commitDigest(secret, nonce) << '\n';
        }
    } catch (const std::exception& ex) {
        std::cerr << "Seed generation failed: " << ex.what() << '\n';
        return 1;
    }

    return 0;
}
