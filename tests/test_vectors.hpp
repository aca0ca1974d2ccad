#pragma once

#include <cstddef>

// Reference round used across the test executables.
namespace vectors {

constexpr const char* kOperatorSecret =
    "b2a5f3f32a4d9c6ee7a8c1d33456677890abcdeffedcba0987654321ffeeddcc";
constexpr const char* kRoundNonce = "42";
constexpr const char* kPlayerInput = "candidate-hello";
constexpr const char* kCommitDigest =
    "bb9acdc67f3f18f3345236a01f0e5072596657a9005c7d8a22cff061451a6b34";
constexpr const char* kCombinedSeed =
    "e1dddf77de27d395ea2be2ed49aa2a59bd6bf12ee8d350c16c008abd406c07e0";
constexpr const char* kBoardFingerprint =
    "0d8eb3e00eb18ef9b626e5129407791bf713430b884f9e3efbf300a063f4d783";

constexpr std::size_t kRows = 12;
constexpr std::size_t kCenterColumn = 6;
constexpr int kColumn = 6;
constexpr std::size_t kLandingIndex = 6;

constexpr double kFirstDraws[] = { 0.1106166649, 0.7625129214, 0.0439292176, 0.4578678815, 0.3438999297 };

} // namespace vectors
