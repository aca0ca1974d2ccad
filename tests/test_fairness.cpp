#include "errors.hpp"
#include "fairness.hpp"
#include "hash.hpp"
#include "test_vectors.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "fairness_test failure: " << msg << std::endl;
    std::exit(1);
}

template <typename Fn>
bool throwsInvalidInput(Fn fn) {
    try {
        fn();
    } catch (const pf::InvalidInput&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    using namespace pf;

    if (sha256Hex("test") != "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08") {
        fail("sha256(\"test\") mismatch");
    }
    if (sha256Hex("") != "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855") {
        fail("sha256 of empty input mismatch");
    }
    if (!isDigestHex(sha256Hex("anything")) || isDigestHex("abc") || isDigestHex(std::string(64, 'g'))) {
        fail("digest shape check wrong");
    }

    const std::string commit = commitDigest(vectors::kOperatorSecret, vectors::kRoundNonce);
    if (commit != vectors::kCommitDigest) {
        fail("commit digest does not match reference vector: " + commit);
    }
    if (commitDigest(vectors::kOperatorSecret, vectors::kRoundNonce) != commit) {
        fail("commit digest not repeatable");
    }

    const std::string combined =
        combineSeed(vectors::kOperatorSecret, vectors::kPlayerInput, vectors::kRoundNonce);
    if (combined != vectors::kCombinedSeed) {
        fail("combined seed does not match reference vector: " + combined);
    }
    SeedMaterial material{ vectors::kOperatorSecret, vectors::kPlayerInput, vectors::kRoundNonce };
    if (combineSeed(material) != combined) {
        fail("combined seed not repeatable through SeedMaterial");
    }

    // Delimiters keep shifted fields apart.
    if (commitDigest("ab", "c") == commitDigest("a", "bc")) {
        fail("commit digest ambiguous across field boundary");
    }
    if (combineSeed("s", "p1", "n") == combineSeed("s", "p", "1n")) {
        fail("combined seed ambiguous across field boundary");
    }

    if (!verifyCommit(commit, vectors::kOperatorSecret, vectors::kRoundNonce)) {
        fail("verifyCommit rejected a genuine commitment");
    }
    const std::string hexAlphabet = "0123456789abcdef";
    for (std::size_t i = 0; i < commit.size(); ++i) {
        std::string mutated = commit;
        mutated[i] = hexAlphabet[(hexAlphabet.find(commit[i]) + 1) % hexAlphabet.size()];
        if (verifyCommit(mutated, vectors::kOperatorSecret, vectors::kRoundNonce)) {
            fail("verifyCommit accepted a commitment mutated at position " + std::to_string(i));
        }
    }
    if (verifyCommit("invalid_commit_hex", vectors::kOperatorSecret, vectors::kRoundNonce)) {
        fail("verifyCommit accepted garbage");
    }
    if (verifyCommit(commit, vectors::kOperatorSecret, "43")) {
        fail("verifyCommit accepted a different nonce");
    }
    if (verifyCommit(commit, "", vectors::kRoundNonce)) {
        fail("verifyCommit accepted an empty secret");
    }

    if (!throwsInvalidInput([] { commitDigest("", "42"); })) {
        fail("empty operator secret not rejected");
    }
    if (!throwsInvalidInput([] { commitDigest("secret", ""); })) {
        fail("empty nonce not rejected");
    }
    if (!throwsInvalidInput([] { combineSeed("secret", "", "42"); })) {
        fail("empty player input not rejected");
    }

    std::cout << "fairness_test passed" << std::endl;
    return 0;
}
