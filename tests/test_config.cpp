#include "errors.hpp"
#include "game_config.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

#include <stdlib.h>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "config_test failure: " << msg << std::endl;
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

    GameConfig defaults = defaultGameConfig();
    defaults.validate();
    if (defaults.rows != 12 || defaults.centerColumn != 6 || defaults.binCount() != 13) {
        fail("default configuration changed");
    }

    Paytable parsed = parsePaytable("16,9,2,1.4,1.1,1,0.5,1,1.1,1.4,2,9,16");
    if (parsed.getMultipliers() != Paytable::standard().getMultipliers()) {
        fail("parsed standard paytable differs from the built-in one");
    }
    Paytable spaced = parsePaytable(" 3 , 0.5 ,3 ");
    if (spaced.size() != 3 || spaced.multiplierFor(1).raw() != 500000) {
        fail("whitespace around paytable entries not tolerated");
    }
    if (!throwsInvalidInput([] { parsePaytable("1,x,1"); })) {
        fail("non-numeric paytable entry accepted");
    }
    if (!throwsInvalidInput([] { parsePaytable("nan,1,nan"); })) {
        fail("NaN paytable entry accepted");
    }
    if (!throwsInvalidInput([] { parsePaytable("inf,1,inf"); })) {
        fail("infinite paytable entry accepted");
    }
    if (!throwsInvalidInput([] { parsePaytable("1e300,1,1e300"); })) {
        fail("paytable entry beyond the fixed-point range accepted");
    }
    if (!throwsInvalidInput([] { parsePaytable("1,2"); })) {
        fail("asymmetric parsed paytable accepted");
    }
    if (!throwsInvalidInput([] { parsePaytable(""); })) {
        fail("empty paytable accepted");
    }

    GameConfig mismatched;
    mismatched.paytable = parsePaytable("3,0.5,3");
    if (!throwsInvalidInput([&] { mismatched.validate(); })) {
        fail("paytable size mismatch accepted");
    }
    GameConfig badCenter;
    badCenter.centerColumn = 13;
    if (!throwsInvalidInput([&] { badCenter.validate(); })) {
        fail("center column past the last bin accepted");
    }
    GameConfig noRows;
    noRows.rows = 0;
    if (!throwsInvalidInput([&] { noRows.validate(); })) {
        fail("zero rows accepted");
    }

    unsetenv("PF_ROWS");
    unsetenv("PF_PAYTABLE");
    GameConfig fromEnv = gameConfigFromEnvironment();
    if (fromEnv.rows != 12 || fromEnv.paytable.size() != 13) {
        fail("unset environment must keep defaults");
    }

    setenv("PF_ROWS", "2", 1);
    setenv("PF_PAYTABLE", "3,0.5,3", 1);
    GameConfig small = gameConfigFromEnvironment();
    if (small.rows != 2 || small.centerColumn != 1 || small.paytable.size() != 3) {
        fail("PF_ROWS / PF_PAYTABLE not applied");
    }

    setenv("PF_ROWS", "8", 1);
    if (!throwsInvalidInput([] { gameConfigFromEnvironment(); })) {
        fail("PF_ROWS without a matching PF_PAYTABLE accepted");
    }
    setenv("PF_ROWS", "-3", 1);
    if (!throwsInvalidInput([] { gameConfigFromEnvironment(); })) {
        fail("negative PF_ROWS accepted");
    }
    unsetenv("PF_ROWS");
    unsetenv("PF_PAYTABLE");

    std::cout << "config_test passed" << std::endl;
    return 0;
}
