#pragma once

#include "payout.hpp"

#include <cstddef>
#include <string>

namespace pf {

struct GameConfig {
    std::size_t rows = 12;
    std::size_t centerColumn = 6;
    Paytable paytable = Paytable::standard();

    // Throws InvalidInput unless rows >= 1, centerColumn <= rows and the paytable has rows + 1 bins.
    void validate() const;

    std::size_t binCount() const { return rows + 1; }
};

GameConfig defaultGameConfig();

// "16,9,2,1.4,1.1,1,0.5,1,1.1,1.4,2,9,16"
Paytable parsePaytable(const std::string& text);

// Reads PF_ROWS and PF_PAYTABLE once; unset variables keep the defaults.
GameConfig gameConfigFromEnvironment();

} // namespace pf
