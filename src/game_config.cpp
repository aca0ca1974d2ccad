#include "game_config.hpp"

#include "errors.hpp"

#include <cmath>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace pf {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::size_t parseRows(const std::string& text) {
    std::string value = trim(text);
    char* end = nullptr;
    long parsed = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || end == nullptr || *end != '\0' || parsed <= 0) {
        throw InvalidInput("PF_ROWS must be a positive integer, got \"" + text + "\"");
    }
    return static_cast<std::size_t>(parsed);
}

} // namespace

void GameConfig::validate() const {
    if (rows == 0) {
        throw InvalidInput("game needs at least one row");
    }
    if (centerColumn > rows) {
        throw InvalidInput("center column " + std::to_string(centerColumn) + " outside [0, " +
                           std::to_string(rows) + "]");
    }
    if (paytable.size() != binCount()) {
        throw InvalidInput("paytable has " + std::to_string(paytable.size()) + " bins, board needs " +
                           std::to_string(binCount()));
    }
}

GameConfig defaultGameConfig() {
    return GameConfig{};
}

Paytable parsePaytable(const std::string& text) {
    std::vector<Fixed64> multipliers;
    std::istringstream iss(text);
    std::string field;
    while (std::getline(iss, field, ',')) {
        std::string value = trim(field);
        char* end = nullptr;
        double parsed = std::strtod(value.c_str(), &end);
        if (value.empty() || end == nullptr || *end != '\0') {
            throw InvalidInput("paytable entry \"" + field + "\" is not a number");
        }
        if (!std::isfinite(parsed)) {
            throw InvalidInput("paytable entry \"" + field + "\" is not finite");
        }
        if (std::fabs(parsed) > static_cast<double>(Fixed64::kMaxWhole)) {
            throw InvalidInput("paytable entry \"" + field + "\" is out of range");
        }
        multipliers.push_back(Fixed64::fromDouble(parsed));
    }
    return Paytable(std::move(multipliers));
}

GameConfig gameConfigFromEnvironment() {
    GameConfig cfg = defaultGameConfig();

    const char* rowsEnv = std::getenv("PF_ROWS");
    if (rowsEnv != nullptr) {
        cfg.rows = parseRows(rowsEnv);
        cfg.centerColumn = cfg.rows / 2;
    }

    const char* paytableEnv = std::getenv("PF_PAYTABLE");
    if (paytableEnv != nullptr) {
        cfg.paytable = parsePaytable(paytableEnv);
    }

    cfg.validate();
    return cfg;
}

} // namespace pf
