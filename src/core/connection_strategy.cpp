/**
 * @file connection_strategy.cpp
 * @brief ConnectionStrategy helpers.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#include "qlnet/core/connection_strategy.hpp"

#include <algorithm>
#include <cctype>

namespace qlnet {
namespace core {

const char* connectionStrategyToString(ConnectionStrategy strategy) {
    switch (strategy) {
        case ConnectionStrategy::SINGLE_TIMEOUT: return "socket_timeout";
        case ConnectionStrategy::TRY_TWICE: return "try_twice";
        case ConnectionStrategy::NON_BLOCKING_POLL: return "select";
        default: return "unknown";
    }
}

std::optional<ConnectionStrategy> parseConnectionStrategy(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "socket_timeout" || lower == "single_timeout") {
        return ConnectionStrategy::SINGLE_TIMEOUT;
    }
    if (lower == "try_twice") {
        return ConnectionStrategy::TRY_TWICE;
    }
    if (lower == "select" || lower == "non_blocking_poll") {
        return ConnectionStrategy::NON_BLOCKING_POLL;
    }
    return std::nullopt;
}

int attemptsFor(ConnectionStrategy strategy) {
    return strategy == ConnectionStrategy::TRY_TWICE ? 2 : 1;
}

}  // namespace core
}  // namespace qlnet
