/**
 * @file logger.cpp
 * @brief Logger singleton storage.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#include "qlnet/utils/logger.hpp"

namespace qlnet {
namespace utils {

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

}  // namespace utils
}  // namespace qlnet
