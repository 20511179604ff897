/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace StrataEngine {

/**
 * @brief Fatal setup problem: unknown tile code, entity created without a
 * simulation context, unknown entity class in save data, malformed region.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A terrain mutation targeted a chunk that is not in the working set.
 */
class ChunkNotLoadedError : public std::out_of_range {
public:
    explicit ChunkNotLoadedError(const std::string& message)
        : std::out_of_range(message) {}
};

/**
 * @brief A chunk coordinate has neither a loaded chunk nor raw tile data.
 */
class ChunkNotFoundError : public std::out_of_range {
public:
    explicit ChunkNotFoundError(const std::string& message)
        : std::out_of_range(message) {}
};

} // namespace StrataEngine

#endif // ERRORS_HPP
