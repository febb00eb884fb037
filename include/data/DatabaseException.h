#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief SQLite open, prepare or step failure.
 */
class database_exception : public std::runtime_error {
public:
    explicit database_exception(const char *message) : std::runtime_error(message) {
    }

    explicit database_exception(const std::string &message) : std::runtime_error(message) {
    }
};
