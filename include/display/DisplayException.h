#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Thrown when the display device cannot be opened, queried or mapped.
 */
class display_exception : public std::runtime_error {
public:
    explicit display_exception(const char *message) : std::runtime_error(message) {
    }

    explicit display_exception(const std::string &message) : std::runtime_error(message) {
    }
};
