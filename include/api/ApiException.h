#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Transport or payload error from a remote API. Caught per request by the clients.
 */
class api_exception : public std::runtime_error {
public:
    explicit api_exception(const char *message) : std::runtime_error(message) {
    }

    explicit api_exception(const std::string &message) : std::runtime_error(message) {
    }
};
