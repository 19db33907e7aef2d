/**
 * @file ConfigException.hpp
 * @brief Configuration error
 */

#pragma once

#include <stdexcept>
#include <string>

namespace person::exception {

class ConfigException : public std::runtime_error {
public:
    explicit ConfigException(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

} // namespace person::exception
