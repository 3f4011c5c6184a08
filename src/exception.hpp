#pragma once

#include <stdexcept>
#include <string>

class PipwallException : public std::runtime_error {
public:
    explicit PipwallException(const std::string& message)
        : std::runtime_error(message) {}
};
