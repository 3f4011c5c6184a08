#pragma once

#include "exception.hpp"
#include <string>
#include <string_view>
#include <vector>

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);

// String helpers
std::string to_lower(std::string_view s);
std::string trim(std::string_view s);
std::string join(const std::vector<std::string>& parts, std::string_view separator);
