#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/common.h>

#include "termcalc/formatter.hpp"

namespace termcalc {

struct ConfigError : std::runtime_error { using std::runtime_error::runtime_error; };

struct Settings {
    FormatOptions format{};
    std::string context_path{"termcalc_context.json"};
    spdlog::level::level_enum log_level{spdlog::level::warn};
};

/// Settings from the environment (TERMCALC_CONTEXT) and the command line:
///   --context <path>  --format <dec|bin|oct|hex|exp>  --precision <n>  --verbose
/// Flags win over the environment. Every other argument is appended to
/// expressions. Throws ConfigError.
Settings parse_arguments(int argc, const char* const* argv, std::vector<std::string>& expressions);

/// Parses a precision argument (1 to 64).
int parse_precision(const std::string& s);

} // namespace termcalc
