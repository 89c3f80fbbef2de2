#include "termcalc/settings.hpp"

#include <cstdlib>
#include <string_view>

namespace termcalc {

int parse_precision(const std::string& s) {
    std::size_t used = 0;
    int n = 0;
    try {
        n = std::stoi(s, &used);
    } catch (const std::exception&) {
        throw ConfigError("Invalid precision: \"" + s + "\"");
    }
    if (used != s.size() || n < 1 || n > 64) throw ConfigError("Invalid precision: \"" + s + "\"");
    return n;
}

Settings parse_arguments(int argc, const char* const* argv, std::vector<std::string>& expressions) {
    Settings s;
    if (const char* env = std::getenv("TERMCALC_CONTEXT"); env && *env) s.context_path = env;

    auto value_of = [&](int& i, std::string_view flag) -> std::string {
        if (i + 1 >= argc) throw ConfigError("Missing value for " + std::string(flag));
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--context") {
            s.context_path = value_of(i, arg);
        } else if (arg == "--format") {
            const std::string v = value_of(i, arg);
            auto radix = radix_from_string(v);
            if (!radix) throw ConfigError("Unknown format: \"" + v + "\"");
            s.format.radix = *radix;
        } else if (arg == "--precision") {
            s.format.precision = parse_precision(value_of(i, arg));
        } else if (arg == "--verbose") {
            s.log_level = spdlog::level::debug;
        } else if (arg.size() > 2 && arg.substr(0, 2) == "--") {
            throw ConfigError("Unknown option: " + std::string(arg));
        } else {
            // "-3+4" is an expression, not an option
            expressions.emplace_back(arg);
        }
    }
    return s;
}

} // namespace termcalc
