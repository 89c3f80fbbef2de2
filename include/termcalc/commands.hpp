#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "termcalc/math_context.hpp"
#include "termcalc/settings.hpp"

namespace termcalc {

struct CommandError : std::runtime_error { using std::runtime_error::runtime_error; };

enum class CommandType {
    Exit,
    Save,   // [path]
    Load,   // [path]
    Format, // <radix> [precision]
    Info,
    Remove, // <name>
};

struct Command {
    CommandType type{CommandType::Exit};
    std::vector<std::string> args{};
};

/// State of one calculator session.
struct Session {
    MathContext context{};
    Settings settings{};
    bool done{false};
};

/// Recognizes a meta-command. Returns nullopt for anything that has to go
/// to the calculator instead ("info = 5" defines a constant).
/// Throws CommandError for a command with bad arguments.
std::optional<Command> parse_command(std::string_view line);

/// Runs cmd against the session and returns the text to show (may be
/// empty). Throws CommandError or SerializationError.
std::string run_command(const Command& cmd, Session& session);

/// One line per user constant and user function.
std::string describe_context(const MathContext& context, const FormatOptions& opts);

} // namespace termcalc
