#include "termcalc/commands.hpp"

#include "termcalc/formatter.hpp"
#include "termcalc/log.hpp"
#include "termcalc/serialization.hpp"

#include <sstream>
#include <utility>

namespace termcalc {

static std::vector<std::string> split_words(std::string_view s) {
    std::vector<std::string> words;
    std::istringstream is{std::string(s)};
    std::string w;
    while (is >> w) words.push_back(std::move(w));
    return words;
}

static std::optional<CommandType> command_type(const std::string& word) {
    if (word == "exit") return CommandType::Exit;
    if (word == "save") return CommandType::Save;
    if (word == "load") return CommandType::Load;
    if (word == "format") return CommandType::Format;
    if (word == "info") return CommandType::Info;
    if (word == "remove") return CommandType::Remove;
    return std::nullopt;
}

static void expect_args(const Command& cmd, const std::string& word, std::size_t min, std::size_t max) {
    const std::size_t n = cmd.args.size();
    if (n < min || n > max) {
        std::string expected = std::to_string(min);
        if (max != min) expected += " to " + std::to_string(max);
        throw CommandError("Error: Command \"" + word + "\" expects " + expected + " argument(s), got " +
                           std::to_string(n) + ".");
    }
}

std::optional<Command> parse_command(std::string_view line) {
    std::vector<std::string> words = split_words(line);
    if (words.empty()) return std::nullopt;

    auto type = command_type(words.front());
    if (!type) return std::nullopt;
    // "save = 3", "info(2)"
    if (words.size() > 1 && (words[1].front() == '=' || words[1].front() == '(')) return std::nullopt;

    Command cmd{*type, {words.begin() + 1, words.end()}};
    switch (cmd.type) {
        case CommandType::Exit:
        case CommandType::Info:
            expect_args(cmd, words.front(), 0, 0);
            break;
        case CommandType::Save:
        case CommandType::Load:
            expect_args(cmd, words.front(), 0, 1);
            break;
        case CommandType::Format:
            expect_args(cmd, words.front(), 1, 2);
            if (!radix_from_string(cmd.args[0]))
                throw CommandError("Error: Unknown format \"" + cmd.args[0] + "\". Expected dec, bin, oct, hex or exp.");
            if (cmd.args.size() == 2) {
                try {
                    parse_precision(cmd.args[1]);
                } catch (const ConfigError& e) {
                    throw CommandError(std::string("Error: ") + e.what() + ".");
                }
            }
            break;
        case CommandType::Remove:
            expect_args(cmd, words.front(), 1, 1);
            break;
    }
    return cmd;
}

std::string describe_context(const MathContext& context, const FormatOptions& opts) {
    std::ostringstream os;
    for (const auto& [name, value] : context.user_constants())
        os << name << " = " << format_result(value, opts) << '\n';
    for (const auto& [name, f] : context.user_functions())
        os << f.definition << '\n';

    std::string out = os.str();
    if (out.empty()) return "No user defined constants or functions.";
    out.pop_back();
    return out;
}

std::string run_command(const Command& cmd, Session& session) {
    switch (cmd.type) {
        case CommandType::Exit:
            session.done = true;
            return {};

        case CommandType::Save: {
            const std::string path = cmd.args.empty() ? session.settings.context_path : cmd.args[0];
            save_context(session.context, path);
            return "Saved context to \"" + path + "\".";
        }

        case CommandType::Load: {
            const std::string path = cmd.args.empty() ? session.settings.context_path : cmd.args[0];
            session.context = load_context(path);
            return "Loaded context from \"" + path + "\".";
        }

        case CommandType::Format:
            session.settings.format.radix = *radix_from_string(cmd.args[0]);
            if (cmd.args.size() == 2) session.settings.format.precision = parse_precision(cmd.args[1]);
            logger()->debug("format set to {} with precision {}", radix_name(session.settings.format.radix),
                            session.settings.format.precision);
            return {};

        case CommandType::Info:
            return describe_context(session.context, session.settings.format);

        case CommandType::Remove: {
            const std::string& name = cmd.args[0];
            if (session.context.remove_user_constant(name) || session.context.remove_user_function(name))
                return {};
            throw CommandError("Error: No user defined constant or function \"" + name + "\".");
        }
    }
    return {};
}

} // namespace termcalc
