#include <termcalc/calculator.hpp>
#include <termcalc/commands.hpp>
#include <termcalc/formatter.hpp>
#include <termcalc/log.hpp>
#include <termcalc/serialization.hpp>
#include <termcalc/settings.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using termcalc::MathResult;
using termcalc::Session;

// A meta-command or an input for the calculator. Commands print their own
// output; only calculator results are returned.
std::optional<MathResult> process(const std::string& line, Session& session) {
    if (auto cmd = termcalc::parse_command(line)) {
        const std::string msg = termcalc::run_command(*cmd, session);
        if (!msg.empty()) std::cout << msg << "\n";
        return std::nullopt;
    }
    return termcalc::evaluate_input(line, session.context);
}

// Returns false if the line failed.
bool process_reporting(const std::string& line, Session& session, std::optional<MathResult>& result,
                       const std::string& prefix) {
    try {
        result = process(line, session);
        return true;
    } catch (const termcalc::ParseError& e) {
        std::cout << prefix << e.what() << "\n";
        termcalc::logger()->debug("rejected input \"{}\"", line);
    } catch (const termcalc::CommandError& e) {
        std::cout << prefix << e.what() << "\n";
        termcalc::logger()->debug("rejected command \"{}\"", line);
    } catch (const termcalc::SerializationError& e) {
        if (!prefix.empty()) std::cout << prefix;
        termcalc::logger()->warn("{}", e.what());
    }
    return false;
}

int run_call(const std::vector<std::string>& inputs, Session& session) {
    std::vector<MathResult> results;
    int status = 0;

    for (std::size_t i = 0; i < inputs.size() && !session.done; ++i) {
        std::optional<MathResult> r;
        if (!process_reporting(inputs[i], session, r, "In input " + std::to_string(i + 1) + ":\n")) {
            status = 1;
            break;
        }
        if (r) results.push_back(*r);
    }

    for (std::size_t i = 0; i < results.size(); ++i) {
        if (i) std::cout << "; ";
        std::cout << termcalc::format_result(results[i], session.settings.format);
    }
    if (!results.empty()) std::cout << "\n";
    return status;
}

void run_interactive(Session& session) {
    std::string line;
    while (!session.done) {
        std::cout << ">>> " << std::flush;
        if (!std::getline(std::cin, line)) break;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        std::optional<MathResult> r;
        if (process_reporting(line, session, r, "") && r)
            std::cout << "ans: " << termcalc::format_result(*r, session.settings.format) << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    Session session;
    std::vector<std::string> inputs;

    try {
        session.settings = termcalc::parse_arguments(argc, argv, inputs);
    } catch (const termcalc::ConfigError& e) {
        termcalc::logger()->error("{}", e.what());
        return 2;
    }
    termcalc::set_log_level(session.settings.log_level);

    if (!inputs.empty()) return run_call(inputs, session);

    run_interactive(session);
    return 0;
}
