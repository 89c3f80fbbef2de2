#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "termcalc/math_context.hpp"
#include "termcalc/token.hpp"

namespace termcalc {

/// Any lex, parse or validation failure. what() is the complete,
/// caret-marked diagnostic.
struct ParseError : std::runtime_error { using std::runtime_error::runtime_error; };

/// A character that starts no token.
struct TokenError : ParseError {
    TokenError(const std::string& token, std::string_view input, std::size_t pos);
    const std::string& token() const noexcept { return token_; }

private:
    std::string token_;
};

/// The input line followed by a second line with a caret marker at pos.
std::string location_string(std::string_view input, std::size_t pos);

/// "Error: Expected <expected>.\n<location>[ Found: <found>]"
ParseError expected_error(std::string_view input, std::string_view expected,
                          std::optional<std::string> found, std::size_t pos);

/// Lazy single pass tokenizer. Tokens are classified against the math
/// context at the moment they are read.
class Tokenizer {
public:
    Tokenizer(std::string_view input, const MathContext& context) : s_(input), ctx_(context) {}

    /// Current token. Throws ParseError at the end of input.
    const Token& peek();
    /// Current token, advancing past it. Throws ParseError at the end of input.
    Token next();
    bool eof();

    std::string_view input() const { return s_; }
    /// Caret position used for errors at the end of input.
    std::size_t end_position() const { return s_.size(); }

private:
    Token read();
    Token read_name();
    Token read_number();
    void skip_ws();

    std::string_view s_;
    const MathContext& ctx_;
    std::size_t i_{0};
    std::optional<Token> lookahead_{};
};

} // namespace termcalc
