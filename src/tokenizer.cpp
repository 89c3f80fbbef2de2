#include "termcalc/tokenizer.hpp"

#include <cctype>
#include <utility>

namespace termcalc {

std::string location_string(std::string_view input, std::size_t pos) {
    std::string out(input);
    out += '\n';
    out.append(pos, ' ');
    out += "^~~~";
    return out;
}

ParseError expected_error(std::string_view input, std::string_view expected,
                          std::optional<std::string> found, std::size_t pos) {
    std::string msg = "Error: Expected ";
    msg += expected;
    msg += ".\n";
    msg += location_string(input, pos);
    if (found) {
        msg += " Found: ";
        msg += *found;
    }
    return ParseError(msg);
}

TokenError::TokenError(const std::string& token, std::string_view input, std::size_t pos)
    : ParseError("Error: Unknown token found: \"" + token + "\".\n" + location_string(input, pos)),
      token_(token) {}

static bool all_digits(std::string_view s, int base) {
    if (s.empty()) return false;
    for (char c : s) {
        int d;
        if (c >= '0' && c <= '9') d = c - '0';
        else if (c >= 'a' && c <= 'f') d = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') d = c - 'A' + 10;
        else return false;
        if (d >= base) return false;
    }
    return true;
}

// d*[.d*][(E|e)[+-]d+] with at least one mantissa digit
static bool is_decimal_literal(std::string_view s) {
    std::size_t i = 0;
    std::size_t digits = 0;
    auto skip_digits = [&]() {
        std::size_t n = 0;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; ++n; }
        return n;
    };

    digits += skip_digits();
    if (i < s.size() && s[i] == '.') {
        ++i;
        digits += skip_digits();
    }
    if (digits == 0) return false;

    if (i < s.size() && (s[i] == 'E' || s[i] == 'e')) {
        ++i;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
        if (skip_digits() == 0) return false;
    }
    return i == s.size();
}

static bool is_number_literal(std::string_view s) {
    if (s.size() > 2 && s[0] == '0') {
        switch (s[1]) {
            case 'x': return all_digits(s.substr(2), 16);
            case 'o': return all_digits(s.substr(2), 8);
            case 'b': return all_digits(s.substr(2), 2);
            default: break;
        }
    }
    return is_decimal_literal(s);
}

void Tokenizer::skip_ws() {
    while (i_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
}

bool Tokenizer::eof() {
    if (lookahead_) return false;
    skip_ws();
    return i_ >= s_.size();
}

const Token& Tokenizer::peek() {
    if (!lookahead_) lookahead_ = read();
    return *lookahead_;
}

Token Tokenizer::next() {
    if (lookahead_) {
        Token t = std::move(*lookahead_);
        lookahead_.reset();
        return t;
    }
    return read();
}

Token Tokenizer::read() {
    skip_ws();
    if (i_ >= s_.size())
        throw expected_error(s_, "further input", std::string("end of input"), end_position());

    const char c = s_[i_];

    if (ctx_.is_literal_symbol(c)) return read_name();
    if (ctx_.is_number_symbol(c) || c == '.') return read_number();

    if (ctx_.is_operation(std::string_view(&s_[i_], 1))) {
        Token t{TokKind::Operation, std::string(1, c), i_};
        ++i_;
        return t;
    }
    if (ctx_.is_punctuation_symbol(c)) {
        Token t{TokKind::Punctuation, std::string(1, c), i_};
        ++i_;
        return t;
    }

    // report a multi-byte character as a whole
    std::size_t len = 1;
    while (i_ + len < s_.size() && (static_cast<unsigned char>(s_[i_ + len]) & 0xC0) == 0x80) ++len;
    throw TokenError(std::string(s_.substr(i_, len)), s_, i_);
}

Token Tokenizer::read_name() {
    const std::size_t start = i_;
    while (i_ < s_.size() && (ctx_.is_literal_symbol(s_[i_]) || ctx_.is_number_symbol(s_[i_]))) ++i_;

    Token t;
    t.text = std::string(s_.substr(start, i_ - start));
    t.end_pos = i_ - 1;

    // a name directly followed by '(' is a function call
    const bool call = i_ < s_.size() && s_[i_] == '(';

    if (!call && ctx_.is_built_in_constant(t.text)) t.kind = TokKind::Constant;
    else if (!call && ctx_.is_user_constant(t.text)) t.kind = TokKind::UserConstant;
    else if (call && ctx_.is_built_in_function(t.text)) t.kind = TokKind::Function;
    else if (call && ctx_.is_user_function(t.text)) t.kind = TokKind::UserFunction;
    else if (call) t.kind = TokKind::UnknownFunction;
    else t.kind = TokKind::UnknownConstant;
    return t;
}

Token Tokenizer::read_number() {
    Token t{TokKind::Number};

    bool first = true;
    bool leading_zero = false;
    bool last_was_e = false;

    while (i_ < s_.size()) {
        const char c = s_[i_];
        const bool hex = t.text.size() >= 2 && t.text[0] == '0' && t.text[1] == 'x';

        if (c == 'i' && !first) {
            // trailing imaginary unit
            t.number_type = NumberType::Complex;
            ++i_;
            break;
        }

        if (ctx_.is_number_symbol(c) || c == '.') {
            leading_zero = first && c == '0';
            last_was_e = false;
        } else if ((c == '+' || c == '-') && last_was_e) {
            last_was_e = false;
        } else if ((c == 'x' || c == 'o' || c == 'b') && leading_zero) {
            leading_zero = false;
        } else if (ctx_.is_literal_symbol(c)) {
            // hex digits and exponents; any other letter is kept so that the
            // error below shows the whole broken literal
            leading_zero = false;
            last_was_e = !hex && (c == 'E' || c == 'e');
        } else {
            break;
        }

        t.text += c;
        ++i_;
        first = false;
    }

    t.end_pos = i_ - 1;
    if (!t.text.empty() && t.text.front() == '.') t.text.insert(t.text.begin(), '0');

    if (!is_number_literal(t.text)) {
        std::string shown = t.text;
        if (t.number_type == NumberType::Complex) shown += 'i';
        throw expected_error(s_, "literal number", "invalid literal symbol(s) \"" + shown + "\"", t.end_pos);
    }
    return t;
}

} // namespace termcalc
