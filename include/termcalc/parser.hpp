#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "termcalc/math_context.hpp"
#include "termcalc/token.hpp"
#include "termcalc/tokenizer.hpp"

namespace termcalc {

/// Precedence climbing parser. Prefix '+' and '-' are folded into unary
/// chains while reading operands, so no separate grammar pass is needed.
class Parser {
public:
    Parser(std::string_view input, const MathContext& context) : ctx_(context), tok_(input, context) {}

    /// Parses the whole input into one tree and validates its symbols.
    /// Throws ParseError (or TokenError) with a caret-marked diagnostic.
    ExprNode parse_toplevel();

private:
    ExprNode parse_expression();
    ExprNode parse_operation();
    ExprNode parse_element();
    ExprNode parse_function(Token name);
    std::vector<ExprNode> parse_function_arg_list();
    ExprNode parse_binary(ExprNode left, unsigned my_prec);
    ExprNode parse_unary(ExprNode op);

    bool is_punc(std::string_view p);
    void skip_punc(std::string_view p);

    // symbol checks on a complete tree
    void validate(const ExprNode& root) const;
    void validate_definition(const ExprNode& root) const;
    void check_symbols(const ExprNode& node, const std::vector<std::string>* params) const;
    void check_node(const ExprNode& node, const std::vector<std::string>* params) const;
    void check_recursion(const ExprNode& body, const std::string& name) const;

    const MathContext& ctx_;
    Tokenizer tok_;
};

/// Convenience wrapper around Parser::parse_toplevel().
ExprNode parse(std::string_view input, const MathContext& context);

} // namespace termcalc
