#include "termcalc/parser.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace termcalc {

static const char* const kOperand = "operand (number, constant, function call) or an unary operation";

static std::string quoted(const std::string& s) { return "\"" + s + "\""; }

static bool is_pending_unary(const ExprNode& n) {
    return n.content.kind == TokKind::Operation && n.is_leaf();
}

static bool is_assignment(const ExprNode& n) {
    return n.content.kind == TokKind::Operation && n.content.text == "=";
}

// -----------------------------
// tree construction
// -----------------------------
ExprNode Parser::parse_toplevel() {
    ExprNode tree = parse_expression();
    if (!tok_.eof()) {
        const Token& t = tok_.peek();
        throw expected_error(tok_.input(), "end of input", quoted(t.text), t.end_pos);
    }
    validate(tree);
    return tree;
}

ExprNode Parser::parse_expression() {
    return parse_operation();
}

ExprNode Parser::parse_operation() {
    ExprNode elem = parse_element();
    if (is_pending_unary(elem)) elem = parse_unary(std::move(elem));
    // a unary chain modifies an operand, so it continues like one
    return parse_binary(std::move(elem), 0);
}

ExprNode Parser::parse_element() {
    if (tok_.eof())
        throw expected_error(tok_.input(), kOperand, std::string("end of input"), tok_.end_position());

    if (is_punc("(")) {
        tok_.next();
        ExprNode e = parse_expression();
        skip_punc(")");
        return e;
    }

    Token t = tok_.next();
    switch (t.kind) {
        case TokKind::Number:
        case TokKind::Constant:
        case TokKind::UserConstant:
        case TokKind::UnknownConstant:
            return ExprNode(std::move(t));

        case TokKind::Function:
        case TokKind::UserFunction:
        case TokKind::UnknownFunction:
            return parse_function(std::move(t));

        case TokKind::Operation:
            // left unprocessed, the caller folds it with its operand
            if (ctx_.is_unary_operation(t.text)) return ExprNode(std::move(t));
            throw expected_error(tok_.input(), "unary operation",
                                 "non-unary operation " + quoted(t.text), t.end_pos);

        case TokKind::Punctuation:
            break;
    }
    throw expected_error(tok_.input(), kOperand, "unexpected symbol " + quoted(t.text), t.end_pos);
}

ExprNode Parser::parse_function(Token name) {
    skip_punc("(");
    std::vector<ExprNode> args = parse_function_arg_list();
    skip_punc(")");

    ExprNode fn(std::move(name));
    for (auto& a : args) fn.add(std::move(a));
    return fn;
}

std::vector<ExprNode> Parser::parse_function_arg_list() {
    std::vector<ExprNode> args;
    if (tok_.eof() || is_punc(")")) return args;

    for (;;) {
        args.push_back(parse_expression());
        if (tok_.eof()) break;

        if (is_punc(",")) {
            tok_.next();
            if (tok_.eof()) break;
            if (is_punc(")")) {
                throw expected_error(tok_.input(), "an argument", std::string("symbol \")\""),
                                     tok_.peek().end_pos);
            }
            continue;
        }
        if (is_punc(")")) break;

        const Token& t = tok_.peek();
        throw expected_error(tok_.input(), "\",\" or \")\"", quoted(t.text), t.end_pos);
    }
    return args;
}

ExprNode Parser::parse_binary(ExprNode left, unsigned my_prec) {
    for (;;) {
        if (tok_.eof()) return left;

        const Token& t = tok_.peek();
        if (t.kind != TokKind::Operation) return left;
        const unsigned his_prec = ctx_.operation_precedence(t.text).value_or(0);
        if (his_prec <= my_prec) return left;

        ExprNode op(tok_.next());
        ExprNode right = parse_element();
        if (is_pending_unary(right)) right = parse_unary(std::move(right));
        right = parse_binary(std::move(right), his_prec);

        op.add(std::move(left));
        op.add(std::move(right));
        left = std::move(op);
    }
}

ExprNode Parser::parse_unary(ExprNode op) {
    ExprNode operand = parse_element();
    if (is_pending_unary(operand)) operand = parse_unary(std::move(operand));
    op.add(std::move(operand));
    return op;
}

bool Parser::is_punc(std::string_view p) {
    if (tok_.eof()) return false;
    const Token& t = tok_.peek();
    return t.kind == TokKind::Punctuation && t.text == p;
}

void Parser::skip_punc(std::string_view p) {
    if (is_punc(p)) {
        tok_.next();
        return;
    }
    const std::string expected = "symbol \"" + std::string(p) + "\"";
    if (tok_.eof())
        throw expected_error(tok_.input(), expected, std::string("end of input"), tok_.end_position());
    const Token& t = tok_.peek();
    throw expected_error(tok_.input(), expected, quoted(t.text), t.end_pos);
}

// -----------------------------
// validation
// -----------------------------
void Parser::validate(const ExprNode& root) const {
    if (is_assignment(root)) validate_definition(root);
    else check_symbols(root, nullptr);
}

void Parser::validate_definition(const ExprNode& root) const {
    const ExprNode& lhs = root[0];
    const ExprNode& rhs = root[1];
    const Token& name = lhs.content;

    switch (name.kind) {
        case TokKind::Constant:
        case TokKind::Function:
            throw expected_error(tok_.input(), "new constant name or function name",
                                 "built-in expression " + quoted(name.text), name.end_pos);

        case TokKind::UnknownConstant:
        case TokKind::UserConstant: {
            const std::vector<std::string> none;
            check_symbols(rhs, &none);
            return;
        }

        case TokKind::UnknownFunction:
        case TokKind::UserFunction:
            break;

        default:
            if (is_assignment(lhs))
                throw expected_error(tok_.input(), "assignment only at top level", quoted(name.text), name.end_pos);
            throw expected_error(tok_.input(), "new constant name or function name", quoted(name.text),
                                 name.end_pos);
    }

    std::vector<std::string> params;
    for (const auto& p : lhs.successors) {
        const Token& t = p->content;
        if (!p->is_leaf() || (t.kind != TokKind::UnknownConstant && t.kind != TokKind::UserConstant)) {
            const std::string found = t.kind == TokKind::Constant ? "built-in expression " + quoted(t.text)
                                                                  : quoted(t.text);
            throw expected_error(tok_.input(), "argument name", found, t.end_pos);
        }
        params.push_back(t.text);
    }

    const std::set<std::string> distinct(params.begin(), params.end());
    if (distinct.size() != params.size()) {
        throw expected_error(tok_.input(), "distinct arguments",
                             std::string("function definition with partly equal arguments"), 0);
    }

    check_symbols(rhs, &params);
    check_recursion(rhs, name.text);
}

// Checks every node in source order. params is null for a plain expression
// and holds the parameter names (possibly none) on the right side of a
// definition.
void Parser::check_symbols(const ExprNode& node, const std::vector<std::string>* params) const {
    if (node.content.kind == TokKind::Operation && node.size() == 2) {
        check_symbols(node[0], params);
        check_node(node, params);
        check_symbols(node[1], params);
        return;
    }
    check_node(node, params);
    for (const auto& s : node.successors) check_symbols(*s, params);
}

void Parser::check_node(const ExprNode& node, const std::vector<std::string>* params) const {
    const Token& t = node.content;
    switch (t.kind) {
        case TokKind::Operation:
            if (is_assignment(node))
                throw expected_error(tok_.input(), "assignment only at top level", quoted(t.text), t.end_pos);
            return;

        case TokKind::UnknownConstant:
        case TokKind::UserConstant:
            if (params && std::find(params->begin(), params->end(), t.text) != params->end()) return;
            if (t.kind == TokKind::UserConstant) return;
            if (params)
                throw expected_error(tok_.input(), "non-symbolic expression",
                                     "symbolic expression " + quoted(t.text), t.end_pos);
            throw expected_error(tok_.input(), "built-in or user defined constant",
                                 "unknown constant " + quoted(t.text), t.end_pos);

        case TokKind::UnknownFunction:
            if (params)
                throw expected_error(tok_.input(), "non-symbolic expression",
                                     "symbolic expression " + quoted(t.text), t.end_pos);
            throw expected_error(tok_.input(), "built-in or user defined function",
                                 "unknown function \"" + t.text + "(...)\"", t.end_pos);

        case TokKind::Function:
        case TokKind::UserFunction: {
            const std::size_t arity = ctx_.function_arity(t.text).value_or(0);
            if (node.size() != arity) {
                throw expected_error(tok_.input(), std::to_string(arity) + " argument(s)",
                                     std::to_string(node.size()) + " argument(s)", t.end_pos);
            }
            return;
        }

        default:
            return;
    }
}

// True if calling user function `callee` ends up calling `name`.
static bool calls(const std::string& callee, const std::string& name, const MathContext& ctx,
                  std::set<std::string>& seen);

static bool reaches(const ExprNode& node, const std::string& name, const MathContext& ctx,
                    std::set<std::string>& seen) {
    if (node.content.kind == TokKind::UserFunction && calls(node.content.text, name, ctx, seen)) return true;
    for (const auto& s : node.successors)
        if (reaches(*s, name, ctx, seen)) return true;
    return false;
}

static bool calls(const std::string& callee, const std::string& name, const MathContext& ctx,
                  std::set<std::string>& seen) {
    if (callee == name) return true;
    if (!seen.insert(callee).second) return false;
    const UserFunction* f = ctx.user_function(callee);
    return f && reaches(f->body, name, ctx, seen);
}

void Parser::check_recursion(const ExprNode& body, const std::string& name) const {
    const Token& t = body.content;
    if (t.kind == TokKind::UserFunction) {
        std::set<std::string> seen;
        if (calls(t.text, name, ctx_, seen)) {
            throw expected_error(tok_.input(), "non-recursive function definition",
                                 "recursive call " + quoted(t.text), t.end_pos);
        }
    }
    for (const auto& s : body.successors) check_recursion(*s, name);
}

ExprNode parse(std::string_view input, const MathContext& context) {
    Parser p(input, context);
    return p.parse_toplevel();
}

} // namespace termcalc
