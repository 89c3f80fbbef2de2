#include "termcalc/calculator.hpp"

#include "termcalc/evaluator.hpp"
#include "termcalc/log.hpp"
#include "termcalc/parser.hpp"

#include <string>
#include <utility>
#include <vector>

namespace termcalc {

static std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// Applies a validated definition tree "lhs = rhs".
static void apply_definition(ExprNode tree, std::string_view input, MathContext& context) {
    ExprNode& lhs = tree[0];
    const std::string name = lhs.content.text;

    if (is_constant_kind(lhs.content.kind)) {
        const MathResult value = evaluate(tree[1], context);
        context.add_user_constant(name, value);
        logger()->debug("defined constant {} = ({}, {})", name, value.re(), value.im());
        return;
    }

    std::vector<std::string> args;
    args.reserve(lhs.size());
    for (const auto& p : lhs.successors) args.push_back(p->content.text);

    ExprNode body = std::move(tree[1]);
    context.add_user_function(name, std::move(body), std::move(args), std::string(trim(input)));
    logger()->debug("defined function {}", trim(input));
}

std::optional<MathResult> evaluate_input(std::string_view input, MathContext& context) {
    ExprNode tree = parse(input, context);

    if (tree.content.kind == TokKind::Operation && tree.content.text == "=") {
        apply_definition(std::move(tree), input, context);
        return std::nullopt;
    }

    const MathResult result = evaluate(tree, context);
    if (!context.is_user_function("ans")) context.add_user_constant("ans", result);
    return result;
}

} // namespace termcalc
