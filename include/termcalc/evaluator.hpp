#pragma once
#include <optional>

#include "termcalc/math_context.hpp"
#include "termcalc/math_result.hpp"
#include "termcalc/token.hpp"

namespace termcalc {

/// Walks a validated expression tree. Never throws for mathematical
/// reasons: undefined arithmetic and unresolvable symbols yield NaN.
/// The context is only read.
class Evaluator {
public:
    explicit Evaluator(const MathContext& context) : ctx_(context) {}

    MathResult evaluate(const ExprNode& tree) const;

private:
    std::optional<MathResult> eval(const ExprNode& node) const;
    std::optional<MathResult> eval_operation(const ExprNode& node) const;
    std::optional<MathResult> eval_function(const ExprNode& node) const;

    const MathContext& ctx_;
};

MathResult evaluate(const ExprNode& tree, const MathContext& context);

/// Value of a number literal as produced by the tokenizer.
MathResult number_value(const Token& t);

} // namespace termcalc
