#include "termcalc/evaluator.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace termcalc {

static double radix_value(std::string_view digits, int base) {
    double v = 0.0;
    for (char c : digits) {
        int d = 0;
        if (c >= '0' && c <= '9') d = c - '0';
        else if (c >= 'a' && c <= 'f') d = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') d = c - 'A' + 10;
        v = v * base + d;
    }
    return v;
}

MathResult number_value(const Token& t) {
    if (t.value) return *t.value;

    const std::string& s = t.text;
    double v = 0.0;

    int base = 10;
    if (s.size() > 2 && s[0] == '0') {
        switch (s[1]) {
            case 'x': base = 16; break;
            case 'o': base = 8; break;
            case 'b': base = 2; break;
            default: break;
        }
    }
    if (base != 10) v = radix_value(std::string_view(s).substr(2), base);
    else v = std::strtod(s.c_str(), nullptr);

    if (t.number_type == NumberType::Complex) return MathResult::complex(0.0, v);
    return MathResult::real(v);
}

MathResult Evaluator::evaluate(const ExprNode& tree) const {
    return eval(tree).value_or(MathResult::undefined());
}

std::optional<MathResult> Evaluator::eval(const ExprNode& node) const {
    const Token& t = node.content;
    switch (t.kind) {
        case TokKind::Number:
            return number_value(t);

        case TokKind::Constant:
        case TokKind::UserConstant:
            return ctx_.constant_value(t.text);

        case TokKind::Operation:
            return eval_operation(node);

        case TokKind::Function:
        case TokKind::UserFunction:
            return eval_function(node);

        default:
            return std::nullopt;
    }
}

std::optional<MathResult> Evaluator::eval_operation(const ExprNode& node) const {
    auto kind = ctx_.operation_kind(node.content.text);
    if (!kind) return std::nullopt;

    if (node.size() == 1) {
        auto x = eval(node[0]);
        if (!x) return std::nullopt;
        switch (*kind) {
            case OperationType::Add: return *x;
            case OperationType::Sub: return -*x;
            default: return std::nullopt;
        }
    }
    if (node.size() != 2) return std::nullopt;

    auto a = eval(node[0]);
    auto b = eval(node[1]);
    if (!a || !b) return std::nullopt;

    switch (*kind) {
        case OperationType::Add: return *a + *b;
        case OperationType::Sub: return *a - *b;
        case OperationType::Mul: return *a * *b;
        case OperationType::Div: return *a / *b;
        case OperationType::Mod: return mod(*a, *b);
        case OperationType::Pow: return pow(*a, *b);
        case OperationType::Assign: break; // definitions are applied by the caller
    }
    return std::nullopt;
}

std::optional<MathResult> Evaluator::eval_function(const ExprNode& node) const {
    const Token& t = node.content;

    if (t.kind == TokKind::UserFunction) {
        // arguments are evaluated once and enter the body as value leaves
        std::vector<std::unique_ptr<ExprNode>> args;
        for (const auto& a : node.successors) {
            auto v = eval(*a);
            if (!v) return std::nullopt;
            Token leaf{TokKind::Number, to_string(*a), a->content.end_pos};
            leaf.value = *v;
            args.push_back(std::make_unique<ExprNode>(std::move(leaf)));
        }
        auto body = ctx_.substitute_user_function_tree(t.text, args);
        if (!body) return std::nullopt;
        return eval(*body);
    }

    auto kind = ctx_.function_kind(t.text);
    auto arity = ctx_.function_arity(t.text);
    if (!kind || !arity || node.size() != *arity) return std::nullopt;

    std::optional<MathResult> x = eval(node[0]);
    if (!x) return std::nullopt;

    switch (*kind) {
        case FunctionType::Cos:     return fn::cos(*x);
        case FunctionType::Sin:     return fn::sin(*x);
        case FunctionType::Tan:     return fn::tan(*x);
        case FunctionType::Cot:     return fn::cot(*x);
        case FunctionType::Cosh:    return fn::cosh(*x);
        case FunctionType::Sinh:    return fn::sinh(*x);
        case FunctionType::Tanh:    return fn::tanh(*x);
        case FunctionType::Coth:    return fn::coth(*x);
        case FunctionType::ArcCos:  return fn::arccos(*x);
        case FunctionType::ArcSin:  return fn::arcsin(*x);
        case FunctionType::ArcTan:  return fn::arctan(*x);
        case FunctionType::ArcCot:  return fn::arccot(*x);
        case FunctionType::ArcCosh: return fn::arccosh(*x);
        case FunctionType::ArcSinh: return fn::arcsinh(*x);
        case FunctionType::ArcTanh: return fn::arctanh(*x);
        case FunctionType::ArcCoth: return fn::arccoth(*x);
        case FunctionType::Exp:     return fn::exp(*x);
        case FunctionType::Ln:      return fn::ln(*x);
        case FunctionType::Sqrt:    return fn::sqrt(*x);
        case FunctionType::Re:      return fn::re(*x);
        case FunctionType::Im:      return fn::im(*x);
        case FunctionType::Pow:
        case FunctionType::Root:
            break;
    }

    std::optional<MathResult> y = eval(node[1]);
    if (!y) return std::nullopt;
    if (*kind == FunctionType::Pow) return pow(*x, *y);
    return fn::root(*x, *y);
}

MathResult evaluate(const ExprNode& tree, const MathContext& context) {
    return Evaluator(context).evaluate(tree);
}

} // namespace termcalc
