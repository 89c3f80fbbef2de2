#pragma once
#include <cstddef>
#include <optional>
#include <string>

#include "termcalc/math_result.hpp"
#include "termcalc/tree.hpp"

namespace termcalc {

enum class TokKind {
    Number,

    Constant,     // built-in constant
    UserConstant,
    Function,     // built-in function
    UserFunction,

    Operation,
    Punctuation,

    // names not (yet) known to the math context; only valid on the
    // defining side of an assignment or as function parameters
    UnknownConstant,
    UnknownFunction,
};

struct Token {
    TokKind kind{TokKind::Punctuation};
    std::string text{};       // as written; numbers without the trailing 'i'
    std::size_t end_pos{0};   // index of the last character in the input
    NumberType number_type{NumberType::Real}; // for Number
    std::optional<MathResult> value{};        // Number holding an evaluated call argument
};

inline bool is_constant_kind(TokKind k) {
    return k == TokKind::Constant || k == TokKind::UserConstant || k == TokKind::UnknownConstant;
}

inline bool is_function_kind(TokKind k) {
    return k == TokKind::Function || k == TokKind::UserFunction || k == TokKind::UnknownFunction;
}

using ExprNode = TreeNode<Token>;

/// Prefix rendering of a tree, e.g. "(+ 1 (* 2 x))". Meant for diagnostics
/// and tests.
std::string to_string(const ExprNode& node);

} // namespace termcalc
