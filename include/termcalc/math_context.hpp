#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "termcalc/math_result.hpp"
#include "termcalc/token.hpp"

namespace termcalc {

enum class OperationType {
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    Pow,
    Assign,
};

enum class FunctionType {
    Cos, Sin, Tan, Cot,
    Cosh, Sinh, Tanh, Coth,
    ArcCos, ArcSin, ArcTan, ArcCot,
    ArcCosh, ArcSinh, ArcTanh, ArcCoth,
    Exp, Ln, Sqrt,
    Re, Im,
    Pow, Root,
};

/// A function defined by the user, e.g. "f(x, y) = x^2 + y".
struct UserFunction {
    ExprNode body;                  // right hand side of the definition
    std::vector<std::string> args;  // parameter names in call order
    std::string definition;         // the whole definition as typed
};

/// The mathematical environment: operators, functions, constants and the
/// symbols defined by the user during a session.
///
/// The operator, function and built-in constant tables are fixed and built
/// by the constructor; only the user tables change (and get persisted).
/// Lookups always try the built-in tables first.
class MathContext {
public:
    using ConstantMap = std::map<std::string, MathResult, std::less<>>;
    using FunctionMap = std::map<std::string, UserFunction, std::less<>>;

    MathContext();

    // operations
    bool is_operation(std::string_view s) const;
    bool is_unary_operation(std::string_view s) const;
    std::optional<OperationType> operation_kind(std::string_view s) const;
    std::optional<unsigned> operation_precedence(std::string_view s) const;

    // functions
    bool is_function(std::string_view s) const;
    bool is_built_in_function(std::string_view s) const;
    bool is_user_function(std::string_view s) const;
    std::optional<FunctionType> function_kind(std::string_view s) const;
    /// Number of arguments of a built-in or user function.
    std::optional<std::size_t> function_arity(std::string_view s) const;
    const UserFunction* user_function(std::string_view s) const;

    // constants
    bool is_constant(std::string_view s) const;
    bool is_built_in_constant(std::string_view s) const;
    bool is_user_constant(std::string_view s) const;
    std::optional<MathResult> constant_value(std::string_view s) const;

    // character classes
    bool is_number_symbol(char c) const;
    bool is_literal_symbol(char c) const;
    bool is_punctuation_symbol(char c) const;

    /// True if s could name a constant or function: a literal symbol
    /// followed by literal or number symbols.
    bool is_valid_name(std::string_view s) const;

    /// Defines (or redefines) a user constant. A user function of the same
    /// name is removed.
    void add_user_constant(std::string name, MathResult value);
    bool remove_user_constant(std::string_view name);

    /// Defines (or redefines) a user function. A user constant of the same
    /// name is removed.
    void add_user_function(std::string name, ExprNode body, std::vector<std::string> args,
                           std::string definition);
    bool remove_user_function(std::string_view name);

    const ConstantMap& user_constants() const noexcept { return user_constants_; }
    const FunctionMap& user_functions() const noexcept { return user_functions_; }

    /// Copy of the body of user function `name` with each parameter leaf
    /// replaced by a copy of the matching argument subtree. Empty if the
    /// function is unknown or the number of arguments does not match.
    /// The stored definition is left untouched.
    std::optional<ExprNode> substitute_user_function_tree(
        std::string_view name, const std::vector<std::unique_ptr<ExprNode>>& args) const;

private:
    std::map<std::string, std::pair<OperationType, unsigned>, std::less<>> operations_;
    std::map<std::string, std::pair<FunctionType, std::size_t>, std::less<>> functions_;
    std::map<std::string, MathResult, std::less<>> constants_;

    std::set<char> number_symbols_;
    std::set<char> literals_;
    std::set<char> punctuation_;

    ConstantMap user_constants_;
    FunctionMap user_functions_;
};

} // namespace termcalc
