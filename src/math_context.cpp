#include "termcalc/math_context.hpp"

#include <algorithm>
#include <cmath>

namespace termcalc {

MathContext::MathContext() {
    operations_ = {
        {"=", {OperationType::Assign, 1}},
        {"+", {OperationType::Add, 2}},
        {"-", {OperationType::Sub, 2}},
        {"*", {OperationType::Mul, 3}},
        {"/", {OperationType::Div, 3}},
        {"%", {OperationType::Mod, 3}},
        {"^", {OperationType::Pow, 4}},
    };

    functions_ = {
        {"cos", {FunctionType::Cos, 1}},
        {"sin", {FunctionType::Sin, 1}},
        {"tan", {FunctionType::Tan, 1}},
        {"cot", {FunctionType::Cot, 1}},
        {"cosh", {FunctionType::Cosh, 1}},
        {"sinh", {FunctionType::Sinh, 1}},
        {"tanh", {FunctionType::Tanh, 1}},
        {"coth", {FunctionType::Coth, 1}},
        {"arccos", {FunctionType::ArcCos, 1}},
        {"acos", {FunctionType::ArcCos, 1}},
        {"arcsin", {FunctionType::ArcSin, 1}},
        {"asin", {FunctionType::ArcSin, 1}},
        {"arctan", {FunctionType::ArcTan, 1}},
        {"atan", {FunctionType::ArcTan, 1}},
        {"arccot", {FunctionType::ArcCot, 1}},
        {"acot", {FunctionType::ArcCot, 1}},
        {"arccosh", {FunctionType::ArcCosh, 1}},
        {"acosh", {FunctionType::ArcCosh, 1}},
        {"arcsinh", {FunctionType::ArcSinh, 1}},
        {"asinh", {FunctionType::ArcSinh, 1}},
        {"arctanh", {FunctionType::ArcTanh, 1}},
        {"atanh", {FunctionType::ArcTanh, 1}},
        {"arccoth", {FunctionType::ArcCoth, 1}},
        {"acoth", {FunctionType::ArcCoth, 1}},
        {"exp", {FunctionType::Exp, 1}},
        {"ln", {FunctionType::Ln, 1}},
        {"sqrt", {FunctionType::Sqrt, 1}},
        {"re", {FunctionType::Re, 1}},
        {"im", {FunctionType::Im, 1}},
        {"pow", {FunctionType::Pow, 2}},
        {"root", {FunctionType::Root, 2}},
    };

    constants_ = {
        {"pi", MathResult::real(std::acos(-1.0))},
        {"e", MathResult::real(std::exp(1.0))},
        {"i", MathResult::complex(0.0, 1.0)},
    };

    for (char c = '0'; c <= '9'; ++c) number_symbols_.insert(c);

    for (char c = 'a'; c <= 'z'; ++c) literals_.insert(c);
    for (char c = 'A'; c <= 'Z'; ++c) literals_.insert(c);
    literals_.insert('_');

    punctuation_ = {'(', ')', ','};
}

// -----------------------------
// operations
// -----------------------------
bool MathContext::is_operation(std::string_view s) const {
    return operations_.find(s) != operations_.end();
}

bool MathContext::is_unary_operation(std::string_view s) const {
    auto k = operation_kind(s);
    return k && (*k == OperationType::Add || *k == OperationType::Sub);
}

std::optional<OperationType> MathContext::operation_kind(std::string_view s) const {
    auto it = operations_.find(s);
    if (it == operations_.end()) return std::nullopt;
    return it->second.first;
}

std::optional<unsigned> MathContext::operation_precedence(std::string_view s) const {
    auto it = operations_.find(s);
    if (it == operations_.end()) return std::nullopt;
    return it->second.second;
}

// -----------------------------
// functions
// -----------------------------
bool MathContext::is_function(std::string_view s) const {
    return is_built_in_function(s) || is_user_function(s);
}

bool MathContext::is_built_in_function(std::string_view s) const {
    return functions_.find(s) != functions_.end();
}

bool MathContext::is_user_function(std::string_view s) const {
    return user_functions_.find(s) != user_functions_.end();
}

std::optional<FunctionType> MathContext::function_kind(std::string_view s) const {
    auto it = functions_.find(s);
    if (it == functions_.end()) return std::nullopt;
    return it->second.first;
}

std::optional<std::size_t> MathContext::function_arity(std::string_view s) const {
    if (auto it = functions_.find(s); it != functions_.end()) return it->second.second;
    if (auto it = user_functions_.find(s); it != user_functions_.end()) return it->second.args.size();
    return std::nullopt;
}

const UserFunction* MathContext::user_function(std::string_view s) const {
    auto it = user_functions_.find(s);
    return it == user_functions_.end() ? nullptr : &it->second;
}

// -----------------------------
// constants
// -----------------------------
bool MathContext::is_constant(std::string_view s) const {
    return is_built_in_constant(s) || is_user_constant(s);
}

bool MathContext::is_built_in_constant(std::string_view s) const {
    return constants_.find(s) != constants_.end();
}

bool MathContext::is_user_constant(std::string_view s) const {
    return user_constants_.find(s) != user_constants_.end();
}

std::optional<MathResult> MathContext::constant_value(std::string_view s) const {
    if (auto it = constants_.find(s); it != constants_.end()) return it->second;
    if (auto it = user_constants_.find(s); it != user_constants_.end()) return it->second;
    return std::nullopt;
}

// -----------------------------
// character classes
// -----------------------------
bool MathContext::is_number_symbol(char c) const { return number_symbols_.count(c) != 0; }
bool MathContext::is_literal_symbol(char c) const { return literals_.count(c) != 0; }
bool MathContext::is_punctuation_symbol(char c) const { return punctuation_.count(c) != 0; }

bool MathContext::is_valid_name(std::string_view s) const {
    if (s.empty() || !is_literal_symbol(s.front())) return false;
    return std::all_of(s.begin(), s.end(),
                       [this](char c) { return is_literal_symbol(c) || is_number_symbol(c); });
}

// -----------------------------
// user symbols
// -----------------------------
void MathContext::add_user_constant(std::string name, MathResult value) {
    remove_user_function(name);
    user_constants_[std::move(name)] = value;
}

bool MathContext::remove_user_constant(std::string_view name) {
    auto it = user_constants_.find(name);
    if (it == user_constants_.end()) return false;
    user_constants_.erase(it);
    return true;
}

void MathContext::add_user_function(std::string name, ExprNode body, std::vector<std::string> args,
                                    std::string definition) {
    remove_user_constant(name);
    remove_user_function(name);
    user_functions_.emplace(std::move(name),
                            UserFunction{std::move(body), std::move(args), std::move(definition)});
}

bool MathContext::remove_user_function(std::string_view name) {
    auto it = user_functions_.find(name);
    if (it == user_functions_.end()) return false;
    user_functions_.erase(it);
    return true;
}

static void substitute(ExprNode& node, const std::vector<std::string>& params,
                       const std::vector<std::unique_ptr<ExprNode>>& args) {
    if (node.is_leaf() && is_constant_kind(node.content.kind)) {
        auto it = std::find(params.begin(), params.end(), node.content.text);
        if (it != params.end()) {
            // the inserted argument is not visited again
            node = args[static_cast<std::size_t>(it - params.begin())]->clone();
        }
        return;
    }
    for (auto& s : node.successors) substitute(*s, params, args);
}

std::optional<ExprNode> MathContext::substitute_user_function_tree(
    std::string_view name, const std::vector<std::unique_ptr<ExprNode>>& args) const {
    const UserFunction* f = user_function(name);
    if (!f || f->args.size() != args.size()) return std::nullopt;

    ExprNode tree = f->body.clone();
    substitute(tree, f->args, args);
    return tree;
}

} // namespace termcalc
