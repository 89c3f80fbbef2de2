#include "termcalc/token.hpp"

namespace termcalc {

std::string to_string(const ExprNode& node) {
    std::string s = node.content.text;
    if (node.content.kind == TokKind::Number && node.content.number_type == NumberType::Complex) s += 'i';
    if (node.is_leaf() && node.content.kind != TokKind::Function && node.content.kind != TokKind::UserFunction &&
        node.content.kind != TokKind::UnknownFunction)
        return s;

    std::string out = "(" + s;
    for (const auto& c : node.successors) out += " " + to_string(*c);
    out += ")";
    return out;
}

} // namespace termcalc
