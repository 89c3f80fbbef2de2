#include <gtest/gtest.h>
#include <termcalc/math_context.hpp>
#include <termcalc/parser.hpp>

#include <memory>
#include <string>
#include <vector>

namespace {

using termcalc::ExprNode;
using termcalc::MathContext;
using termcalc::MathResult;
using termcalc::OperationType;

// Stores "name(args) = body" in ctx the way the calculator does.
void define(MathContext& ctx, const std::string& definition) {
    ExprNode tree = termcalc::parse(definition, ctx);
    std::vector<std::string> args;
    for (const auto& a : tree[0].successors) args.push_back(a->content.text);
    const std::string name = tree[0].content.text;
    ctx.add_user_function(name, std::move(tree[1]), args, definition);
}

std::vector<std::unique_ptr<ExprNode>> args_of(const MathContext& ctx, const std::vector<std::string>& exprs) {
    std::vector<std::unique_ptr<ExprNode>> out;
    for (const auto& e : exprs) out.push_back(std::make_unique<ExprNode>(termcalc::parse(e, ctx)));
    return out;
}

TEST(MathContext, Operations) {
    MathContext ctx;
    EXPECT_TRUE(ctx.is_operation("%"));
    EXPECT_FALSE(ctx.is_operation("&"));
    EXPECT_EQ(ctx.operation_kind("^"), OperationType::Pow);
    EXPECT_EQ(ctx.operation_precedence("="), 1u);
    EXPECT_EQ(ctx.operation_precedence("-"), 2u);
    EXPECT_EQ(ctx.operation_precedence("%"), 3u);
    EXPECT_EQ(ctx.operation_precedence("^"), 4u);

    EXPECT_TRUE(ctx.is_unary_operation("+"));
    EXPECT_TRUE(ctx.is_unary_operation("-"));
    EXPECT_FALSE(ctx.is_unary_operation("*"));
    EXPECT_FALSE(ctx.is_unary_operation("="));
}

TEST(MathContext, BuiltInTables) {
    MathContext ctx;
    EXPECT_EQ(ctx.function_arity("pow"), 2u);
    EXPECT_EQ(ctx.function_arity("sin"), 1u);
    EXPECT_EQ(ctx.function_kind("acos"), ctx.function_kind("arccos"));
    EXPECT_FALSE(ctx.function_arity("nope").has_value());

    ASSERT_TRUE(ctx.constant_value("i").has_value());
    EXPECT_TRUE(ctx.constant_value("i")->is_complex());
    EXPECT_DOUBLE_EQ(ctx.constant_value("pi")->re(), 3.14159265358979323846);

    EXPECT_TRUE(ctx.is_number_symbol('7'));
    EXPECT_TRUE(ctx.is_literal_symbol('_'));
    EXPECT_FALSE(ctx.is_literal_symbol('7'));
    EXPECT_TRUE(ctx.is_punctuation_symbol(','));
    EXPECT_TRUE(ctx.is_valid_name("x2"));
    EXPECT_FALSE(ctx.is_valid_name("2x"));
}

TEST(MathContext, ConstantAndFunctionNamesAreExclusive) {
    MathContext ctx;
    ctx.add_user_constant("g", MathResult::real(4.0));
    EXPECT_TRUE(ctx.is_user_constant("g"));
    EXPECT_TRUE(ctx.is_constant("g"));

    define(ctx, "g(x) = x + 1");
    EXPECT_TRUE(ctx.is_user_function("g"));
    EXPECT_FALSE(ctx.is_user_constant("g"));
    EXPECT_EQ(ctx.function_arity("g"), 1u);

    ctx.add_user_constant("g", MathResult::real(1.0));
    EXPECT_FALSE(ctx.is_user_function("g"));

    EXPECT_TRUE(ctx.remove_user_constant("g"));
    EXPECT_FALSE(ctx.remove_user_constant("g"));
    EXPECT_FALSE(ctx.is_constant("g"));
}

TEST(MathContext, SubstituteReplacesParametersOnACopy) {
    MathContext ctx;
    define(ctx, "f(x, y) = x*y + x");

    auto tree = ctx.substitute_user_function_tree("f", args_of(ctx, {"2+3", "pi"}));
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(termcalc::to_string(*tree), "(+ (* (+ 2 3) pi) (+ 2 3))");

    // stored definition untouched
    EXPECT_EQ(termcalc::to_string(ctx.user_function("f")->body), "(+ (* x y) x)");
}

TEST(MathContext, SubstitutedArgumentsAreNotRewritten) {
    MathContext ctx;
    ctx.add_user_constant("y", MathResult::real(7.0));
    define(ctx, "f(x, y) = x + y");

    // the argument "y" lands where x was and must stay "y"
    auto tree = ctx.substitute_user_function_tree("f", args_of(ctx, {"y", "1"}));
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(termcalc::to_string(*tree), "(+ y 1)");
}

TEST(MathContext, SubstituteFailures) {
    MathContext ctx;
    define(ctx, "f(x) = x^2");
    EXPECT_FALSE(ctx.substitute_user_function_tree("f", args_of(ctx, {"1", "2"})).has_value());
    EXPECT_FALSE(ctx.substitute_user_function_tree("g", args_of(ctx, {"1"})).has_value());
}

} // namespace
