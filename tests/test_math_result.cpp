#include <gtest/gtest.h>
#include <termcalc/math_result.hpp>

#include <cmath>

namespace {

using termcalc::MathResult;
namespace fn = termcalc::fn;

TEST(MathResult, ComplexOperandPromotes) {
    auto r = MathResult::real(2.0) * MathResult::complex(0.0, 1.0);
    EXPECT_TRUE(r.is_complex());
    EXPECT_DOUBLE_EQ(r.im(), 2.0);

    auto s = MathResult::real(2.0) + MathResult::real(3.0);
    EXPECT_TRUE(s.is_real());
    EXPECT_DOUBLE_EQ(s.re(), 5.0);
}

TEST(MathResult, Pow) {
    EXPECT_DOUBLE_EQ(termcalc::pow(MathResult::real(5.0), MathResult::real(-2.0)).re(), 0.04);
    EXPECT_TRUE(termcalc::pow(MathResult::real(-8.0), MathResult::real(1.0 / 3.0)).is_nan());

    auto i2 = termcalc::pow(MathResult::complex(0.0, 1.0), MathResult::real(2.0));
    EXPECT_TRUE(i2.is_complex());
    EXPECT_NEAR(i2.re(), -1.0, 1e-12);
    EXPECT_NEAR(i2.im(), 0.0, 1e-12);

    EXPECT_DOUBLE_EQ(termcalc::pow(MathResult::complex(0.0, 0.0), MathResult::real(2.0)).re(), 0.0);
    EXPECT_TRUE(termcalc::pow(MathResult::complex(0.0, 0.0), MathResult::real(-1.0)).is_nan());
}

TEST(MathResult, Mod) {
    EXPECT_DOUBLE_EQ(termcalc::mod(MathResult::real(7.0), MathResult::real(3.0)).re(), 1.0);
    EXPECT_DOUBLE_EQ(termcalc::mod(MathResult::real(-7.0), MathResult::real(3.0)).re(), -1.0);
    EXPECT_TRUE(termcalc::mod(MathResult::real(7.5), MathResult::real(2.0)).is_nan());
    EXPECT_TRUE(termcalc::mod(MathResult::real(7.0), MathResult::real(0.0)).is_nan());
    EXPECT_TRUE(termcalc::mod(MathResult::complex(7.0, 1.0), MathResult::real(2.0)).is_nan());
}

TEST(MathResult, DomainPromotion) {
    EXPECT_TRUE(fn::sqrt(MathResult::real(-1.0)).is_complex());
    EXPECT_TRUE(fn::sqrt(MathResult::real(4.0)).is_real());
    EXPECT_TRUE(fn::ln(MathResult::real(-1.0)).is_complex());
    EXPECT_TRUE(fn::ln(MathResult::real(2.0)).is_real());

    EXPECT_TRUE(fn::arccos(MathResult::real(2.0)).is_complex());
    EXPECT_TRUE(fn::arcsin(MathResult::real(-1.0)).is_real());
    EXPECT_TRUE(fn::arccosh(MathResult::real(0.5)).is_complex());
    EXPECT_TRUE(fn::arccosh(MathResult::real(1.0)).is_real());
    EXPECT_TRUE(fn::arctanh(MathResult::real(2.0)).is_complex());
    EXPECT_TRUE(fn::arctanh(MathResult::real(0.5)).is_real());
    EXPECT_TRUE(fn::arccoth(MathResult::real(0.5)).is_complex());
    EXPECT_TRUE(fn::arccoth(MathResult::real(2.0)).is_real());
}

TEST(MathResult, PartsAreAlwaysReal) {
    auto z = MathResult::complex(3.0, -4.0);
    EXPECT_TRUE(fn::re(z).is_real());
    EXPECT_DOUBLE_EQ(fn::re(z).re(), 3.0);
    EXPECT_DOUBLE_EQ(fn::im(z).re(), -4.0);
}

TEST(MathResult, HyperbolicInverses) {
    EXPECT_NEAR(fn::coth(MathResult::real(0.887)).re(), 1.408631623, 1e-9);
    EXPECT_NEAR(fn::arccoth(MathResult::real(-1.7)).re(), -0.674963358, 1e-9);
    EXPECT_NEAR(fn::arccot(MathResult::real(1.0)).re(), std::atan(1.0), 1e-12);
}

TEST(MathResult, NegatedRealTakesPrincipalBranch) {
    auto m = -MathResult::real(1.0);
    EXPECT_TRUE(m.is_real());
    EXPECT_FALSE(std::signbit(m.im()));

    EXPECT_DOUBLE_EQ(fn::sqrt(m).im(), 1.0);
    EXPECT_NEAR(fn::ln(m).im(), std::acos(-1.0), 1e-12);

    auto a = fn::arccos(-MathResult::real(2.0));
    auto b = fn::arccos(MathResult::real(0.0) - MathResult::real(2.0));
    EXPECT_DOUBLE_EQ(a.re(), b.re());
    EXPECT_DOUBLE_EQ(a.im(), b.im());

    EXPECT_DOUBLE_EQ(fn::arccoth(MathResult::real(0.5)).im(), fn::arctanh(MathResult::real(2.0)).im());
}

} // namespace
