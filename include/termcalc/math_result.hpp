#pragma once

#include <complex>
#include <limits>

namespace termcalc {

/// Number sets a literal or a result can belong to.
enum class NumberType {
    Real,
    Complex,
};

/// Result of a mathematical expression: a real or a complex number.
/// Real results keep a zero imaginary part; operations promote the tag to
/// Complex as soon as one operand is complex or the real domain is left.
struct MathResult {
    NumberType type{NumberType::Real};
    std::complex<double> value{};

    MathResult() = default;
    MathResult(NumberType t, std::complex<double> v) : type(t), value(v) {}

    static MathResult real(double x) { return {NumberType::Real, {x, 0.0}}; }
    static MathResult complex(std::complex<double> z) { return {NumberType::Complex, z}; }
    static MathResult complex(double re, double im) { return {NumberType::Complex, {re, im}}; }

    /// Outcome of undefined arithmetic.
    static MathResult undefined() { return real(std::numeric_limits<double>::quiet_NaN()); }

    bool is_real() const noexcept { return type == NumberType::Real; }
    bool is_complex() const noexcept { return type == NumberType::Complex; }
    bool is_nan() const noexcept;

    double re() const noexcept { return value.real(); }
    double im() const noexcept { return value.imag(); }
};

// Elementwise complex arithmetic; the result is Complex if either side is.
MathResult operator+(const MathResult& a, const MathResult& b);
MathResult operator-(const MathResult& a, const MathResult& b);
MathResult operator*(const MathResult& a, const MathResult& b);
MathResult operator/(const MathResult& a, const MathResult& b);

// unary
MathResult operator-(const MathResult& a);

/// base^exponent. Real pow for two reals, exp(ln(base) * exponent) otherwise.
MathResult pow(const MathResult& base, const MathResult& exponent);

/// Remainder of two integral real operands; NaN for fractional or complex
/// operands and for a zero divisor.
MathResult mod(const MathResult& a, const MathResult& b);

/// Built-in function semantics. Each one decides on its own whether a real
/// argument leaves the real domain.
namespace fn {

MathResult cos(const MathResult& x);
MathResult sin(const MathResult& x);
MathResult tan(const MathResult& x);
MathResult cot(const MathResult& x);

MathResult cosh(const MathResult& x);
MathResult sinh(const MathResult& x);
MathResult tanh(const MathResult& x);
MathResult coth(const MathResult& x);

MathResult arccos(const MathResult& x);
MathResult arcsin(const MathResult& x);
MathResult arctan(const MathResult& x);
MathResult arccot(const MathResult& x);

MathResult arccosh(const MathResult& x);
MathResult arcsinh(const MathResult& x);
MathResult arctanh(const MathResult& x);
MathResult arccoth(const MathResult& x);

MathResult exp(const MathResult& x);
MathResult ln(const MathResult& x);
MathResult sqrt(const MathResult& x);

MathResult re(const MathResult& x);
MathResult im(const MathResult& x);

MathResult root(const MathResult& x, const MathResult& n);

} // namespace fn

} // namespace termcalc
