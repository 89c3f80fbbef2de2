#include "termcalc/math_result.hpp"

#include <cmath>

namespace termcalc {

static constexpr double kHalfPi = 1.57079632679489661923;

static NumberType result_type(const MathResult& a, const MathResult& b) {
    return (a.is_complex() || b.is_complex()) ? NumberType::Complex : NumberType::Real;
}

bool MathResult::is_nan() const noexcept {
    return std::isnan(value.real()) || std::isnan(value.imag());
}

// Two reals are combined with real arithmetic (1/0 is inf, not a complex NaN).
template <class Op>
static MathResult binop(const MathResult& a, const MathResult& b, Op op) {
    if (a.is_real() && b.is_real()) return MathResult::real(op(a.re(), b.re()));
    return {result_type(a, b), op(a.value, b.value)};
}

MathResult operator+(const MathResult& a, const MathResult& b){ return binop(a, b, [](auto x, auto y){ return x + y; }); }
MathResult operator-(const MathResult& a, const MathResult& b){ return binop(a, b, [](auto x, auto y){ return x - y; }); }
MathResult operator*(const MathResult& a, const MathResult& b){ return binop(a, b, [](auto x, auto y){ return x * y; }); }
MathResult operator/(const MathResult& a, const MathResult& b){ return binop(a, b, [](auto x, auto y){ return x / y; }); }

MathResult operator-(const MathResult& a) {
    // negating a real must not produce a -0 imaginary part
    if (a.is_real()) return MathResult::real(-a.re());
    return MathResult::complex(-a.value);
}

MathResult pow(const MathResult& base, const MathResult& exponent) {
    if (base.is_real() && exponent.is_real())
        return MathResult::real(std::pow(base.re(), exponent.re()));

    // (a+bi)^(c+di) = exp(ln(a+bi) * (c+di))
    if (base.value == std::complex<double>{}) {
        if (exponent.re() > 0.0) return MathResult::complex(0.0, 0.0);
        return MathResult::undefined();
    }
    return MathResult::complex(std::exp(std::log(base.value) * exponent.value));
}

MathResult mod(const MathResult& a, const MathResult& b) {
    if (a.is_complex() || b.is_complex()) return MathResult::undefined();

    const double x = a.re();
    const double y = b.re();
    if (std::trunc(x) != x || std::trunc(y) != y || y == 0.0) return MathResult::undefined();
    return MathResult::real(std::fmod(x, y));
}

namespace fn {

using cplx = std::complex<double>;

// A real argument enters the complex functions with a +0 imaginary part so
// that the principal branch is taken.
static cplx as_complex(const MathResult& x) {
    return x.is_real() ? cplx(x.re(), 0.0) : x.value;
}

// Real arguments are computed with the real functions so that no rounding
// noise leaks into the imaginary part.
template <class RealFn, class ComplexFn>
static MathResult preserving(const MathResult& x, RealFn f, ComplexFn g) {
    if (x.is_real()) return MathResult::real(f(x.re()));
    return MathResult::complex(g(x.value));
}

MathResult cos(const MathResult& x){ return preserving(x, [](double r){ return std::cos(r); }, [](cplx z){ return std::cos(z); }); }
MathResult sin(const MathResult& x){ return preserving(x, [](double r){ return std::sin(r); }, [](cplx z){ return std::sin(z); }); }
MathResult tan(const MathResult& x){ return preserving(x, [](double r){ return std::tan(r); }, [](cplx z){ return std::tan(z); }); }
MathResult cot(const MathResult& x){
    return preserving(x, [](double r){ return std::cos(r) / std::sin(r); }, [](cplx z){ return std::cos(z) / std::sin(z); });
}

MathResult cosh(const MathResult& x){ return preserving(x, [](double r){ return std::cosh(r); }, [](cplx z){ return std::cosh(z); }); }
MathResult sinh(const MathResult& x){ return preserving(x, [](double r){ return std::sinh(r); }, [](cplx z){ return std::sinh(z); }); }
MathResult tanh(const MathResult& x){ return preserving(x, [](double r){ return std::tanh(r); }, [](cplx z){ return std::tanh(z); }); }
MathResult coth(const MathResult& x){
    return preserving(x, [](double r){ return std::cosh(r) / std::sinh(r); }, [](cplx z){ return std::cosh(z) / std::sinh(z); });
}

MathResult arctan(const MathResult& x){ return preserving(x, [](double r){ return std::atan(r); }, [](cplx z){ return std::atan(z); }); }
MathResult arccot(const MathResult& x){
    return preserving(x, [](double r){ return kHalfPi - std::atan(r); }, [](cplx z){ return kHalfPi - std::atan(z); });
}
MathResult arcsinh(const MathResult& x){ return preserving(x, [](double r){ return std::asinh(r); }, [](cplx z){ return std::asinh(z); }); }
MathResult exp(const MathResult& x){ return preserving(x, [](double r){ return std::exp(r); }, [](cplx z){ return std::exp(z); }); }

// The remaining functions have a restricted real domain; a real argument
// outside of it yields a complex result.
MathResult arccos(const MathResult& x) {
    if (x.is_real() && !(x.re() < -1.0 || x.re() > 1.0)) return MathResult::real(std::acos(x.re()));
    return MathResult::complex(std::acos(as_complex(x)));
}

MathResult arcsin(const MathResult& x) {
    if (x.is_real() && !(x.re() < -1.0 || x.re() > 1.0)) return MathResult::real(std::asin(x.re()));
    return MathResult::complex(std::asin(as_complex(x)));
}

MathResult arccosh(const MathResult& x) {
    if (x.is_real() && !(x.re() < 1.0)) return MathResult::real(std::acosh(x.re()));
    return MathResult::complex(std::acosh(as_complex(x)));
}

MathResult arctanh(const MathResult& x) {
    if (x.is_real() && !(x.re() < -1.0 || x.re() > 1.0)) return MathResult::real(std::atanh(x.re()));
    return MathResult::complex(std::atanh(as_complex(x)));
}

MathResult arccoth(const MathResult& x) {
    // arccoth(x) = arctanh(1/x), real for |x| >= 1
    if (x.is_real()) {
        const double inv = 1.0 / x.re();
        if (!(x.re() > -1.0 && x.re() < 1.0)) return MathResult::real(std::atanh(inv));
        return MathResult::complex(std::atanh(cplx(inv, 0.0)));
    }
    return MathResult::complex(std::atanh(1.0 / x.value));
}

MathResult ln(const MathResult& x) {
    if (x.is_real() && !(x.re() < 0.0)) return MathResult::real(std::log(x.re()));
    return MathResult::complex(std::log(as_complex(x)));
}

MathResult sqrt(const MathResult& x) {
    if (x.is_real() && !(x.re() < 0.0)) return MathResult::real(std::sqrt(x.re()));
    return MathResult::complex(std::sqrt(as_complex(x)));
}

MathResult re(const MathResult& x) { return MathResult::real(x.re()); }
MathResult im(const MathResult& x) { return MathResult::real(x.im()); }

MathResult root(const MathResult& x, const MathResult& n) {
    return termcalc::pow(x, MathResult::real(1.0) / n);
}

} // namespace fn

} // namespace termcalc
