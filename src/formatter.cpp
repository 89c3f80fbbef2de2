#include "termcalc/formatter.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace termcalc {

static const char kDigits[] = "0123456789abcdef";

// abs(x) in base 2, 8 or 16 with at most `precision` fractional digits
static std::string format_radix(double x, int base, int precision) {
    double ip = std::floor(x);
    double fp = x - ip;

    std::string int_part;
    do {
        int_part += kDigits[static_cast<int>(std::fmod(ip, base))];
        ip = std::floor(ip / base);
    } while (ip >= 1.0);
    std::reverse(int_part.begin(), int_part.end());

    std::string frac_part;
    for (int n = 0; n < precision && fp != 0.0; ++n) {
        fp *= base;
        const double d = std::floor(fp);
        frac_part += kDigits[static_cast<int>(d)];
        fp -= d;
    }
    while (!frac_part.empty() && frac_part.back() == '0') frac_part.pop_back();

    return frac_part.empty() ? int_part : int_part + "." + frac_part;
}

std::string format_real(double x, const FormatOptions& opts) {
    if (std::isnan(x)) return "NaN";
    if (std::isinf(x)) return x < 0 ? "-inf" : "inf";
    if (x == 0.0) x = 0.0; // no "-0"

    std::ostringstream os;
    switch (opts.radix) {
        case Radix::Decimal:
            os << std::setprecision(opts.precision) << x;
            return os.str();
        case Radix::Exponential:
            os << std::scientific << std::setprecision(opts.precision) << x;
            return os.str();
        case Radix::Binary:
            return (x < 0 ? "-0b" : "0b") + format_radix(std::fabs(x), 2, opts.precision);
        case Radix::Octal:
            return (x < 0 ? "-0o" : "0o") + format_radix(std::fabs(x), 8, opts.precision);
        case Radix::Hex:
            return (x < 0 ? "-0x" : "0x") + format_radix(std::fabs(x), 16, opts.precision);
    }
    return os.str();
}

std::string format_result(const MathResult& r, const FormatOptions& opts) {
    if (r.is_real()) return format_real(r.re(), opts);
    if (r.is_nan()) return "NaN";

    const double im = r.im();
    return format_real(r.re(), opts) + (std::signbit(im) ? "-" : "+") + format_real(std::fabs(im), opts) + "i";
}

std::optional<Radix> radix_from_string(std::string_view s) {
    if (s == "dec") return Radix::Decimal;
    if (s == "bin") return Radix::Binary;
    if (s == "oct") return Radix::Octal;
    if (s == "hex") return Radix::Hex;
    if (s == "exp") return Radix::Exponential;
    return std::nullopt;
}

const char* radix_name(Radix r) {
    switch (r) {
        case Radix::Decimal:     return "dec";
        case Radix::Binary:      return "bin";
        case Radix::Octal:       return "oct";
        case Radix::Hex:         return "hex";
        case Radix::Exponential: return "exp";
    }
    return "dec";
}

} // namespace termcalc
