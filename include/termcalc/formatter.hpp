#pragma once
#include <optional>
#include <string>
#include <string_view>

#include "termcalc/math_result.hpp"

namespace termcalc {

enum class Radix {
    Decimal,
    Binary,
    Octal,
    Hex,
    Exponential,
};

struct FormatOptions {
    Radix radix{Radix::Decimal};
    int precision{10}; // significant digits (decimal), fractional digits otherwise
};

/// Renders x in the requested radix. Binary, octal and hex values carry a
/// 0b, 0o or 0x prefix. NaN and infinities always render as NaN, inf, -inf.
std::string format_real(double x, const FormatOptions& opts);

/// Real results as a number, complex ones as "a+bi" or "a-bi".
std::string format_result(const MathResult& r, const FormatOptions& opts);

/// "dec", "bin", "oct", "hex" or "exp".
std::optional<Radix> radix_from_string(std::string_view s);
const char* radix_name(Radix r);

} // namespace termcalc
