#pragma once

#include <optional>
#include <string_view>

#include "termcalc/math_context.hpp"
#include "termcalc/math_result.hpp"
#include "termcalc/tokenizer.hpp"

namespace termcalc {

/// Parse + evaluate one line of input against context.
///
/// An expression returns its value, which is also stored as the user
/// constant "ans". A definition ("c = 2*pi", "f(x, y) = x^y") is applied to
/// the context and returns nullopt.
/// Throws ParseError on malformed input; the context is left untouched then.
std::optional<MathResult> evaluate_input(std::string_view input, MathContext& context);

} // namespace termcalc
