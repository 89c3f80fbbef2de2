#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

#include "termcalc/math_context.hpp"

namespace termcalc {

struct SerializationError : std::runtime_error { using std::runtime_error::runtime_error; };

/// JSON document holding the user constants and user functions of context:
///
///   { "constants": { "c": { "type": "Real", "re": 5.0, "im": 0.0 } },
///     "functions": { "f": { "definition": "f(x) = x^2", "args": ["x"] } } }
///
/// Built-in tables are never written.
std::string to_json(const MathContext& context);

/// Fresh context with the user tables of a document written by to_json().
/// Function definitions are parsed again in the new context.
/// Throws SerializationError.
MathContext context_from_json(std::string_view json);

void save_context(const MathContext& context, const std::string& path);
MathContext load_context(const std::string& path);

} // namespace termcalc
