#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ctxopt/script/interpreter.hpp"
#include "ctxopt/script/value.hpp"

namespace ctxopt::script {

/// Installs the global builtins and the string, array, number and object
/// methods into `interp`. Namespace objects (Math, JSON, ...) are frozen.
///
/// Globals: Math, JSON, Object, Array, String, Number, Boolean, parseInt,
/// parseFloat, isNaN, isFinite, Error, TypeError, RangeError, SyntaxError,
/// ReferenceError, Promise, console (no-op), Date.now.
void install_builtins(Interpreter& interp);

void install_string_methods(Interpreter& interp);
void install_array_methods(Interpreter& interp);
void install_number_methods(Interpreter& interp);

/// `args[i]`, or undefined when the caller passed fewer arguments.
inline auto arg(const std::vector<Value>& args, std::size_t i) -> Value {
    return i < args.size() ? args[i] : Value{};
}

/// Adds a native function member to a namespace object.
void add_function(Interpreter& interp, Object* target, const std::string& name, NativeFn fn);

/// Parses a leading integer the way parseInt does; NaN when no digit matches.
auto parse_int(std::string_view text, int radix) -> double;

/// Parses a leading decimal literal the way parseFloat does.
auto parse_float(std::string_view text) -> double;

} // namespace ctxopt::script
