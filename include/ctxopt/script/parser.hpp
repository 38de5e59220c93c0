#pragma once

#include <memory>
#include <string_view>

#include "ctxopt/core/error.hpp"
#include "ctxopt/script/ast.hpp"

namespace ctxopt::script {

/// Parses a script whose top level behaves like the body of an async
/// function: `await` is accepted anywhere and a top-level `return` ends the
/// run with its value.
///
/// Unsupported constructs (classes, `new`, regex literals, generators,
/// labels, `switch`, modules) fail here rather than at run time. Errors are
/// ErrorCode::ParseError with a "SyntaxError: ... (line N)" message.
auto parse_program(std::string_view source) -> Result<std::unique_ptr<Program>>;

} // namespace ctxopt::script
