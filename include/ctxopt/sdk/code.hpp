#pragma once

#include <string>
#include <string_view>

#include "ctxopt/ast/language.hpp"
#include "ctxopt/core/error.hpp"
#include "ctxopt/sdk/types.hpp"

namespace ctxopt::sdk {

/// Parses a language name for the code helpers. Fails with Unsupported for
/// anything outside typescript, javascript, python, go, rust, php and swift.
auto parseable_language(std::string_view name) -> Result<ast::Language>;

/// FileStructure of `content` as JSON.
auto code_parse(std::string_view content, std::string_view language) -> Result<json>;

/// Source of the element `{type, name}`, or null when there is none.
auto code_extract(std::string_view content, std::string_view language,
                  std::string_view type, std::string_view name) -> Result<json>;

/// Signatures-only outline of `content`.
auto code_skeleton(std::string_view content, std::string_view language) -> Result<std::string>;

} // namespace ctxopt::sdk
