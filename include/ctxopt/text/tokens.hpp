#pragma once

#include <cstddef>
#include <string_view>

namespace ctxopt::text {

/// Approximate LLM token count for `text`.
///
/// Word-like runs cost one token per four bytes (rounded up); every other
/// non-whitespace byte costs one token; whitespace is free. Close enough to
/// BPE tokenizers for budgeting, and strictly positive for any text that
/// contains a non-whitespace character.
[[nodiscard]] auto estimate_tokens(std::string_view text) -> std::size_t;

} // namespace ctxopt::text
