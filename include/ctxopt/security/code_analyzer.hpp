#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ctxopt::security {

/// Outcome of the static denylist scan run before any script executes.
struct SecurityVerdict {
    bool safe = true;
    std::vector<std::string> blocked_patterns;  // one human-readable reason per match
    std::vector<std::string> warnings;          // reported, never blocking
};

/// Scans script source text for denylisted constructs.
///
/// Every matching rule contributes its reason to `blocked_patterns`, in rule
/// order, so callers can report all of them at once. Warning rules (obvious
/// unbounded loops, huge string repeats) do not affect `safe`; the executor's
/// wall-clock timeout is the backstop for those. Deterministic and free of I/O.
///
/// This is a fast-reject layer in front of the restricted interpreter, not
/// the isolation boundary itself.
[[nodiscard]] auto analyze_code(std::string_view code) -> SecurityVerdict;

} // namespace ctxopt::security
