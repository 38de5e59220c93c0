#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace ctxopt::sdk {

/// Expands `{a,b}` alternatives, including nested ones, into plain patterns.
/// "src/**/*.{ts,js}" becomes {"src/**/*.ts", "src/**/*.js"}.
auto expand_braces(std::string_view pattern) -> std::vector<std::string>;

/// Compiled glob over '/'-separated relative paths.
///
/// `*` matches within one segment, `**` across segments (`**/` also matches
/// zero directories), `?` one non-separator character and `[...]` a
/// character class. Braces are expanded first.
class GlobMatcher {
public:
    explicit GlobMatcher(std::string_view pattern);

    [[nodiscard]] auto matches(std::string_view relative_path) const -> bool;

    /// True when the pattern names hidden entries explicitly (".github/**",
    /// "**/.eslintrc*"); walks skip dot entries otherwise.
    [[nodiscard]] auto includes_hidden() const -> bool { return includes_hidden_; }

    /// Literal directory prefix shared by every alternative ("src/lib" for
    /// "src/lib/**/*.ts"); empty when the pattern starts with a wildcard.
    [[nodiscard]] auto base_dir() const -> const std::string& { return base_dir_; }

private:
    std::vector<std::regex> alternatives_;
    bool includes_hidden_ = false;
    std::string base_dir_;
};

/// Translates one brace-free glob into an ECMAScript regex source.
auto glob_to_regex(std::string_view pattern) -> std::string;

} // namespace ctxopt::sdk
