#include "ctxopt/security/path_validator.hpp"

#include <regex>
#include <vector>

#include "ctxopt/core/logger.hpp"

namespace ctxopt::security {

namespace fs = std::filesystem;

namespace {

auto sensitive_patterns() -> const std::vector<std::regex>& {
    static const std::vector<std::regex> patterns = [] {
        constexpr auto flags = std::regex::ECMAScript | std::regex::icase;
        return std::vector<std::regex>{
            std::regex(R"(\.env($|\.))", flags),   // environment files
            std::regex(R"(\.pem$)", flags),
            std::regex(R"(\.key$)", flags),
            std::regex(R"(id_rsa)", flags),
            std::regex(R"(id_ed25519)", flags),
            std::regex(R"(credentials)", flags),
            std::regex(R"(secret\.)", flags),
            std::regex(R"(secrets.*\.)", flags),
            std::regex(R"(\.keystore$)", flags),
            std::regex(R"(\.jks$)", flags),
            std::regex(R"(password)", flags),
            std::regex(R"(^\.htpasswd$)", flags),
            std::regex(R"(^\.netrc$)", flags),
            std::regex(R"(^\.npmrc$)", flags),
            std::regex(R"(^\.pypirc$)", flags),
        };
    }();
    return patterns;
}

/// Lexically normalised absolute path with no trailing separator.
auto normalize(const fs::path& p) -> std::string {
    auto s = p.lexically_normal().generic_string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

auto absolute_working_dir(const fs::path& working_dir) -> std::string {
    if (working_dir.is_absolute()) return normalize(working_dir);
    std::error_code ec;
    auto abs = fs::absolute(working_dir, ec);
    return normalize(ec ? working_dir : abs);
}

auto is_within(std::string_view candidate, std::string_view root) -> bool {
    if (candidate == root) return true;
    if (root == "/") return candidate.starts_with("/");
    return candidate.size() > root.size() && candidate.starts_with(root) &&
           candidate[root.size()] == '/';
}

auto rejected(std::string message) -> PathValidation {
    return PathValidation{false, std::nullopt, std::move(message)};
}

} // anonymous namespace

auto normalize_at_prefix(std::string_view path) -> std::string {
    if (path.starts_with("@")) {
        return std::string(path.substr(1));
    }
    return std::string(path);
}

auto is_sensitive_name(std::string_view component) -> bool {
    if (component.empty()) return false;
    const std::string name(component);
    for (const auto& pattern : sensitive_patterns()) {
        if (std::regex_search(name, pattern)) return true;
    }
    return false;
}

auto is_sensitive_path(std::string_view path) -> bool {
    std::size_t start = 0;
    while (start <= path.size()) {
        auto slash = path.find('/', start);
        auto end = slash == std::string_view::npos ? path.size() : slash;
        if (is_sensitive_name(path.substr(start, end - start))) return true;
        if (slash == std::string_view::npos) break;
        start = slash + 1;
    }
    return false;
}

auto validate_path(std::string_view path, const fs::path& working_dir) -> PathValidation {
    auto stripped = normalize_at_prefix(path);
    if (stripped.empty()) {
        return rejected("Path must not be empty");
    }
    if (stripped.find('\0') != std::string::npos) {
        return rejected("Invalid path: contains NUL byte");
    }

    const auto root = absolute_working_dir(working_dir);
    fs::path input(stripped);
    const auto resolved = normalize(input.is_absolute() ? input : fs::path(root) / input);

    if (!is_within(resolved, root)) {
        LOG_DEBUG("Path rejected: outside working directory");
        return rejected("Path must be within working directory");
    }

    // Check every component below the working directory, not only the leaf,
    // so "secrets.d/config.json" and ".env.local/x" are refused too.
    auto relative = fs::path(resolved).lexically_relative(root);
    for (const auto& part : relative) {
        auto name = part.string();
        if (name.empty() || name == ".") continue;
        if (is_sensitive_name(name)) {
            LOG_DEBUG("Path rejected: sensitive name '{}'", name);
            return rejected("Access to " + name + " is blocked for security");
        }
    }

    return PathValidation{true, resolved, std::nullopt};
}

auto validate_glob_pattern(std::string_view pattern, const fs::path& working_dir)
    -> PathValidation {
    auto stripped = normalize_at_prefix(pattern);
    if (stripped.find_first_not_of(" \t\r\n") == std::string::npos) {
        return rejected("Glob pattern must not be empty");
    }

    static const std::regex drive_root(R"(^[A-Za-z]:)");
    if (stripped.starts_with("/") || stripped.starts_with("\\") || stripped.starts_with("~") ||
        std::regex_search(stripped, drive_root)) {
        return rejected("Glob pattern must be relative to working directory");
    }

    std::size_t start = 0;
    while (start <= stripped.size()) {
        auto slash = stripped.find_first_of("/\\", start);
        auto segment = stripped.substr(start, slash == std::string::npos ? std::string::npos
                                                                         : slash - start);
        if (segment == "..") {
            return rejected("Glob pattern cannot contain path traversal (..)");
        }
        if (is_sensitive_name(segment)) {
            return rejected("Glob pattern matches blocked file types");
        }
        if (slash == std::string::npos) break;
        start = slash + 1;
    }

    auto root = absolute_working_dir(working_dir);
    return PathValidation{true, root == "/" ? "/" + stripped : root + "/" + stripped,
                          std::nullopt};
}

auto resolve_physical_path(const fs::path& resolved, const fs::path& working_dir)
    -> ctxopt::Result<fs::path> {
    std::error_code ec;
    auto real_root = fs::canonical(working_dir, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Working directory is not accessible", ec.message()));
    }

    // Canonicalise through the nearest existing ancestor so a symlinked
    // parent with a missing leaf cannot slip past the containment check.
    auto current = resolved;
    auto leaf = fs::path{};
    while (!current.empty() && current != current.root_path() && !fs::exists(current, ec)) {
        leaf = leaf.empty() ? current.filename() : current.filename() / leaf;
        current = current.parent_path();
    }

    auto real_ancestor = fs::canonical(current.empty() ? fs::path("/") : current, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to resolve path", ec.message()));
    }

    auto real = leaf.empty() ? real_ancestor : (real_ancestor / leaf).lexically_normal();
    if (!is_within(normalize(real), normalize(real_root))) {
        LOG_WARN("Path rejected: symlink escapes working directory");
        return std::unexpected(make_error(ErrorCode::PathRejected,
            "Symlink escapes working directory"));
    }

    return real;
}

} // namespace ctxopt::security
