#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "ctxopt/core/error.hpp"

namespace ctxopt::security {

/// Result of a path or glob check. On success `resolved_path` holds the
/// absolute, lexically normalised path; on failure `error` holds a message
/// that does not contain any host path.
struct PathValidation {
    bool safe = false;
    std::optional<std::string> resolved_path;
    std::optional<std::string> error;
};

/// Strips a single leading '@' workspace marker (e.g. "@src/index.ts").
auto normalize_at_prefix(std::string_view path) -> std::string;

/// True when a single path component names a credential-like file:
/// .env files, private keys, keystores, credential/secret/password files
/// and package-manager auth files. Case-insensitive.
[[nodiscard]] auto is_sensitive_name(std::string_view component) -> bool;

/// True when any '/'-separated component of `path` is a sensitive name.
[[nodiscard]] auto is_sensitive_path(std::string_view path) -> bool;

/// Decides whether `path` may be touched from inside `working_dir`.
///
/// Pure and lexical: the path is resolved against `working_dir`, both sides
/// are normalised, and the result must equal `working_dir` or lie strictly
/// below it. Every component below `working_dir` is checked against the
/// sensitive-name set. Idempotent: validating a returned `resolved_path`
/// yields the same result.
[[nodiscard]] auto validate_path(std::string_view path,
                                 const std::filesystem::path& working_dir) -> PathValidation;

/// Checks a glob pattern before any directory walk. Rejects empty patterns,
/// `..` segments, absolute roots (`/`, `~`, drive letters) and literal
/// segments that name sensitive files.
[[nodiscard]] auto validate_glob_pattern(std::string_view pattern,
                                         const std::filesystem::path& working_dir)
    -> PathValidation;

/// Physical containment check for an already validated path. Resolves
/// symlinks through the nearest existing ancestor and fails with
/// PathRejected when the real location leaves the real working directory.
auto resolve_physical_path(const std::filesystem::path& resolved,
                           const std::filesystem::path& working_dir)
    -> ctxopt::Result<std::filesystem::path>;

} // namespace ctxopt::security
