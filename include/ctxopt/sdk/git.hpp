#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ctxopt/core/error.hpp"
#include "ctxopt/sdk/host.hpp"
#include "ctxopt/sdk/types.hpp"

namespace ctxopt::sdk {

inline constexpr std::chrono::milliseconds kGitTimeout{5000};
inline constexpr int kDefaultLogLimit = 10;
inline constexpr int kMaxLogLimit = 100;
/// Combined stdout and stderr a git child may produce before it is killed.
inline constexpr std::size_t kMaxGitOutput = 16 * 1024 * 1024;

/// True for the read-only subcommands the SDK itself issues (diff, log,
/// blame, status, branch, rev-parse). Everything else, in particular push,
/// fetch, pull, clone, remote and submodule, is refused.
[[nodiscard]] auto is_allowed_git_subcommand(std::string_view subcommand) -> bool;

/// Accepts a revision such as "HEAD~2", "main..feature" or a commit hash.
/// Refuses option-like values and shell metacharacters.
auto validate_git_ref(std::string_view ref) -> Result<void>;

/// Runs `git <args>` in the working directory without a shell and returns
/// stdout with trailing newlines removed.
///
/// The subcommand is checked before anything is spawned. Pager, fsmonitor
/// and external diff drivers are disabled through `-c` options. The child is
/// killed when `timeout` elapses (SubprocessError) or the execution is
/// cancelled (Timeout). A non-zero exit is a SubprocessError carrying the
/// first line of stderr.
auto run_git(const Host& host, const std::vector<std::string>& args,
             std::chrono::milliseconds timeout = kGitTimeout) -> Result<std::string>;

/// `{ raw, files: [{ file, status, additions, deletions }], stats: { additions, deletions } }`
///
/// Limited to the working directory, with paths relative to it. Files with
/// sensitive names are excluded through pathspecs and never appear in `raw`
/// or `files`.
auto git_diff(const Host& host, std::optional<std::string> ref = std::nullopt) -> Result<json>;

/// `[{ hash, shortHash, author, date, message }]`, newest first. `limit`
/// defaults to 10 and is capped at 100.
auto git_log(const Host& host, std::optional<int> limit = std::nullopt) -> Result<json>;

/// `{ lines: [{ hash, author, date, line, content }] }`
auto git_blame(const Host& host, std::string_view file, std::optional<int> line = std::nullopt)
    -> Result<json>;

/// `{ branch, ahead, behind, staged, modified, untracked }`. Sensitive file
/// names are left out of the lists.
auto git_status(const Host& host) -> Result<json>;

/// `{ current, branches }`
auto git_branch(const Host& host) -> Result<json>;

// -- Output parsers, exposed for tests. --

/// Pathspecs passed after `--` to diff: the working directory itself, minus
/// every sensitive file name at any depth.
auto diff_pathspecs() -> std::vector<std::string>;

/// Removes the per-file sections of a unified diff whose old or new path
/// contains a sensitive name.
auto drop_sensitive_sections(std::string_view raw) -> std::string;

/// Combines `diff --numstat` and `diff --name-status` output.
auto parse_diff_files(std::string_view numstat, std::string_view name_status) -> json;

/// Parses log output written with kLogFormat.
auto parse_log(std::string_view output) -> json;

/// Parses `blame --porcelain` output.
auto parse_blame(std::string_view porcelain) -> json;

/// Parses `status --porcelain -b` output.
auto parse_status(std::string_view porcelain) -> json;

/// Unit and record separated commit fields: hash, short hash, author,
/// ISO date, subject.
inline constexpr std::string_view kLogFormat = "--format=%H%x1f%h%x1f%an%x1f%aI%x1f%s%x1e";

} // namespace ctxopt::sdk
