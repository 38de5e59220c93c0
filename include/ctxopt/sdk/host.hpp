#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ctxopt/core/cancellation.hpp"
#include "ctxopt/core/error.hpp"

namespace ctxopt::sdk {

/// Files returned by one glob or walk.
inline constexpr std::size_t kMaxFiles = 1000;
/// Matches returned by one search call.
inline constexpr std::size_t kMaxResults = 100;
/// Files above this size are refused by read and skipped by scans.
inline constexpr std::uintmax_t kMaxFileSize = 1024 * 1024;
/// Ceiling for every traversal depth argument.
inline constexpr int kMaxDepth = 5;

/// Default file set for search and analysis helpers.
inline constexpr std::string_view kCodeGlob = "**/*.{ts,tsx,js,jsx,py,go,rs,php,swift}";

/// The only path through which SDK functions touch the filesystem.
///
/// Every entry point validates its argument with the path validator, then
/// checks physical containment, so neither `..` nor a symlink can leave the
/// working directory. Walks skip dot entries (unless the pattern names them),
/// node_modules and symlinked directories, and stop once the execution's
/// cancellation token fires.
class Host {
public:
    /// Takes `bytes` from the execution's memory budget; false when exhausted.
    using MemoryBudget = std::function<bool(std::size_t bytes)>;

    Host(std::filesystem::path working_dir, const CancellationToken& cancel);

    [[nodiscard]] auto working_dir() const -> const std::filesystem::path& { return working_dir_; }
    [[nodiscard]] auto cancellation() const -> const CancellationToken& { return cancel_; }

    /// Validated physical location of `path`. PathRejected on refusal.
    auto resolve(std::string_view path) const -> Result<std::filesystem::path>;

    /// Reads a file of at most kMaxFileSize bytes.
    auto read_file(std::string_view path) const -> Result<std::string>;

    /// Content of a file for a bulk scan: nullopt for files that are too
    /// large, unreadable or refused, so the scan can skip them. Fails only
    /// when the execution has been cancelled.
    auto read_for_scan(std::string_view path) const -> Result<std::optional<std::string>>;

    /// False for missing files and for paths the validator refuses.
    [[nodiscard]] auto exists(std::string_view path) const -> bool;

    /// Working-directory relative paths of regular files matching `pattern`,
    /// sorted, at most `limit` of them. Sensitive files never appear.
    auto glob(std::string_view pattern, std::size_t limit = kMaxFiles) const
        -> Result<std::vector<std::string>>;

    /// Like glob, but matches paths relative to `dir` and returns them that way.
    auto glob_in(std::string_view dir, std::string_view pattern, std::size_t limit = kMaxFiles) const
        -> Result<std::vector<std::string>>;

    /// Working-directory relative spelling of an absolute path ("." for the root).
    [[nodiscard]] auto relative(const std::filesystem::path& absolute) const -> std::string;

    /// Timeout error once the execution deadline has passed.
    auto check_cancelled() const -> Result<void>;

    /// Content the SDK keeps across steps, such as pipeline reads, is charged
    /// here. Without a budget every charge succeeds.
    void set_memory_budget(MemoryBudget budget) { budget_ = std::move(budget); }

    /// MemoryLimit error once the budget refuses `bytes`.
    auto charge(std::size_t bytes) const -> Result<void>;

private:
    std::filesystem::path working_dir_;
    std::filesystem::path real_working_dir_;
    const CancellationToken& cancel_;
    MemoryBudget budget_;
};

} // namespace ctxopt::sdk
