#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "ctxopt/core/error.hpp"
#include "ctxopt/sdk/host.hpp"
#include "ctxopt/sdk/types.hpp"

namespace ctxopt::sdk {

/// How long a template result stays valid in a TemplateCache.
inline constexpr std::chrono::seconds kTemplateCacheTtl{60};
/// Characters of source kept as context for one usage.
inline constexpr std::size_t kUsageContextChars = 100;

// ---------------------------------------------------------------------------
// Steps
// ---------------------------------------------------------------------------

/// One stage of a pipeline. Callbacks may throw; the exception leaves
/// run_pipeline untouched so the caller's error handling sees it.
struct PipelineStep {
    enum class Kind { Glob, Filter, Read, Map, Reduce, Compress, Limit, Sort, Unique };

    using Predicate = std::function<bool(const json& item, std::size_t index)>;
    using Mapper = std::function<json(const json& item, std::size_t index)>;
    using Reducer = std::function<json(const json& acc, const json& item, std::size_t index)>;

    Kind kind = Kind::Glob;

    std::string glob;
    Predicate predicate;
    Mapper mapper;
    Reducer reducer;
    json initial;

    /// "semantic", "logs" or anything else for auto-detection.
    std::string compress_mode;
    std::optional<double> ratio;

    std::size_t limit = 0;

    bool descending = false;
    std::optional<std::string> sort_by;

    /// Property compared by Unique; whole items are compared when unset.
    std::optional<std::string> unique_key;
    /// `unique: false` leaves the data untouched.
    bool dedupe = true;
};

/// Applies `steps` strictly in order, starting from an empty list.
///
/// Returns `{ data, stats: { stepsExecuted, itemsProcessed, executionTimeMs } }`.
/// Glob patterns go through the glob validator, and Read never fails the
/// pipeline: unreadable entries become `{ file, content: null, error }`.
auto run_pipeline(const Host& host, const std::vector<PipelineStep>& steps) -> Result<json>;

// ---------------------------------------------------------------------------
// Templates
// ---------------------------------------------------------------------------

/// `{ totalFiles, totalLines, languages, largestFiles, structure }` for the
/// source files under `dir`.
auto codebase_overview(const Host& host, std::optional<std::string_view> dir) -> Result<json>;

/// `{ symbol, definitions, usages, totalReferences }`.
auto find_usages(const Host& host, std::string_view symbol, std::optional<std::string_view> glob)
    -> Result<json>;

/// `{ file, directDeps, transitiveDeps, externalPackages, circularDeps }`,
/// following relative imports up to `depth` levels (default 3, at most 5).
auto analyze_deps(const Host& host, std::string_view file, std::optional<int> depth) -> Result<json>;

/// Memoizes template results for kTemplateCacheTtl. Keys combine the
/// template name with its resolved arguments.
class TemplateCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit TemplateCache(std::chrono::milliseconds ttl = kTemplateCacheTtl) : ttl_(ttl) {}

    /// Cached value for `name(args)`, or the result of `compute`, which is
    /// stored when it succeeds.
    auto get_or_compute(std::string_view name, const json& args,
                        const std::function<Result<json>()>& compute) -> Result<json>;

    [[nodiscard]] auto size() const -> std::size_t { return entries_.size(); }

private:
    struct Entry {
        json value;
        Clock::time_point expires;
    };

    std::chrono::milliseconds ttl_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace ctxopt::sdk
