#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace ctxopt {

using json = nlohmann::json;

/// Execution limits as they appear in the configuration file. Values are
/// clamped against the hard ceilings in sandbox/limits.hpp when a context is
/// built, so a config file can tighten the sandbox but never loosen it.
struct LimitsConfig {
    int64_t default_timeout_ms = 5000;
    int64_t max_timeout_ms = 30000;
    std::size_t memory_limit_mb = 128;
    std::size_t max_output_tokens = 4000;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(LimitsConfig, default_timeout_ms, max_timeout_ms,
                                                memory_limit_mb, max_output_tokens)

struct Config {
    std::string log_level = "info";
    LimitsConfig limits;
    std::size_t worker_threads = 4;
    std::string working_dir;  // empty: the process working directory
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, log_level, limits, worker_threads, working_dir)

auto load_config(const std::filesystem::path& path) -> Config;

/// Applies CTXOPT_* environment overrides on top of an existing config.
void apply_env_overrides(Config& config);

auto default_config() -> Config;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace ctxopt
