#include "ctxopt/core/config.hpp"
#include "ctxopt/core/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>

namespace ctxopt {

namespace {

auto env_int(const char* name) -> std::optional<int64_t> {
    auto* val = std::getenv(name);
    if (!val || !*val) return std::nullopt;
    char* end = nullptr;
    auto parsed = std::strtoll(val, &end, 10);
    if (end == val || *end != '\0') {
        LOG_WARN("Config: ignoring non-numeric {}='{}'", name, val);
        return std::nullopt;
    }
    return static_cast<int64_t>(parsed);
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);

        if (j.contains("working_dir") && j["working_dir"].is_string()) {
            j["working_dir"] = resolve_env_refs(j["working_dir"].get<std::string>());
        }

        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

void apply_env_overrides(Config& config) {
    if (auto* val = std::getenv("CTXOPT_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto val = env_int("CTXOPT_TIMEOUT_MS")) {
        config.limits.default_timeout_ms = *val;
    }
    if (auto val = env_int("CTXOPT_MAX_OUTPUT_TOKENS"); val && *val > 0) {
        config.limits.max_output_tokens = static_cast<std::size_t>(*val);
    }
    if (auto val = env_int("CTXOPT_MEMORY_LIMIT_MB"); val && *val > 0) {
        config.limits.memory_limit_mb = static_cast<std::size_t>(*val);
    }
    if (auto val = env_int("CTXOPT_WORKER_THREADS"); val && *val > 0) {
        config.worker_threads = static_cast<std::size_t>(*val);
    }
    if (auto* val = std::getenv("CTXOPT_WORKING_DIR")) {
        config.working_dir = val;
    }
}

auto default_config() -> Config {
    return Config{};
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // Check for $$ escape
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string var_name(input.substr(i + 2, close - i - 2));

                if (auto* val = std::getenv(var_name.c_str())) {
                    result += val;
                } else {
                    // Preserve unresolved refs
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace ctxopt
