#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "ctxopt/core/config.hpp"

namespace fs = std::filesystem;

TEST_CASE("default_config returns sane defaults", "[config]") {
    auto cfg = ctxopt::default_config();

    SECTION("limit defaults") {
        CHECK(cfg.limits.default_timeout_ms == 5000);
        CHECK(cfg.limits.max_timeout_ms == 30000);
        CHECK(cfg.limits.memory_limit_mb == 128);
        CHECK(cfg.limits.max_output_tokens == 4000);
    }

    SECTION("process defaults") {
        CHECK(cfg.log_level == "info");
        CHECK(cfg.worker_threads == 4);
        CHECK(cfg.working_dir.empty());
    }
}

TEST_CASE("load_config parses JSON file correctly", "[config]") {
    auto tmp = fs::temp_directory_path() / "ctxopt_test_config.json";
    {
        std::ofstream out(tmp);
        out << R"({
            "log_level": "debug",
            "limits": {
                "default_timeout_ms": 2000,
                "max_output_tokens": 800
            },
            "worker_threads": 2
        })";
    }

    auto cfg = ctxopt::load_config(tmp);

    CHECK(cfg.log_level == "debug");
    CHECK(cfg.limits.default_timeout_ms == 2000);
    CHECK(cfg.limits.max_output_tokens == 800);
    CHECK(cfg.worker_threads == 2);
    // Non-specified fields keep defaults
    CHECK(cfg.limits.max_timeout_ms == 30000);
    CHECK(cfg.limits.memory_limit_mb == 128);

    fs::remove(tmp);
}

TEST_CASE("load_config resolves env refs in working_dir", "[config]") {
    ::setenv("CTXOPT_TEST_ROOT", "/srv/project", 1);
    auto tmp = fs::temp_directory_path() / "ctxopt_test_config_env.json";
    {
        std::ofstream out(tmp);
        out << R"({ "working_dir": "${CTXOPT_TEST_ROOT}/src" })";
    }

    auto cfg = ctxopt::load_config(tmp);
    CHECK(cfg.working_dir == "/srv/project/src");

    fs::remove(tmp);
    ::unsetenv("CTXOPT_TEST_ROOT");
}

TEST_CASE("load_config returns defaults for missing or malformed files", "[config]") {
    auto missing = ctxopt::load_config("/nonexistent/path/config.json");
    CHECK(missing.log_level == "info");
    CHECK(missing.limits.default_timeout_ms == 5000);

    auto tmp = fs::temp_directory_path() / "ctxopt_test_config_bad.json";
    {
        std::ofstream out(tmp);
        out << "{ not json";
    }
    auto malformed = ctxopt::load_config(tmp);
    CHECK(malformed.worker_threads == 4);
    fs::remove(tmp);
}

TEST_CASE("apply_env_overrides reads environment variables", "[config]") {
    ::setenv("CTXOPT_LOG_LEVEL", "trace", 1);
    ::setenv("CTXOPT_TIMEOUT_MS", "7000", 1);
    ::setenv("CTXOPT_MAX_OUTPUT_TOKENS", "250", 1);
    ::setenv("CTXOPT_WORKER_THREADS", "abc", 1);
    ::setenv("CTXOPT_WORKING_DIR", "/tmp/project", 1);

    auto cfg = ctxopt::default_config();
    ctxopt::apply_env_overrides(cfg);

    CHECK(cfg.log_level == "trace");
    CHECK(cfg.limits.default_timeout_ms == 7000);
    CHECK(cfg.limits.max_output_tokens == 250);
    // Non-numeric values are ignored
    CHECK(cfg.worker_threads == 4);
    CHECK(cfg.working_dir == "/tmp/project");

    for (const auto* name : {"CTXOPT_LOG_LEVEL", "CTXOPT_TIMEOUT_MS", "CTXOPT_MAX_OUTPUT_TOKENS",
                             "CTXOPT_WORKER_THREADS", "CTXOPT_WORKING_DIR"}) {
        ::unsetenv(name);
    }
}

TEST_CASE("Config round-trips through JSON", "[config]") {
    ctxopt::Config cfg;
    cfg.log_level = "warn";
    cfg.limits.memory_limit_mb = 64;
    cfg.working_dir = "/work";

    ctxopt::json j = cfg;
    auto restored = j.get<ctxopt::Config>();

    CHECK(restored.log_level == "warn");
    CHECK(restored.limits.memory_limit_mb == 64);
    CHECK(restored.working_dir == "/work");
    CHECK(restored.worker_threads == 4);
}
