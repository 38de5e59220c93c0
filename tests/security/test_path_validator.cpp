#include <catch2/catch_test_macros.hpp>

#include "ctxopt/security/path_validator.hpp"

#include <filesystem>
#include <fstream>

using namespace ctxopt::security;
namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// validate_path: containment
// ---------------------------------------------------------------------------

TEST_CASE("Relative path inside working dir is accepted", "[security][path_validator]") {
    auto v = validate_path("src/index.ts", "/work/project");
    REQUIRE(v.safe);
    REQUIRE(v.resolved_path.has_value());
    CHECK(*v.resolved_path == "/work/project/src/index.ts");
    CHECK_FALSE(v.error.has_value());
}

TEST_CASE("Working dir itself is accepted", "[security][path_validator]") {
    auto v = validate_path(".", "/work/project");
    REQUIRE(v.safe);
    CHECK(*v.resolved_path == "/work/project");
}

TEST_CASE("Absolute path inside working dir is accepted", "[security][path_validator]") {
    auto v = validate_path("/work/project/a/b.txt", "/work/project/");
    REQUIRE(v.safe);
    CHECK(*v.resolved_path == "/work/project/a/b.txt");
}

TEST_CASE("Traversal out of working dir is rejected", "[security][path_validator]") {
    auto v = validate_path("../../etc/passwd", "/work/project");
    CHECK_FALSE(v.safe);
    REQUIRE(v.error.has_value());
    CHECK(v.error->find("within working directory") != std::string::npos);
    CHECK(v.error->find("/work/project") == std::string::npos);
}

TEST_CASE("Traversal that comes back inside is accepted", "[security][path_validator]") {
    auto v = validate_path("src/../lib/x.ts", "/work/project");
    REQUIRE(v.safe);
    CHECK(*v.resolved_path == "/work/project/lib/x.ts");
}

TEST_CASE("Sibling prefix collision is rejected", "[security][path_validator]") {
    CHECK_FALSE(validate_path("/work/project-evil/file.txt", "/work/project").safe);
    CHECK_FALSE(validate_path("../project2/file.txt", "/work/project").safe);
}

TEST_CASE("Absolute path outside working dir is rejected", "[security][path_validator]") {
    CHECK_FALSE(validate_path("/etc/hosts", "/work/project").safe);
}

TEST_CASE("Leading @ marker is stripped", "[security][path_validator]") {
    auto v = validate_path("@src/main.cpp", "/work/project");
    REQUIRE(v.safe);
    CHECK(*v.resolved_path == "/work/project/src/main.cpp");
}

TEST_CASE("Empty path is rejected", "[security][path_validator]") {
    CHECK_FALSE(validate_path("", "/work/project").safe);
    CHECK_FALSE(validate_path("@", "/work/project").safe);
}

TEST_CASE("validate_path is idempotent", "[security][path_validator]") {
    auto first = validate_path("./a/./b/../c.txt", "/work/project");
    REQUIRE(first.safe);
    auto second = validate_path(*first.resolved_path, "/work/project");
    REQUIRE(second.safe);
    CHECK(*second.resolved_path == *first.resolved_path);
}

// ---------------------------------------------------------------------------
// validate_path: sensitive names
// ---------------------------------------------------------------------------

TEST_CASE("Sensitive file names are rejected", "[security][path_validator]") {
    const char* blocked[] = {
        ".env", ".env.local", "certs/server.pem", "tls.KEY", ".ssh/id_rsa",
        "id_ed25519.pub", "aws-credentials.json", "secrets.yaml", "config/secret.json",
        "app.keystore", "release.jks", "password.txt", ".htpasswd", ".netrc",
        ".npmrc", ".pypirc", "secrets_prod.yaml", "my.secretsfile.txt", "config/secrets-v2.json",
        "production.env", "deploy/app.env.bak",
    };
    for (const auto* name : blocked) {
        INFO(name);
        auto v = validate_path(name, "/work/project");
        CHECK_FALSE(v.safe);
        REQUIRE(v.error.has_value());
        CHECK(v.error->find("is blocked for security") != std::string::npos);
    }
}

TEST_CASE("Sensitive name check is case-insensitive", "[security][path_validator]") {
    CHECK_FALSE(validate_path(".ENV", "/work/project").safe);
    CHECK_FALSE(validate_path("Credentials.txt", "/work/project").safe);
}

TEST_CASE("Sensitive directory components are rejected", "[security][path_validator]") {
    CHECK_FALSE(validate_path("secrets.d/config.json", "/work/project").safe);
    CHECK_FALSE(validate_path(".env.production/values", "/work/project").safe);
}

TEST_CASE("Ordinary names resembling sensitive ones are accepted", "[security][path_validator]") {
    CHECK(validate_path("src/environment.ts", "/work/project").safe);
    CHECK(validate_path("src/env.ts", "/work/project").safe);
    CHECK(validate_path("docs/secrets", "/work/project").safe);
    CHECK(validate_path("docs/keyboard.md", "/work/project").safe);
    CHECK(validate_path("src/monkey.ts", "/work/project").safe);
}

TEST_CASE("Blocked message names the file, not the host path", "[security][path_validator]") {
    auto v = validate_path(".env", "/work/project");
    REQUIRE(v.error.has_value());
    CHECK(*v.error == "Access to .env is blocked for security");
}

// ---------------------------------------------------------------------------
// validate_glob_pattern
// ---------------------------------------------------------------------------

TEST_CASE("Relative glob is accepted", "[security][path_validator]") {
    auto v = validate_glob_pattern("src/**/*.ts", "/work/project");
    REQUIRE(v.safe);
    CHECK(*v.resolved_path == "/work/project/src/**/*.ts");
}

TEST_CASE("Glob with traversal is rejected", "[security][path_validator]") {
    CHECK_FALSE(validate_glob_pattern("../**/*.ts", "/work/project").safe);
    CHECK_FALSE(validate_glob_pattern("src/../../x", "/work/project").safe);
}

TEST_CASE("Absolute glob roots are rejected", "[security][path_validator]") {
    CHECK_FALSE(validate_glob_pattern("/etc/*", "/work/project").safe);
    CHECK_FALSE(validate_glob_pattern("~/.ssh/*", "/work/project").safe);
    CHECK_FALSE(validate_glob_pattern("C:\\Windows\\*", "/work/project").safe);
}

TEST_CASE("Empty glob is rejected", "[security][path_validator]") {
    CHECK_FALSE(validate_glob_pattern("", "/work/project").safe);
    CHECK_FALSE(validate_glob_pattern("   ", "/work/project").safe);
}

TEST_CASE("Glob naming sensitive files is rejected", "[security][path_validator]") {
    CHECK_FALSE(validate_glob_pattern("**/.env", "/work/project").safe);
    CHECK_FALSE(validate_glob_pattern("**/*.pem", "/work/project").safe);
    CHECK_FALSE(validate_glob_pattern("config/secrets.json", "/work/project").safe);
}

// ---------------------------------------------------------------------------
// resolve_physical_path
// ---------------------------------------------------------------------------

TEST_CASE("Physical path inside working dir resolves", "[security][path_validator]") {
    auto root = fs::temp_directory_path() / "ctxopt_pv_inside";
    fs::remove_all(root);
    fs::create_directories(root / "src");
    { std::ofstream(root / "src" / "a.ts") << "x"; }

    auto result = resolve_physical_path(root / "src" / "a.ts", root);
    REQUIRE(result.has_value());
    CHECK(*result == fs::canonical(root / "src" / "a.ts"));

    auto missing = resolve_physical_path(root / "src" / "new.ts", root);
    CHECK(missing.has_value());

    fs::remove_all(root);
}

TEST_CASE("Symlink escaping working dir is rejected", "[security][path_validator]") {
    auto base = fs::temp_directory_path() / "ctxopt_pv_symlink";
    fs::remove_all(base);
    fs::create_directories(base / "work");
    fs::create_directories(base / "outside");
    { std::ofstream(base / "outside" / "data.txt") << "secret"; }
    fs::create_directory_symlink(base / "outside", base / "work" / "link");

    auto lexical = validate_path("link/data.txt", base / "work");
    REQUIRE(lexical.safe);

    auto physical = resolve_physical_path(*lexical.resolved_path, base / "work");
    REQUIRE_FALSE(physical.has_value());
    CHECK(physical.error().code() == ctxopt::ErrorCode::PathRejected);

    fs::remove_all(base);
}
