#include <catch2/catch_test_macros.hpp>

#include "ctxopt/sdk/host.hpp"
#include "support/temp_tree.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace ctxopt::sdk;
using ctxopt::test::TempTree;
using ctxopt::CancellationToken;
using ctxopt::ErrorCode;
namespace fs = std::filesystem;

TEST_CASE("Host reads files inside the working directory", "[sdk][host]") {
    TempTree tree("ctxopt_host_read");
    tree.write("src/a.ts", "export const a = 1;\n");
    CancellationToken cancel;
    Host host(tree.root, cancel);

    auto content = host.read_file("src/a.ts");
    REQUIRE(content.has_value());
    CHECK(*content == "export const a = 1;\n");

    CHECK(host.exists("src/a.ts"));
    CHECK(host.exists("src"));
    CHECK_FALSE(host.exists("src/missing.ts"));
}

TEST_CASE("Host rejects traversal and sensitive files", "[sdk][host]") {
    TempTree tree("ctxopt_host_reject");
    tree.write(".env", "TOKEN=x\n");
    CancellationToken cancel;
    Host host(tree.root, cancel);

    auto outside = host.read_file("../../etc/passwd");
    REQUIRE_FALSE(outside.has_value());
    CHECK(outside.error().code() == ErrorCode::PathRejected);

    auto env = host.read_file(".env");
    REQUIRE_FALSE(env.has_value());
    CHECK(env.error().code() == ErrorCode::PathRejected);
    CHECK_FALSE(host.exists(".env"));
}

TEST_CASE("Host hides secret-bearing names from reads and globs", "[sdk][host]") {
    TempTree tree("ctxopt_host_secrets");
    tree.write("secrets_prod.yaml", "TOKEN=abc\n");
    tree.write("my.secretsfile.txt", "TOKEN=def\n");
    tree.write("deploy/production.env", "API_KEY=1\n");
    tree.write("notes.txt", "hello\n");
    CancellationToken cancel;
    Host host(tree.root, cancel);

    auto secrets = host.read_file("secrets_prod.yaml");
    REQUIRE_FALSE(secrets.has_value());
    CHECK(secrets.error().code() == ErrorCode::PathRejected);

    auto all = host.glob("**/*");
    REQUIRE(all.has_value());
    CHECK(*all == std::vector<std::string>{"notes.txt"});
}

TEST_CASE("Host reports missing and oversized files", "[sdk][host]") {
    TempTree tree("ctxopt_host_sizes");
    tree.write("big.txt", std::string(kMaxFileSize + 1, 'x'));
    CancellationToken cancel;
    Host host(tree.root, cancel);

    auto missing = host.read_file("nope.txt");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code() == ErrorCode::NotFound);

    auto big = host.read_file("big.txt");
    REQUIRE_FALSE(big.has_value());
    CHECK(big.error().code() == ErrorCode::InvalidArgument);
    CHECK(std::string(big.error().message()).starts_with("File too large"));

    auto scanned = host.read_for_scan("big.txt");
    REQUIRE(scanned.has_value());
    CHECK_FALSE(scanned->has_value());
}

TEST_CASE("Host refuses symlinks leaving the working directory", "[sdk][host]") {
    TempTree tree("ctxopt_host_symlink");
    tree.write("work/inside.txt", "ok");
    tree.write("outside/secret.txt", "nope");
    fs::create_directory_symlink(tree.root / "outside", tree.root / "work" / "link");
    CancellationToken cancel;
    Host host(tree.root / "work", cancel);

    auto escaped = host.read_file("link/secret.txt");
    REQUIRE_FALSE(escaped.has_value());
    CHECK(escaped.error().code() == ErrorCode::PathRejected);

    auto files = host.glob("**/*.txt");
    REQUIRE(files.has_value());
    CHECK(*files == std::vector<std::string>{"inside.txt"});
}

TEST_CASE("Host glob walks sorted and skips hidden and node_modules", "[sdk][host]") {
    TempTree tree("ctxopt_host_glob");
    tree.write("b.ts", "");
    tree.write("a.ts", "");
    tree.write("src/c.ts", "");
    tree.write("src/d.js", "");
    tree.write(".hidden/e.ts", "");
    tree.write("node_modules/pkg/f.ts", "");
    tree.write("src/server.key", "");
    CancellationToken cancel;
    Host host(tree.root, cancel);

    auto ts = host.glob("**/*.ts");
    REQUIRE(ts.has_value());
    CHECK(*ts == std::vector<std::string>{"a.ts", "b.ts", "src/c.ts"});

    auto hidden = host.glob(".hidden/*.ts");
    REQUIRE(hidden.has_value());
    CHECK(*hidden == std::vector<std::string>{".hidden/e.ts"});

    auto everything = host.glob("src/*");
    REQUIRE(everything.has_value());
    CHECK(*everything == std::vector<std::string>{"src/c.ts", "src/d.js"});

    auto limited = host.glob("**/*.ts", 2);
    REQUIRE(limited.has_value());
    CHECK(limited->size() == 2);
}

TEST_CASE("Host glob_in returns paths relative to the directory", "[sdk][host]") {
    TempTree tree("ctxopt_host_glob_in");
    tree.write("pkg/lib/x.py", "");
    tree.write("pkg/y.py", "");
    tree.write("z.py", "");
    CancellationToken cancel;
    Host host(tree.root, cancel);

    auto files = host.glob_in("pkg", "**/*.py");
    REQUIRE(files.has_value());
    CHECK(*files == std::vector<std::string>{"lib/x.py", "y.py"});
}

TEST_CASE("Host rejects unsafe glob patterns", "[sdk][host]") {
    TempTree tree("ctxopt_host_glob_reject");
    CancellationToken cancel;
    Host host(tree.root, cancel);

    for (const auto* pattern : {"../**/*.ts", "/etc/*", "", "**/.env"}) {
        auto result = host.glob(pattern);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::PathRejected);
    }
}

TEST_CASE("Host walks stop once the execution is cancelled", "[sdk][host]") {
    TempTree tree("ctxopt_host_cancel");
    tree.write("a.ts", "");
    CancellationToken cancel;
    cancel.cancel();
    Host host(tree.root, cancel);

    auto files = host.glob("**/*.ts");
    REQUIRE_FALSE(files.has_value());
    CHECK(files.error().code() == ErrorCode::Timeout);

    auto scan = host.read_for_scan("a.ts");
    REQUIRE_FALSE(scan.has_value());
    CHECK(scan.error().code() == ErrorCode::Timeout);
    CHECK_FALSE(host.check_cancelled().has_value());
}

TEST_CASE("Host relative spells the root as dot", "[sdk][host]") {
    TempTree tree("ctxopt_host_relative");
    tree.write("src/a.ts", "");
    CancellationToken cancel;
    Host host(tree.root, cancel);

    auto root = host.resolve(".");
    REQUIRE(root.has_value());
    CHECK(host.relative(*root) == ".");

    auto file = host.resolve("src/a.ts");
    REQUIRE(file.has_value());
    CHECK(host.relative(*file) == "src/a.ts");
}
