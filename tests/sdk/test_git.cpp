#include <catch2/catch_test_macros.hpp>

#include "ctxopt/sdk/git.hpp"
#include "support/temp_tree.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace ctxopt::sdk;
using ctxopt::CancellationToken;
using ctxopt::ErrorCode;
using ctxopt::test::TempTree;
namespace fs = std::filesystem;

namespace {

auto git_in(const TempTree& tree, const std::string& args) -> int {
    auto command = "git -C '" + tree.root.string() + "' -c user.name=test -c user.email=test@example.com " +
                   args + " > /dev/null 2>&1";
    return std::system(command.c_str());
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Argument policy
// ---------------------------------------------------------------------------

TEST_CASE("Only read-only git subcommands are allowed", "[sdk][git]") {
    for (const auto* ok : {"diff", "log", "blame", "status", "branch", "rev-parse"}) {
        CHECK(is_allowed_git_subcommand(ok));
    }
    for (const auto* denied : {"push", "fetch", "pull", "clone", "remote", "submodule",
                               "commit", "checkout", "config", "gc", ""}) {
        CHECK_FALSE(is_allowed_git_subcommand(denied));
    }
}

TEST_CASE("Disallowed subcommands are refused before spawning", "[sdk][git]") {
    auto dir = fs::temp_directory_path() / "ctxopt_git_refuse";
    fs::create_directories(dir);
    CancellationToken cancel;
    Host host(dir, cancel);

    auto pushed = run_git(host, {"push", "origin", "main"});
    REQUIRE_FALSE(pushed.has_value());
    CHECK(pushed.error().code() == ErrorCode::SecurityBlocked);
    CHECK(pushed.error().message() == "Git subcommand 'push' is not allowed");

    auto empty = run_git(host, {});
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code() == ErrorCode::SecurityBlocked);

    fs::remove_all(dir);
}

TEST_CASE("Git refs are validated", "[sdk][git]") {
    for (const auto* ok : {"HEAD", "HEAD~2", "main", "origin/feature-x", "v1.2.3", "abc123^"}) {
        INFO(ok);
        CHECK(validate_git_ref(ok).has_value());
    }

    auto dash = validate_git_ref("--output=/tmp/x");
    REQUIRE_FALSE(dash.has_value());
    CHECK(dash.error().code() == ErrorCode::SecurityBlocked);

    for (const auto* bad : {"HEAD; rm -rf /", "a|b", "$(id)", "`id`", "a b", "x>y"}) {
        auto r = validate_git_ref(bad);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::SecurityBlocked);
    }

    auto empty = validate_git_ref("");
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code() == ErrorCode::InvalidArgument);
}

TEST_CASE("Git commands check arguments before running git", "[sdk][git]") {
    auto dir = fs::temp_directory_path() / "ctxopt_git_args";
    fs::remove_all(dir);
    fs::create_directories(dir);
    { std::ofstream(dir / "a.ts") << "x\n"; }
    CancellationToken cancel;
    Host host(dir, cancel);

    auto diff = git_diff(host, std::string("--output=/tmp/pwned"));
    REQUIRE_FALSE(diff.has_value());
    CHECK(diff.error().code() == ErrorCode::SecurityBlocked);

    auto blame_outside = git_blame(host, "../../etc/passwd");
    REQUIRE_FALSE(blame_outside.has_value());
    CHECK(blame_outside.error().code() == ErrorCode::PathRejected);

    auto blame_line = git_blame(host, "a.ts", 0);
    REQUIRE_FALSE(blame_line.has_value());
    CHECK(blame_line.error().code() == ErrorCode::InvalidArgument);

    fs::remove_all(dir);
}

TEST_CASE("Git is not run once the execution is cancelled", "[sdk][git]") {
    auto dir = fs::temp_directory_path() / "ctxopt_git_cancel";
    fs::create_directories(dir);
    CancellationToken cancel;
    cancel.cancel();
    Host host(dir, cancel);

    auto status = git_status(host);
    REQUIRE_FALSE(status.has_value());
    CHECK(status.error().code() == ErrorCode::Timeout);

    auto branch = git_branch(host);
    REQUIRE_FALSE(branch.has_value());
    CHECK(branch.error().code() == ErrorCode::Timeout);

    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// Output parsers
// ---------------------------------------------------------------------------

TEST_CASE("Diff numstat and name-status combine per file", "[sdk][git]") {
    auto parsed = parse_diff_files("3\t1\tsrc/a.ts\n10\t0\tsrc/new.ts\n-\t-\tlogo.png\n",
                                   "M\tsrc/a.ts\nA\tsrc/new.ts\nM\tlogo.png\n");
    REQUIRE(parsed["files"].size() == 3);
    CHECK(parsed["files"][0]["file"] == "src/a.ts");
    CHECK(parsed["files"][0]["status"] == "modified");
    CHECK(parsed["files"][0]["additions"] == 3);
    CHECK(parsed["files"][1]["status"] == "added");
    CHECK(parsed["files"][2]["additions"] == 0);
    CHECK(parsed["stats"]["additions"] == 13);
    CHECK(parsed["stats"]["deletions"] == 1);
}

TEST_CASE("Log records split on separator bytes", "[sdk][git]") {
    std::string out = "aaaa\x1f" "aa\x1f" "Ada\x1f" "2024-01-02T03:04:05+00:00\x1f" "Fix parser\x1e\n"
                      "bbbb\x1f" "bb\x1f" "Bob\x1f" "2024-01-01T00:00:00+00:00\x1f\x1e\n";
    auto commits = parse_log(out);
    REQUIRE(commits.size() == 2);
    CHECK(commits[0]["hash"] == "aaaa");
    CHECK(commits[0]["shortHash"] == "aa");
    CHECK(commits[0]["author"] == "Ada");
    CHECK(commits[0]["message"] == "Fix parser");
    CHECK(commits[1]["message"] == "");
    CHECK(parse_log("").empty());
}

TEST_CASE("Blame porcelain reuses commit metadata", "[sdk][git]") {
    const std::string hash(40, 'a');
    std::string porcelain = hash + " 1 1 2\n"
                            "author Ada Lovelace\n"
                            "author-time 0\n"
                            "summary first\n"
                            "filename a.ts\n"
                            "\tconst a = 1;\n" +
                            hash + " 2 2\n"
                            "\tconst b = 2;\n";
    auto blame = parse_blame(porcelain);
    REQUIRE(blame["lines"].size() == 2);
    CHECK(blame["lines"][0]["hash"] == "aaaaaaa");
    CHECK(blame["lines"][0]["author"] == "Ada Lovelace");
    CHECK(blame["lines"][0]["date"] == "1970-01-01T00:00:00.000Z");
    CHECK(blame["lines"][0]["content"] == "const a = 1;");
    CHECK(blame["lines"][1]["line"] == 2);
    CHECK(blame["lines"][1]["author"] == "Ada Lovelace");
}

TEST_CASE("Status porcelain reports branch and file states", "[sdk][git]") {
    auto status = parse_status("## main...origin/main [ahead 2, behind 1]\n"
                               "M  staged.ts\n"
                               " M dirty.ts\n"
                               "MM both.ts\n"
                               "R  old.ts -> new.ts\n"
                               "?? fresh.ts\n");
    CHECK(status["branch"] == "main");
    CHECK(status["ahead"] == 2);
    CHECK(status["behind"] == 1);
    CHECK(status["staged"] == json::array({"staged.ts", "both.ts", "new.ts"}));
    CHECK(status["modified"] == json::array({"dirty.ts", "both.ts"}));
    CHECK(status["untracked"] == json::array({"fresh.ts"}));

    auto fresh = parse_status("## No commits yet on trunk\n");
    CHECK(fresh["branch"] == "trunk");
    CHECK(fresh["ahead"] == 0);
}

// ---------------------------------------------------------------------------
// Sensitive files
// ---------------------------------------------------------------------------

TEST_CASE("Diff pathspecs keep to the working directory and exclude secrets", "[sdk][git]") {
    auto specs = diff_pathspecs();
    REQUIRE_FALSE(specs.empty());
    CHECK(specs.front() == ".");
    CHECK(std::ranges::find(specs, ":(exclude,glob,icase)**/.env") != specs.end());
    CHECK(std::ranges::find(specs, ":(exclude,glob,icase)**/*secrets*.*") != specs.end());
    CHECK(std::ranges::find(specs, ":(exclude,glob,icase)**/*.pem/**") != specs.end());
}

TEST_CASE("Diff sections touching sensitive files are dropped", "[sdk][git]") {
    const std::string raw =
        "diff --git a/src/a.ts b/src/a.ts\n"
        "--- a/src/a.ts\n"
        "+++ b/src/a.ts\n"
        "@@ -1 +1 @@\n"
        "-old\n"
        "+new\n"
        "diff --git a/.env b/.env\n"
        "--- a/.env\n"
        "+++ b/.env\n"
        "@@ -1 +1 @@\n"
        "-API_KEY=old\n"
        "+API_KEY=sk-live-123\n"
        "diff --git a/conf/settings.ts b/conf/secrets_prod.yaml\n"
        "similarity index 90%\n"
        "rename from conf/settings.ts\n"
        "rename to conf/secrets_prod.yaml\n"
        "diff --git a/README.md b/README.md\n"
        "--- a/README.md\n"
        "+++ b/README.md\n"
        "@@ -1 +1 @@\n"
        "-a\n"
        "+b";

    auto filtered = drop_sensitive_sections(raw);
    CHECK(filtered.find("sk-live-123") == std::string::npos);
    CHECK(filtered.find(".env") == std::string::npos);
    CHECK(filtered.find("secrets_prod") == std::string::npos);
    CHECK(filtered.starts_with("diff --git a/src/a.ts b/src/a.ts\n"));
    CHECK(filtered.find("diff --git a/README.md b/README.md") != std::string::npos);
    CHECK(filtered.ends_with("+b"));
}

TEST_CASE("Diff and status leave sensitive files out of a real repository", "[sdk][git]") {
    if (std::system("git --version > /dev/null 2>&1") != 0) {
        WARN("git is not installed");
        return;
    }
    TempTree tree("ctxopt_git_sensitive");
    tree.write("src/a.ts", "export const a = 1;\n");
    tree.write(".env", "API_KEY=old\n");
    REQUIRE(git_in(tree, "init -q") == 0);
    REQUIRE(git_in(tree, "add -A") == 0);
    REQUIRE(git_in(tree, "commit -q -m init") == 0);

    tree.write("src/a.ts", "export const a = 2;\n");
    tree.write(".env", "API_KEY=sk-live-123\n");
    tree.write("production.env", "DB_PASSWORD=hunter2\n");

    CancellationToken cancel;
    Host host(tree.root, cancel);

    auto diff = git_diff(host);
    REQUIRE(diff.has_value());
    const auto raw = (*diff)["raw"].get<std::string>();
    CHECK(raw.find("sk-live-123") == std::string::npos);
    CHECK(raw.find("export const a = 2;") != std::string::npos);
    REQUIRE((*diff)["files"].size() == 1);
    CHECK((*diff)["files"][0]["file"] == "src/a.ts");
    CHECK((*diff)["stats"]["additions"] == 1);

    auto status = git_status(host);
    REQUIRE(status.has_value());
    CHECK((*status)["modified"] == json::array({"src/a.ts"}));
    CHECK((*status)["untracked"].empty());
}
