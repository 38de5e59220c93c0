#include "ctxopt/sdk/git.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <format>
#include <thread>
#include <unordered_map>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "ctxopt/core/logger.hpp"
#include "ctxopt/core/utils.hpp"
#include "ctxopt/security/path_validator.hpp"

extern char** environ;

namespace ctxopt::sdk {

namespace {

constexpr std::array kAllowedSubcommands = {
    std::string_view{"diff"}, std::string_view{"log"}, std::string_view{"blame"},
    std::string_view{"status"}, std::string_view{"branch"}, std::string_view{"rev-parse"},
};

/// Prepended to every invocation.
constexpr std::array kGlobalOptions = {
    "--no-pager",
    "-c", "core.fsmonitor=false",
    "-c", "core.quotepath=false",
    "-c", "diff.external=",
    "-c", "color.ui=false",
};

/// Glob spellings of the names security::is_sensitive_name refuses.
constexpr std::array kSensitiveNameGlobs = {
    ".env", ".env.*", "*.env", "*.env.*", "*.pem", "*.key", "id_rsa*", "id_ed25519*",
    "*credentials*", "*secret.*", "*secrets*.*", "*.keystore", "*.jks", "*password*",
    ".htpasswd", ".netrc", ".npmrc", ".pypirc",
};

auto parse_int(std::string_view s, int fallback = 0) -> int {
    int value = fallback;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    return ec == std::errc{} ? value : fallback;
}

auto first_line(std::string_view s) -> std::string {
    auto trimmed = utils::trim(s);
    auto nl = trimmed.find('\n');
    return nl == std::string::npos ? trimmed : trimmed.substr(0, nl);
}

auto iso_from_epoch(long long seconds) -> std::string {
    std::chrono::sys_seconds tp{std::chrono::seconds(seconds)};
    return std::format("{:%Y-%m-%dT%H:%M:%S}.000Z", tp);
}

/// Owns a pipe or file descriptor.
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    Fd(const Fd&) = delete;
    auto operator=(const Fd&) -> Fd& = delete;
    ~Fd() { reset(); }

    [[nodiscard]] auto get() const -> int { return fd_; }
    [[nodiscard]] auto valid() const -> bool { return fd_ >= 0; }
    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    Fd read;
    Fd write;

    auto open() -> bool {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) return false;
        read.reset(fds[0]);
        write.reset(fds[1]);
        return true;
    }
};

void kill_child(pid_t pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

struct ChildOutput {
    std::string out;
    std::string err;
    int exit_code = -1;
};

enum class WaitFailure { None, Timeout, Cancelled, TooLarge, Io };

/// Drains both pipes until EOF, then reaps the child. Gives up (and kills
/// the child) on deadline, cancellation or runaway output.
auto collect(pid_t pid, Fd& out_fd, Fd& err_fd, std::chrono::steady_clock::time_point deadline,
             const CancellationToken& cancel, ChildOutput& output) -> WaitFailure {
    std::array<char, 65536> buffer{};
    std::size_t total = 0;

    while (out_fd.valid() || err_fd.valid()) {
        if (cancel.is_cancelled()) return WaitFailure::Cancelled;
        if (std::chrono::steady_clock::now() >= deadline) return WaitFailure::Timeout;

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (out_fd.valid()) fds[count++] = pollfd{out_fd.get(), POLLIN, 0};
        if (err_fd.valid()) fds[count++] = pollfd{err_fd.get(), POLLIN, 0};

        int ready = ::poll(fds.data(), count, 50);
        if (ready < 0) {
            if (errno == EINTR) continue;
            return WaitFailure::Io;
        }
        if (ready == 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            auto& fd = fds[i].fd == out_fd.get() ? out_fd : err_fd;
            auto& sink = &fd == &out_fd ? output.out : output.err;
            auto n = ::read(fd.get(), buffer.data(), buffer.size());
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                return WaitFailure::Io;
            }
            if (n == 0) {
                fd.reset();
                continue;
            }
            total += static_cast<std::size_t>(n);
            if (total > kMaxGitOutput) return WaitFailure::TooLarge;
            sink.append(buffer.data(), static_cast<std::size_t>(n));
        }
    }

    int status = 0;
    while (true) {
        auto rc = ::waitpid(pid, &status, WNOHANG);
        if (rc == pid) break;
        if (rc < 0 && errno != EINTR) return WaitFailure::Io;
        if (cancel.is_cancelled()) return WaitFailure::Cancelled;
        if (std::chrono::steady_clock::now() >= deadline) return WaitFailure::Timeout;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    output.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    return WaitFailure::None;
}

/// Paths named by the header and rename lines of one diff section.
auto section_paths(std::string_view section) -> std::vector<std::string> {
    std::vector<std::string> paths;
    for (const auto& line : utils::split_lines(section)) {
        std::string_view view(line);
        if (view.starts_with("diff --git ")) {
            auto rest = view.substr(11);
            // "a/<path> b/<path>"; both halves are equal unless renamed.
            if (rest.size() >= 5 && (rest.size() - 5) % 2 == 0) {
                auto half = (rest.size() - 5) / 2;
                auto left = rest.substr(2, half);
                if (rest == std::format("a/{} b/{}", left, left)) {
                    paths.emplace_back(left);
                    continue;
                }
            }
            if (auto split = rest.rfind(" b/"); split != std::string_view::npos && rest.starts_with("a/")) {
                paths.emplace_back(rest.substr(2, split - 2));
                paths.emplace_back(rest.substr(split + 3));
            } else {
                paths.emplace_back(rest);
            }
        } else if (view.starts_with("--- a/") || view.starts_with("+++ b/")) {
            paths.emplace_back(view.substr(6));
        } else if (view.starts_with("rename from ") || view.starts_with("rename to ")) {
            paths.emplace_back(view.substr(view.find(' ', 7) + 1));
        } else if (view.starts_with("@@")) {
            break;
        }
    }
    return paths;
}

auto subprocess_error(std::string message) -> Error {
    return make_error(ErrorCode::SubprocessError, std::move(message));
}

} // anonymous namespace

auto is_allowed_git_subcommand(std::string_view subcommand) -> bool {
    return std::ranges::find(kAllowedSubcommands, subcommand) != kAllowedSubcommands.end();
}

auto validate_git_ref(std::string_view ref) -> Result<void> {
    if (ref.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument, "Git ref must not be empty"));
    }
    if (ref.starts_with('-')) {
        return std::unexpected(make_error(ErrorCode::SecurityBlocked,
                                          "Git ref must not start with '-'"));
    }
    for (char c : ref) {
        auto ok = std::isalnum(static_cast<unsigned char>(c)) ||
                  std::string_view("._/~^@:+-").find(c) != std::string_view::npos;
        if (!ok) {
            return std::unexpected(make_error(ErrorCode::SecurityBlocked,
                                              "Git ref contains disallowed characters"));
        }
    }
    return ok_result();
}

auto run_git(const Host& host, const std::vector<std::string>& args,
             std::chrono::milliseconds timeout) -> Result<std::string> {
    if (args.empty() || !is_allowed_git_subcommand(args.front())) {
        auto name = args.empty() ? std::string("(none)") : args.front();
        LOG_WARN("Git subcommand refused: {}", name);
        return std::unexpected(make_error(ErrorCode::SecurityBlocked,
            "Git subcommand '" + name + "' is not allowed"));
    }
    if (auto cancelled = host.check_cancelled(); !cancelled) {
        return std::unexpected(cancelled.error());
    }

    // Everything the child needs is prepared before fork.
    std::vector<std::string> argv_storage{"git"};
    argv_storage.insert(argv_storage.end(), kGlobalOptions.begin(), kGlobalOptions.end());
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& a : argv_storage) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry(*e);
        if (entry.starts_with("GIT_")) continue;
        env_storage.emplace_back(entry);
    }
    env_storage.emplace_back("GIT_TERMINAL_PROMPT=0");
    env_storage.emplace_back("GIT_OPTIONAL_LOCKS=0");
    env_storage.emplace_back("LC_ALL=C");
    std::vector<char*> envp;
    for (auto& e : env_storage) envp.push_back(e.data());
    envp.push_back(nullptr);

    const auto cwd = host.working_dir().string();

    Pipe out_pipe;
    Pipe err_pipe;
    if (!out_pipe.open() || !err_pipe.open()) {
        return std::unexpected(subprocess_error("Failed to create pipes for git"));
    }
    Fd dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));

    LOG_DEBUG("Running git {}", utils::join(args, " "));
    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(make_error(ErrorCode::SubprocessError, "Failed to fork git",
                                          "errno=" + std::to_string(errno)));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        if (dev_null.valid()) ::dup2(dev_null.get(), STDIN_FILENO);
        ::dup2(out_pipe.write.get(), STDOUT_FILENO);
        ::dup2(err_pipe.write.get(), STDERR_FILENO);
        if (::chdir(cwd.c_str()) != 0) ::_exit(126);
        ::execvpe("git", argv.data(), envp.data());
        ::_exit(127);
    }

    out_pipe.write.reset();
    err_pipe.write.reset();

    ChildOutput output;
    auto deadline = std::min(std::chrono::steady_clock::now() + timeout,
                             host.cancellation().deadline());
    auto failure = collect(pid, out_pipe.read, err_pipe.read, deadline, host.cancellation(), output);

    switch (failure) {
        case WaitFailure::None:
            break;
        case WaitFailure::Cancelled:
            kill_child(pid);
            return std::unexpected(make_error(ErrorCode::Timeout, "Execution timeout"));
        case WaitFailure::Timeout:
            kill_child(pid);
            if (host.cancellation().is_cancelled()) {
                return std::unexpected(make_error(ErrorCode::Timeout, "Execution timeout"));
            }
            LOG_WARN("git {} timed out after {}ms", args.front(), timeout.count());
            return std::unexpected(subprocess_error(
                std::format("Git command timed out after {}ms", timeout.count())));
        case WaitFailure::TooLarge:
            kill_child(pid);
            return std::unexpected(subprocess_error("Git output too large"));
        case WaitFailure::Io:
            kill_child(pid);
            return std::unexpected(subprocess_error("Failed to read git output"));
    }

    if (output.exit_code == 127) {
        return std::unexpected(subprocess_error("git executable not found"));
    }
    if (output.exit_code != 0) {
        if (output.err.find("not a git repository") != std::string::npos) {
            return std::unexpected(subprocess_error("Not a git repository"));
        }
        auto message = first_line(output.err);
        LOG_DEBUG("git {} exited with {}", args.front(), output.exit_code);
        return std::unexpected(subprocess_error(message.empty() ? "Git command failed" : message));
    }

    while (!output.out.empty() && (output.out.back() == '\n' || output.out.back() == '\r')) {
        output.out.pop_back();
    }
    return std::move(output.out);
}

// ---------------------------------------------------------------------------
// Sensitive file filtering
// ---------------------------------------------------------------------------

auto diff_pathspecs() -> std::vector<std::string> {
    std::vector<std::string> specs{"."};
    for (const auto* name : kSensitiveNameGlobs) {
        specs.push_back(std::format(":(exclude,glob,icase)**/{}", name));
        specs.push_back(std::format(":(exclude,glob,icase)**/{}/**", name));
    }
    return specs;
}

auto drop_sensitive_sections(std::string_view raw) -> std::string {
    std::string out;
    std::size_t pos = 0;
    while (pos < raw.size()) {
        auto next = raw.find("\ndiff --git ", pos);
        auto end = next == std::string_view::npos ? raw.size() : next + 1;
        auto section = raw.substr(pos, end - pos);
        auto paths = section_paths(section);
        if (std::ranges::none_of(paths, [](const std::string& p) { return security::is_sensitive_path(p); })) {
            out.append(section);
        } else {
            LOG_WARN("git diff section for a sensitive file dropped");
        }
        pos = end;
    }
    while (!out.empty() && out.back() == '\n') out.pop_back();
    return out;
}

// ---------------------------------------------------------------------------
// Parsers
// ---------------------------------------------------------------------------

auto parse_diff_files(std::string_view numstat, std::string_view name_status) -> json {
    std::unordered_map<std::string, std::string> statuses;
    for (const auto& line : utils::split_lines(name_status)) {
        auto parts = utils::split(line, '\t');
        if (parts.size() < 2 || parts.front().empty()) continue;
        std::string status;
        switch (parts.front().front()) {
            case 'A': status = "added"; break;
            case 'D': status = "deleted"; break;
            case 'R': status = "renamed"; break;
            default: status = "modified";
        }
        statuses[parts.back()] = status;
    }

    auto files = json::array();
    int additions = 0;
    int deletions = 0;
    for (const auto& line : utils::split_lines(numstat)) {
        auto parts = utils::split(line, '\t');
        if (parts.size() < 3) continue;
        // Binary files report "-" for both counts.
        int added = parts[0] == "-" ? 0 : parse_int(parts[0]);
        int removed = parts[1] == "-" ? 0 : parse_int(parts[1]);
        additions += added;
        deletions += removed;

        auto it = statuses.find(parts[2]);
        files.push_back(json{
            {"file", parts[2]},
            {"status", it != statuses.end() ? it->second : "modified"},
            {"additions", added},
            {"deletions", removed},
        });
    }

    return json{
        {"files", std::move(files)},
        {"stats", {{"additions", additions}, {"deletions", deletions}}},
    };
}

auto parse_log(std::string_view output) -> json {
    auto commits = json::array();
    for (const auto& record : utils::split(output, '\x1e')) {
        auto trimmed = utils::trim(record);
        if (trimmed.empty()) continue;
        auto fields = utils::split(trimmed, '\x1f');
        if (fields.size() < 4) continue;
        commits.push_back(json{
            {"hash", fields[0]},
            {"shortHash", fields[1]},
            {"author", fields[2]},
            {"date", fields[3]},
            {"message", fields.size() > 4 ? utils::trim(fields[4]) : std::string{}},
        });
    }
    return commits;
}

auto parse_blame(std::string_view porcelain) -> json {
    struct CommitInfo {
        std::string author = "Unknown";
        std::string date;
    };
    std::unordered_map<std::string, CommitInfo> commits;

    auto lines = json::array();
    std::string hash;
    int final_line = 0;
    for (const auto& line : utils::split_lines(porcelain)) {
        if (line.starts_with('\t')) {
            const auto& info = commits[hash];
            lines.push_back(json{
                {"hash", hash.substr(0, 7)},
                {"author", info.author},
                {"date", info.date},
                {"line", final_line},
                {"content", line.substr(1)},
            });
            continue;
        }
        auto fields = utils::split(line, ' ');
        bool is_header = fields.size() >= 3 && fields[0].size() == 40 &&
                         std::ranges::all_of(fields[0], [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
        if (is_header) {
            hash = fields[0];
            final_line = parse_int(fields[2]);
            commits.try_emplace(hash);
        } else if (line.starts_with("author ")) {
            commits[hash].author = line.substr(7);
        } else if (line.starts_with("author-time ")) {
            long long seconds = 0;
            auto value = std::string_view(line).substr(12);
            std::from_chars(value.data(), value.data() + value.size(), seconds);
            commits[hash].date = iso_from_epoch(seconds);
        }
    }
    return json{{"lines", std::move(lines)}};
}

auto parse_status(std::string_view porcelain) -> json {
    std::string branch = "HEAD";
    int ahead = 0;
    int behind = 0;
    std::vector<std::string> staged;
    std::vector<std::string> modified;
    std::vector<std::string> untracked;

    for (const auto& line : utils::split_lines(porcelain)) {
        if (line.starts_with("## ")) {
            // "## main...origin/main [ahead 1, behind 2]", "## No commits yet on main"
            auto info = line.substr(3);
            if (info.starts_with("No commits yet on ")) info = info.substr(18);
            auto name = info.substr(0, std::min(info.find("..."), info.find(' ')));
            if (!name.empty()) branch = name;
            if (auto pos = info.find("ahead "); pos != std::string::npos) {
                ahead = parse_int(std::string_view(info).substr(pos + 6));
            }
            if (auto pos = info.find("behind "); pos != std::string::npos) {
                behind = parse_int(std::string_view(info).substr(pos + 7));
            }
            continue;
        }
        if (line.size() < 4) continue;

        char index = line[0];
        char worktree = line[1];
        auto file = line.substr(3);
        if (auto arrow = file.find(" -> "); arrow != std::string::npos) {
            file = file.substr(arrow + 4);
        }

        if (index == '?') {
            untracked.push_back(file);
            continue;
        }
        if (index != ' ') staged.push_back(file);
        if (worktree != ' ') modified.push_back(file);
    }

    return json{
        {"branch", branch},
        {"ahead", ahead},
        {"behind", behind},
        {"staged", staged},
        {"modified", modified},
        {"untracked", untracked},
    };
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

auto git_diff(const Host& host, std::optional<std::string> ref) -> Result<json> {
    auto revision = ref.value_or("HEAD");
    if (revision.empty()) revision = "HEAD";
    if (auto valid = validate_git_ref(revision); !valid) {
        return std::unexpected(valid.error());
    }

    auto diff = [&](std::vector<std::string> options) {
        std::vector<std::string> args{"diff", "--no-ext-diff", "--no-textconv", "--relative"};
        args.insert(args.end(), options.begin(), options.end());
        args.push_back(revision);
        args.emplace_back("--");
        auto specs = diff_pathspecs();
        args.insert(args.end(), specs.begin(), specs.end());
        return run_git(host, args);
    };

    auto raw = diff({});
    if (!raw) return std::unexpected(raw.error());
    auto numstat = diff({"--numstat"});
    if (!numstat) return std::unexpected(numstat.error());
    auto name_status = diff({"--name-status"});
    if (!name_status) return std::unexpected(name_status.error());

    auto parsed = parse_diff_files(*numstat, *name_status);
    auto files = json::array();
    int additions = 0;
    int deletions = 0;
    for (auto& entry : parsed["files"]) {
        if (security::is_sensitive_path(entry["file"].get<std::string>())) continue;
        additions += entry["additions"].get<int>();
        deletions += entry["deletions"].get<int>();
        files.push_back(std::move(entry));
    }
    return json{
        {"raw", drop_sensitive_sections(*raw)},
        {"files", std::move(files)},
        {"stats", {{"additions", additions}, {"deletions", deletions}}},
    };
}

auto git_log(const Host& host, std::optional<int> limit) -> Result<json> {
    int count = limit.value_or(kDefaultLogLimit);
    if (count == 0) count = kDefaultLogLimit;
    count = std::clamp(count, 1, kMaxLogLimit);

    auto output = run_git(host, {"log", "--no-ext-diff", "--no-textconv",
                                 "-" + std::to_string(count), std::string(kLogFormat)});
    if (!output) return std::unexpected(output.error());
    return parse_log(*output);
}

auto git_blame(const Host& host, std::string_view file, std::optional<int> line) -> Result<json> {
    auto resolved = host.resolve(file);
    if (!resolved) return std::unexpected(resolved.error());

    std::vector<std::string> args{"blame", "--porcelain", "--no-textconv"};
    if (line) {
        if (*line < 1) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                              "Line number must be positive"));
        }
        args.push_back(std::format("-L{},{}", *line, *line));
    }
    args.emplace_back("--");
    args.push_back(host.relative(*resolved));

    auto output = run_git(host, args);
    if (!output) return std::unexpected(output.error());
    return parse_blame(*output);
}

auto git_status(const Host& host) -> Result<json> {
    auto output = run_git(host, {"status", "--porcelain=v1", "-b"});
    if (!output) return std::unexpected(output.error());
    auto status = parse_status(*output);
    for (const auto* list : {"staged", "modified", "untracked"}) {
        auto kept = json::array();
        for (auto& file : status[list]) {
            if (!security::is_sensitive_path(file.get<std::string>())) kept.push_back(std::move(file));
        }
        status[list] = std::move(kept);
    }
    return status;
}

auto git_branch(const Host& host) -> Result<json> {
    std::string current = "HEAD";
    auto head = run_git(host, {"rev-parse", "--abbrev-ref", "HEAD"});
    if (head) {
        current = utils::trim(*head);
    } else if (head.error().code() == ErrorCode::Timeout) {
        return std::unexpected(head.error());
    }

    auto output = run_git(host, {"branch", "--format=%(refname:short)"});
    if (!output) return std::unexpected(output.error());

    std::vector<std::string> branches;
    for (const auto& line : utils::split_lines(*output)) {
        auto name = utils::trim(line);
        if (!name.empty()) branches.push_back(std::move(name));
    }
    return json{{"current", current}, {"branches", branches}};
}

} // namespace ctxopt::sdk
