#include "ctxopt/sdk/host.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include "ctxopt/core/logger.hpp"
#include "ctxopt/sdk/glob.hpp"
#include "ctxopt/security/path_validator.hpp"

namespace ctxopt::sdk {

namespace fs = std::filesystem;

namespace {

auto skip_entry(const std::string& name, bool include_hidden) -> bool {
    if (name == "node_modules") return true;
    return !include_hidden && name.starts_with('.');
}

struct Walk {
    const GlobMatcher& matcher;
    const CancellationToken& cancel;
    std::size_t limit;
    std::vector<std::string> found;
    bool cancelled = false;

    void visit(const fs::path& dir, const std::string& prefix) {
        std::error_code ec;
        std::vector<fs::directory_entry> entries;
        for (fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
             !ec && it != end; it.increment(ec)) {
            entries.push_back(*it);
        }
        std::ranges::sort(entries, {}, [](const fs::directory_entry& e) { return e.path().filename(); });

        for (const auto& entry : entries) {
            if (found.size() >= limit) return;
            if (cancel.is_cancelled()) {
                cancelled = true;
                return;
            }

            auto name = entry.path().filename().string();
            if (skip_entry(name, matcher.includes_hidden())) continue;
            auto rel = prefix.empty() ? name : prefix + "/" + name;

            std::error_code type_ec;
            if (entry.is_symlink(type_ec)) continue;
            if (entry.is_directory(type_ec)) {
                visit(entry.path(), rel);
                if (cancelled) return;
            } else if (entry.is_regular_file(type_ec) && matcher.matches(rel)) {
                found.push_back(std::move(rel));
            }
        }
    }
};

auto timeout_error() -> Error {
    return make_error(ErrorCode::Timeout, "Execution timeout");
}

} // anonymous namespace

Host::Host(fs::path working_dir, const CancellationToken& cancel)
    : working_dir_(fs::absolute(working_dir).lexically_normal()), cancel_(cancel) {
    std::error_code ec;
    real_working_dir_ = fs::canonical(working_dir_, ec);
    if (ec) real_working_dir_ = working_dir_;
}

auto Host::resolve(std::string_view path) const -> Result<fs::path> {
    auto validation = security::validate_path(path, working_dir_);
    if (!validation.safe) {
        LOG_WARN("SDK path rejected: {}", validation.error.value_or("invalid path"));
        return std::unexpected(make_error(ErrorCode::PathRejected,
                                          validation.error.value_or("Invalid path")));
    }
    return security::resolve_physical_path(*validation.resolved_path, working_dir_);
}

auto Host::read_file(std::string_view path) const -> Result<std::string> {
    auto resolved = resolve(path);
    if (!resolved) return std::unexpected(resolved.error());

    std::error_code ec;
    if (!fs::is_regular_file(*resolved, ec)) {
        return std::unexpected(make_error(ErrorCode::NotFound,
                                          "File not found: " + std::string(path)));
    }
    auto size = fs::file_size(*resolved, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
                                          "Cannot read file: " + std::string(path)));
    }
    if (size > kMaxFileSize) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "File too large: " + std::string(path) + " (" + std::to_string(size) +
            " bytes, limit " + std::to_string(kMaxFileSize) + ")"));
    }

    std::ifstream in(*resolved, std::ios::binary);
    if (!in) {
        return std::unexpected(make_error(ErrorCode::IoError,
                                          "Cannot read file: " + std::string(path)));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

auto Host::read_for_scan(std::string_view path) const -> Result<std::optional<std::string>> {
    if (auto cancelled = check_cancelled(); !cancelled) {
        return std::unexpected(cancelled.error());
    }
    auto content = read_file(path);
    if (!content) return std::optional<std::string>{};
    return std::optional<std::string>(std::move(*content));
}

auto Host::exists(std::string_view path) const -> bool {
    auto resolved = resolve(path);
    if (!resolved) return false;
    std::error_code ec;
    return fs::exists(*resolved, ec);
}

auto Host::glob(std::string_view pattern, std::size_t limit) const
    -> Result<std::vector<std::string>> {
    return glob_in(".", pattern, limit);
}

auto Host::glob_in(std::string_view dir, std::string_view pattern, std::size_t limit) const
    -> Result<std::vector<std::string>> {
    auto validation = security::validate_glob_pattern(pattern, working_dir_);
    if (!validation.safe) {
        LOG_WARN("SDK glob rejected: {}", validation.error.value_or("invalid pattern"));
        return std::unexpected(make_error(ErrorCode::PathRejected,
                                          validation.error.value_or("Invalid glob pattern")));
    }
    GlobMatcher matcher(security::normalize_at_prefix(pattern));
    auto root = resolve(dir);
    if (!root) return std::unexpected(root.error());

    // Start below the literal directory prefix of the pattern when it has one.
    auto start = *root;
    if (!matcher.base_dir().empty()) {
        auto joined = (fs::path(std::string(dir)) / matcher.base_dir()).generic_string();
        auto base = resolve(joined);
        if (!base) return std::unexpected(base.error());
        start = *base;
    }
    std::error_code ec;
    if (!fs::is_directory(start, ec)) return std::vector<std::string>{};

    Walk walk{matcher, cancel_, limit, {}};
    walk.visit(start, matcher.base_dir());
    if (walk.cancelled) return std::unexpected(timeout_error());

    // Results still pass the per-path check, which drops sensitive names
    // reached through wildcards.
    auto base = root->lexically_relative(real_working_dir_);
    std::erase_if(walk.found, [&](const std::string& rel) {
        return !security::validate_path((base / rel).generic_string(), working_dir_).safe;
    });
    return std::move(walk.found);
}

auto Host::relative(const fs::path& absolute) const -> std::string {
    auto base = absolute.is_absolute() && absolute.generic_string().starts_with(
                    real_working_dir_.generic_string())
                    ? real_working_dir_
                    : working_dir_;
    auto rel = absolute.lexically_normal().lexically_relative(base);
    if (rel.empty()) return ".";
    return rel.generic_string();
}

auto Host::check_cancelled() const -> Result<void> {
    if (cancel_.is_cancelled()) return std::unexpected(timeout_error());
    return ok_result();
}

auto Host::charge(std::size_t bytes) const -> Result<void> {
    if (budget_ && !budget_(bytes)) {
        LOG_WARN("SDK memory budget exhausted");
        return std::unexpected(make_error(ErrorCode::MemoryLimit, "Memory limit exceeded"));
    }
    return ok_result();
}

} // namespace ctxopt::sdk
