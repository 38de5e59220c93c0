#include "ctxopt/sdk/pipeline.hpp"

#include <algorithm>
#include <filesystem>
#include <map>
#include <regex>
#include <unordered_set>

#include "ctxopt/ast/language.hpp"
#include "ctxopt/core/logger.hpp"
#include "ctxopt/core/utils.hpp"
#include "ctxopt/sdk/analyze.hpp"
#include "ctxopt/sdk/compress.hpp"
#include "ctxopt/sdk/search.hpp"

namespace ctxopt::sdk {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kUsageGlob = "**/*.{ts,tsx,js,jsx,py,go,rs}";
constexpr std::size_t kLargestFiles = 10;
constexpr std::size_t kOverviewChildren = 20;

auto count_lines(std::string_view content) -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count(content, '\n')) + 1;
}

auto read_item(const Host& host, const json& item) -> Result<json> {
    if (!item.is_string()) return item;
    auto file = item.get<std::string>();
    auto content = host.read_file(file);
    if (content) {
        if (auto charged = host.charge(content->size()); !charged) {
            return std::unexpected(charged.error());
        }
        return json{{"file", file}, {"content", std::move(*content)}};
    }
    if (content.error().code() == ErrorCode::Timeout) return std::unexpected(content.error());
    auto error = content.error().message().starts_with("File too large")
        ? std::string("File too large")
        : std::string(content.error().message());
    return json{{"file", file}, {"content", nullptr}, {"error", error}};
}

auto sort_key(const json& item, const std::optional<std::string>& by) -> const json* {
    if (!by) return &item;
    if (!item.is_object()) return nullptr;
    auto it = item.find(*by);
    return it == item.end() ? nullptr : &*it;
}

/// Strings compare lexically, numbers numerically; mixed pairs are equal.
auto compare_items(const json* a, const json* b) -> int {
    if (!a || !b) return 0;
    if (a->is_string() && b->is_string()) {
        return a->get_ref<const std::string&>().compare(b->get_ref<const std::string&>());
    }
    if (a->is_number() && b->is_number()) {
        auto x = a->get<double>();
        auto y = b->get<double>();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    return 0;
}

auto compress_data(const json& data, const PipelineStep& step) -> json {
    auto content = data.dump(2);
    if (step.compress_mode == "semantic") {
        return compress_semantic(content, step.ratio.value_or(0.5))["compressed"];
    }
    if (step.compress_mode == "logs") {
        return compress_logs(content)["summary"];
    }
    return compress_auto(content)["compressed"];
}

auto apply_unique(const json& data, const PipelineStep& step) -> json {
    auto out = json::array();
    std::unordered_set<std::string> seen;
    for (const auto& item : data) {
        std::string key;
        if (step.unique_key) {
            const auto* value = sort_key(item, step.unique_key);
            key = value ? value->dump() : "undefined";
        } else {
            key = item.dump();
        }
        if (seen.insert(key).second) out.push_back(item);
    }
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// run_pipeline
// ---------------------------------------------------------------------------

auto run_pipeline(const Host& host, const std::vector<PipelineStep>& steps) -> Result<json> {
    const auto start = utils::timestamp_ms();
    auto data = json::array();
    std::size_t steps_executed = 0;
    std::size_t items_processed = 0;

    for (const auto& step : steps) {
        if (auto cancelled = host.check_cancelled(); !cancelled) {
            return std::unexpected(cancelled.error());
        }
        ++steps_executed;

        switch (step.kind) {
            case PipelineStep::Kind::Glob: {
                auto files = host.glob(step.glob);
                if (!files) return std::unexpected(files.error());
                data = json(*files);
                items_processed = data.size();
                break;
            }
            case PipelineStep::Kind::Filter: {
                auto kept = json::array();
                for (std::size_t i = 0; i < data.size(); ++i) {
                    if (step.predicate(data[i], i)) kept.push_back(data[i]);
                }
                data = std::move(kept);
                items_processed = data.size();
                break;
            }
            case PipelineStep::Kind::Read: {
                auto read = json::array();
                for (const auto& item : data) {
                    auto entry = read_item(host, item);
                    if (!entry) return std::unexpected(entry.error());
                    read.push_back(std::move(*entry));
                }
                data = std::move(read);
                break;
            }
            case PipelineStep::Kind::Map: {
                auto mapped = json::array();
                for (std::size_t i = 0; i < data.size(); ++i) {
                    mapped.push_back(step.mapper(data[i], i));
                }
                data = std::move(mapped);
                break;
            }
            case PipelineStep::Kind::Reduce: {
                auto acc = step.initial;
                for (std::size_t i = 0; i < data.size(); ++i) {
                    acc = step.reducer(acc, data[i], i);
                }
                data = json::array({std::move(acc)});
                break;
            }
            case PipelineStep::Kind::Compress:
                data = json::array({compress_data(data, step)});
                break;
            case PipelineStep::Kind::Limit: {
                auto limited = json::array();
                for (std::size_t i = 0; i < data.size() && i < step.limit; ++i) {
                    limited.push_back(data[i]);
                }
                data = std::move(limited);
                items_processed = data.size();
                break;
            }
            case PipelineStep::Kind::Sort: {
                std::vector<json> items(data.begin(), data.end());
                std::ranges::stable_sort(items, [&](const json& a, const json& b) {
                    auto order = compare_items(sort_key(a, step.sort_by), sort_key(b, step.sort_by));
                    return step.descending ? order > 0 : order < 0;
                });
                data = json(std::move(items));
                break;
            }
            case PipelineStep::Kind::Unique:
                if (step.unique_key || step.dedupe) data = apply_unique(data, step);
                break;
        }
    }

    return json{
        {"data", std::move(data)},
        {"stats", {
            {"stepsExecuted", steps_executed},
            {"itemsProcessed", items_processed},
            {"executionTimeMs", utils::timestamp_ms() - start},
        }},
    };
}

// ---------------------------------------------------------------------------
// Templates
// ---------------------------------------------------------------------------

auto codebase_overview(const Host& host, std::optional<std::string_view> dir) -> Result<json> {
    const std::string target(dir.value_or("."));
    auto files = host.glob_in(target, kCodeGlob);
    if (!files) return std::unexpected(files.error());

    std::map<std::string, std::size_t> languages;
    std::vector<std::pair<std::string, std::size_t>> sizes;
    std::size_t total_lines = 0;

    for (const auto& file : *files) {
        auto full = (fs::path(target) / file).lexically_normal().generic_string();
        auto content = host.read_for_scan(full);
        if (!content) return std::unexpected(content.error());
        if (!*content) continue;

        auto lines = count_lines(**content);
        total_lines += lines;
        auto lang = ast::detect_language_from_path(file);
        if (lang != ast::Language::Unknown) ++languages[std::string(ast::language_to_string(lang))];
        sizes.emplace_back(file, lines);
    }

    std::ranges::stable_sort(sizes, [](const auto& a, const auto& b) { return a.second > b.second; });
    auto largest = json::array();
    for (std::size_t i = 0; i < sizes.size() && i < kLargestFiles; ++i) {
        largest.push_back(json{{"path", sizes[i].first}, {"lines", sizes[i].second}});
    }

    auto children = json::array();
    for (std::size_t i = 0; i < files->size() && i < kOverviewChildren; ++i) {
        const auto& file = (*files)[i];
        children.push_back(json{
            {"path", file},
            {"type", "file"},
            {"name", fs::path(file).filename().string()},
        });
    }
    auto name = fs::path(target).lexically_normal().filename().string();
    if (name.empty() || name == ".") name = "root";

    json languages_json = json::object();
    for (const auto& [lang, count] : languages) languages_json[lang] = count;

    return json{
        {"totalFiles", files->size()},
        {"totalLines", total_lines},
        {"languages", std::move(languages_json)},
        {"largestFiles", std::move(largest)},
        {"structure", {
            {"path", target},
            {"type", "directory"},
            {"name", name},
            {"children", std::move(children)},
        }},
    };
}

auto find_usages(const Host& host, std::string_view symbol, std::optional<std::string_view> glob)
    -> Result<json> {
    if (utils::trim(symbol).empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument, "Symbol must not be empty"));
    }
    auto files = host.glob(glob.value_or(kUsageGlob));
    if (!files) return std::unexpected(files.error());

    const auto escaped = utils::escape_regex(symbol);
    const std::regex declared("(?:function|class|const|let|var|interface|type|def|fn|func|struct)\\s+" +
                              escaped + "\\b");
    const std::regex assigned(escaped + "\\s*[=:]\\s*(?:function|\\(|async)");
    const std::regex used("\\b" + escaped + "\\b");

    auto definitions = json::array();
    auto usages = json::array();
    for (const auto& file : *files) {
        auto content = host.read_for_scan(file);
        if (!content) return std::unexpected(content.error());
        if (!*content) continue;

        auto lines = utils::split_lines(**content);
        for (std::size_t i = 0; i < lines.size(); ++i) {
            const auto& line = lines[i];
            if (line.find(symbol) == std::string::npos) continue;
            if (auto cancelled = host.check_cancelled(); !cancelled) {
                return std::unexpected(cancelled.error());
            }
            auto bounded = line.size() > kMaxScanLine ? line.substr(0, kMaxScanLine) : line;
            if (std::regex_search(bounded, declared) || std::regex_search(bounded, assigned)) {
                definitions.push_back(json{{"file", file}, {"line", i + 1}});
            } else if (std::regex_search(bounded, used)) {
                usages.push_back(json{
                    {"file", file},
                    {"line", i + 1},
                    {"context", utils::trim(line).substr(0, kUsageContextChars)},
                });
            }
        }
    }

    auto total = definitions.size() + usages.size();
    return json{
        {"symbol", std::string(symbol)},
        {"definitions", std::move(definitions)},
        {"usages", std::move(usages)},
        {"totalReferences", total},
    };
}

auto analyze_deps(const Host& host, std::string_view file, std::optional<int> depth) -> Result<json> {
    const int max_depth = std::clamp(depth.value_or(kDefaultAnalyzeDepth), 0, kMaxDepth);
    std::vector<std::string> direct;
    std::vector<std::string> transitive;
    std::vector<std::string> external;
    std::vector<std::string> circular;
    std::unordered_set<std::string> visited;
    std::vector<std::string> stack;

    auto add = [](std::vector<std::string>& list, const std::string& value) {
        if (std::ranges::find(list, value) == list.end()) list.push_back(value);
    };

    auto visit = [&](auto& self, const std::string& path, int level) -> Result<void> {
        if (std::ranges::find(stack, path) != stack.end()) {
            add(circular, path);
            return ok_result();
        }
        if (level > max_depth || visited.contains(path)) return ok_result();
        visited.insert(path);

        auto content = host.read_for_scan(path);
        if (!content) return std::unexpected(content.error());
        if (!*content) return ok_result();

        stack.push_back(path);
        auto lang = ast::detect_language_from_path(path);
        for (const auto& imp : parse_imports(**content, lang)) {
            if (auto resolved = resolve_import(host, imp.source, path, lang)) {
                if (level == 0) {
                    add(direct, *resolved);
                } else if (std::ranges::find(direct, *resolved) == direct.end()) {
                    add(transitive, *resolved);
                }
                if (auto r = self(self, *resolved, level + 1); !r) return r;
            } else if (!imp.source.starts_with('.')) {
                // Scoped npm packages keep their scope: "@scope/pkg".
                auto parts = utils::split(imp.source, '/');
                auto package = imp.source.starts_with('@') && parts.size() > 1
                    ? parts[0] + "/" + parts[1]
                    : parts.empty() ? imp.source : parts[0];
                add(external, package);
            }
        }
        stack.pop_back();
        return ok_result();
    };

    auto root = host.resolve(file);
    if (!root) return std::unexpected(root.error());
    if (auto r = visit(visit, host.relative(*root), 0); !r) return std::unexpected(r.error());

    LOG_DEBUG("analyzeDeps {}: {} direct, {} transitive", file, direct.size(), transitive.size());
    return json{
        {"file", std::string(file)},
        {"directDeps", direct},
        {"transitiveDeps", transitive},
        {"externalPackages", external},
        {"circularDeps", circular},
    };
}

// ---------------------------------------------------------------------------
// TemplateCache
// ---------------------------------------------------------------------------

auto TemplateCache::get_or_compute(std::string_view name, const json& args,
                                   const std::function<Result<json>()>& compute) -> Result<json> {
    auto key = std::string(name) + ":" + args.dump();
    auto now = Clock::now();

    if (auto it = entries_.find(key); it != entries_.end()) {
        if (it->second.expires > now) return it->second.value;
        entries_.erase(it);
    }

    auto result = compute();
    if (result) entries_[key] = Entry{*result, now + ttl_};
    return result;
}

} // namespace ctxopt::sdk
