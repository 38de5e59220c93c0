#include "ctxopt/sdk/bridge.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <utility>

#include "ctxopt/core/logger.hpp"
#include "ctxopt/script/builtins.hpp"
#include "ctxopt/sdk/analyze.hpp"
#include "ctxopt/sdk/code.hpp"
#include "ctxopt/sdk/compress.hpp"
#include "ctxopt/sdk/files.hpp"
#include "ctxopt/sdk/git.hpp"
#include "ctxopt/sdk/search.hpp"
#include "ctxopt/sdk/utils.hpp"

namespace ctxopt::sdk {

using script::arg;
using script::Interpreter;
using script::Value;

namespace {

using Args = std::vector<Value>;

// ---------------------------------------------------------------------------
// Argument and result conversion
// ---------------------------------------------------------------------------

[[noreturn]] void raise(Interpreter& interp, const Error& error) {
    if (error.code() == ErrorCode::Timeout) {
        throw script::AbortError(ErrorCode::Timeout, "Execution timeout");
    }
    if (error.code() == ErrorCode::MemoryLimit) {
        throw script::AbortError(ErrorCode::MemoryLimit, "Memory limit exceeded");
    }
    auto* obj = script::make_error_object(interp.heap(), "Error", error.what());
    obj->properties.set("code", std::string(error_code_to_string(error.code())));
    throw script::ScriptException(Value(obj));
}

template <typename T>
auto unwrap(Interpreter& interp, Result<T> result) -> T {
    if (!result) raise(interp, result.error());
    return std::move(*result);
}

void unwrap(Interpreter& interp, Result<void> result) {
    if (!result) raise(interp, result.error());
}

auto to_value(Interpreter& interp, const json& j) -> Value {
    return script::from_json_value(j, interp.heap());
}

auto string_arg(Interpreter& interp, const Args& args, std::size_t i, std::string_view what)
    -> std::string {
    auto v = arg(args, i);
    if (!v.is_string()) interp.throw_error("TypeError", std::string(what) + " must be a string");
    return v.as_string();
}

auto optional_string(Interpreter& interp, const Args& args, std::size_t i, std::string_view what)
    -> std::optional<std::string> {
    auto v = arg(args, i);
    if (v.is_nullish()) return std::nullopt;
    if (!v.is_string()) interp.throw_error("TypeError", std::string(what) + " must be a string");
    return v.as_string();
}

auto optional_int(Interpreter& interp, const Args& args, std::size_t i, std::string_view what)
    -> std::optional<int> {
    auto v = arg(args, i);
    if (v.is_nullish()) return std::nullopt;
    if (!v.is_number() || !std::isfinite(v.as_number())) {
        interp.throw_error("TypeError", std::string(what) + " must be a number");
    }
    return static_cast<int>(std::clamp(v.as_number(), -1e9, 1e9));
}

auto optional_view(const std::optional<std::string>& s) -> std::optional<std::string_view> {
    if (!s) return std::nullopt;
    return std::string_view(*s);
}

auto member(const Value& obj, const std::string& key) -> Value {
    if (!obj.is_object()) return Value{};
    const auto* v = obj.as_object()->properties.find(key);
    return v ? *v : Value{};
}

auto make_namespace(Interpreter& interp) -> script::Object* {
    return interp.heap().make_object();
}

// ---------------------------------------------------------------------------
// Pipeline steps
// ---------------------------------------------------------------------------

auto require_callback(Interpreter& interp, const Value& v, std::string_view step) -> Value {
    if (!v.is_function()) {
        interp.throw_error("TypeError", "Pipeline step '" + std::string(step) + "' needs a function");
    }
    return v;
}

/// Converts one `{ glob: ... }`-style step object. The first recognised key
/// decides the kind.
auto parse_step(Interpreter& interp, const Value& step) -> PipelineStep {
    if (!step.is_object()) interp.throw_error("TypeError", "Pipeline step must be an object");
    const auto& props = step.as_object()->properties;
    PipelineStep out;

    if (const auto* glob = props.find("glob")) {
        if (!glob->is_string()) interp.throw_error("TypeError", "glob must be a string");
        out.kind = PipelineStep::Kind::Glob;
        out.glob = glob->as_string();
    } else if (const auto* filter = props.find("filter")) {
        out.kind = PipelineStep::Kind::Filter;
        auto fn = require_callback(interp, *filter, "filter");
        out.predicate = [&interp, fn](const json& item, std::size_t index) {
            return script::is_truthy(interp.call(fn, Value{}, {to_value(interp, item), index}));
        };
    } else if (const auto* read = props.find("read"); read && script::is_truthy(*read)) {
        out.kind = PipelineStep::Kind::Read;
    } else if (const auto* map = props.find("map")) {
        out.kind = PipelineStep::Kind::Map;
        auto fn = require_callback(interp, *map, "map");
        out.mapper = [&interp, fn](const json& item, std::size_t index) {
            auto result = interp.call(fn, Value{}, {to_value(interp, item), index});
            return script::to_json_value(result, interp.heap());
        };
    } else if (const auto* reduce = props.find("reduce")) {
        out.kind = PipelineStep::Kind::Reduce;
        auto fn = require_callback(interp, *reduce, "reduce");
        out.reducer = [&interp, fn](const json& acc, const json& item, std::size_t index) {
            auto result = interp.call(fn, Value{},
                                      {to_value(interp, acc), to_value(interp, item), index});
            return script::to_json_value(result, interp.heap());
        };
        if (const auto* initial = props.find("initial")) {
            out.initial = script::to_json_value(*initial, interp.heap());
        }
    } else if (const auto* compress = props.find("compress")) {
        out.kind = PipelineStep::Kind::Compress;
        out.compress_mode = compress->is_string() ? compress->as_string() : "auto";
        if (const auto* ratio = props.find("ratio"); ratio && ratio->is_number()) {
            out.ratio = ratio->as_number();
        }
    } else if (const auto* limit = props.find("limit")) {
        out.kind = PipelineStep::Kind::Limit;
        auto n = script::to_integer(*limit);
        out.limit = n > 0 ? static_cast<std::size_t>(std::min(n, 1e9)) : 0;
    } else if (const auto* sort = props.find("sort")) {
        out.kind = PipelineStep::Kind::Sort;
        out.descending = sort->is_string() && sort->as_string() == "desc";
        if (const auto* by = props.find("by"); by && by->is_string()) out.sort_by = by->as_string();
    } else if (const auto* unique = props.find("unique")) {
        out.kind = PipelineStep::Kind::Unique;
        if (unique->is_string()) {
            out.unique_key = unique->as_string();
        } else {
            out.dedupe = script::is_truthy(*unique);
        }
    } else {
        interp.throw_error("TypeError", "Unknown pipeline step");
    }
    return out;
}

// ---------------------------------------------------------------------------
// Namespaces
// ---------------------------------------------------------------------------

auto make_compress(Interpreter& interp) -> script::Object* {
    auto* ns = make_namespace(interp);
    script::add_function(interp, ns, "auto", [](Interpreter& interp, const Value&, Args& args) -> Value {
        auto content = string_arg(interp, args, 0, "content");
        auto hint = optional_string(interp, args, 1, "hint");
        return to_value(interp, compress_auto(content, optional_view(hint)));
    });
    script::add_function(interp, ns, "logs", [](Interpreter& interp, const Value&, Args& args) -> Value {
        return to_value(interp, compress_logs(string_arg(interp, args, 0, "logs")));
    });
    script::add_function(interp, ns, "diff", [](Interpreter& interp, const Value&, Args& args) -> Value {
        return to_value(interp, compress_diff(string_arg(interp, args, 0, "diff")));
    });
    script::add_function(interp, ns, "semantic", [](Interpreter& interp, const Value&, Args& args) -> Value {
        auto content = string_arg(interp, args, 0, "content");
        auto ratio = arg(args, 1);
        return to_value(interp, compress_semantic(content, ratio.is_number() ? ratio.as_number() : 0.5));
    });
    return ns;
}

auto make_code(Interpreter& interp) -> script::Object* {
    auto* ns = make_namespace(interp);
    script::add_function(interp, ns, "parse", [](Interpreter& interp, const Value&, Args& args) -> Value {
        auto content = string_arg(interp, args, 0, "content");
        auto lang = string_arg(interp, args, 1, "language");
        return to_value(interp, unwrap(interp, code_parse(content, lang)));
    });
    script::add_function(interp, ns, "extract", [](Interpreter& interp, const Value&, Args& args) -> Value {
        auto content = string_arg(interp, args, 0, "content");
        auto lang = string_arg(interp, args, 1, "language");
        auto target = arg(args, 2);
        auto type = member(target, "type");
        auto name = member(target, "name");
        if (!type.is_string() || !name.is_string()) {
            interp.throw_error("TypeError", "extract needs { type, name }");
        }
        return to_value(interp, unwrap(interp, code_extract(content, lang, type.as_string(), name.as_string())));
    });
    script::add_function(interp, ns, "skeleton", [](Interpreter& interp, const Value&, Args& args) -> Value {
        auto content = string_arg(interp, args, 0, "content");
        auto lang = string_arg(interp, args, 1, "language");
        return interp.make_string(unwrap(interp, code_skeleton(content, lang)));
    });
    return ns;
}

auto make_files(Interpreter& interp, const Host& host) -> script::Object* {
    auto* ns = make_namespace(interp);
    script::add_function(interp, ns, "read", [&host](Interpreter& interp, const Value&, Args& args) -> Value {
        return interp.make_string(unwrap(interp, files_read(host, string_arg(interp, args, 0, "path"))));
    });
    script::add_function(interp, ns, "exists", [&host](Interpreter& interp, const Value&, Args& args) -> Value {
        return files_exists(host, string_arg(interp, args, 0, "path"));
    });
    script::add_function(interp, ns, "glob", [&host](Interpreter& interp, const Value&, Args& args) -> Value {
        return to_value(interp, unwrap(interp, files_glob(host, string_arg(interp, args, 0, "pattern"))));
    });
    script::add_function(interp, ns, "readStructure", [&host](Interpreter& interp, const Value&, Args& args) -> Value {
        return to_value(interp, unwrap(interp, files_read_structure(host, string_arg(interp, args, 0, "path"))));
    });
    return ns;
}

auto make_git(Interpreter& interp, const Host& host) -> script::Object* {
    auto* ns = make_namespace(interp);
    script::add_function(interp, ns, "diff", [&host](Interpreter& interp, const Value&, Args& args) -> Value {
        return to_value(interp, unwrap(interp, git_diff(host, optional_string(interp, args, 0, "ref"))));
    });
    script::add_function(interp, ns, "log", [&host](Interpreter& interp, const Value&, Args& args) -> Value {
        return to_value(interp, unwrap(interp, git_log(host, optional_int(interp, args, 0, "limit"))));
    });
    script::add_function(interp, ns, "blame", [&host](Interpreter& interp, const Value&, Args& args) -> Value {
        auto file = string_arg(interp, args, 0, "file");
        return to_value(interp, unwrap(interp, git_blame(host, file, optional_int(interp, args, 1, "line"))));
    });
    script::add_function(interp, ns, "status", [&host](Interpreter& interp, const Value&, Args&) -> Value {
        return to_value(interp, unwrap(interp, git_status(host)));
    });
    script::add_function(interp, ns, "branch", [&host](Interpreter& interp, const Value&, Args&) -> Value {
        return to_value(interp, unwrap(interp, git_branch(host)));
    });
    return ns;
}

auto make_search(Interpreter& interp, const Host& host) -> script::Object* {
    auto* ns = make_namespace(interp);
    script::add_function(interp, ns, "grep", [&host](Interpreter& interp, const Value&, Args& args) -> Value {
        auto pattern = string_arg(interp, args, 0, "pattern");
        auto glob = optional_string(interp, args, 1, "glob");
        return to_value(interp, unwrap(interp, search_grep(host, pattern, optional_view(glob))));
    });
    script::add_function(interp, ns, "symbols", [&host](Interpreter& interp, const Value&, Args& args) -> Value {
        auto query = string_arg(interp, args, 0, "query");
        auto glob = optional_string(interp, args, 1, "glob");
        return to_value(interp, unwrap(interp, search_symbols(host, query, optional_view(glob))));
    });
    script::add_function(interp, ns, "files", [&host](Interpreter& interp, const Value&, Args& args) -> Value {
        return to_value(interp, unwrap(interp, search_files(host, string_arg(interp, args, 0, "pattern"))));
    });
    script::add_function(interp, ns, "references", [&host](Interpreter& interp, const Value&, Args& args) -> Value {
        auto symbol = string_arg(interp, args, 0, "symbol");
        auto glob = optional_string(interp, args, 1, "glob");
        return to_value(interp, unwrap(interp, search_references(host, symbol, optional_view(glob))));
    });
    return ns;
}

auto make_analyze(Interpreter& interp, const Host& host) -> script::Object* {
    auto* ns = make_namespace(interp);
    script::add_function(interp, ns, "dependencies", [&host](Interpreter& interp, const Value&, Args& args) -> Value {
        return to_value(interp, unwrap(interp, analyze_dependencies(host, string_arg(interp, args, 0, "file"))));
    });
    script::add_function(interp, ns, "callGraph", [&host](Interpreter& interp, const Value&, Args& args) -> Value {
        auto fn = string_arg(interp, args, 0, "functionName");
        auto file = string_arg(interp, args, 1, "file");
        auto depth = optional_int(interp, args, 2, "depth");
        return to_value(interp, unwrap(interp, analyze_call_graph(host, fn, file, depth)));
    });
    script::add_function(interp, ns, "exports", [&host](Interpreter& interp, const Value&, Args& args) -> Value {
        return to_value(interp, unwrap(interp, analyze_exports(host, string_arg(interp, args, 0, "file"))));
    });
    script::add_function(interp, ns, "structure", [&host](Interpreter& interp, const Value&, Args& args) -> Value {
        auto dir = optional_string(interp, args, 0, "dir");
        auto depth = optional_int(interp, args, 1, "depth");
        return to_value(interp, unwrap(interp, analyze_structure(host, optional_view(dir), depth)));
    });
    return ns;
}

auto make_pipeline(Interpreter& interp, const Host& host, TemplateCache& cache) -> script::Function* {
    auto* fn = interp.heap().make_native("pipeline", [&host](Interpreter& interp, const Value&, Args& args) -> Value {
        auto steps = arg(args, 0);
        if (!steps.is_array()) interp.throw_error("TypeError", "pipeline expects an array of steps");
        std::vector<PipelineStep> parsed;
        for (const auto& step : steps.as_array()->items) parsed.push_back(parse_step(interp, step));
        return to_value(interp, unwrap(interp, run_pipeline(host, parsed)));
    });

    auto add = [&](const std::string& name, script::NativeFn native) {
        fn->members.set(name, interp.heap().make_native(name, std::move(native)));
    };
    add("codebaseOverview", [&host, &cache](Interpreter& interp, const Value&, Args& args) -> Value {
        auto dir = optional_string(interp, args, 0, "dir");
        json key = json::array({dir.value_or(".")});
        return to_value(interp, unwrap(interp, cache.get_or_compute("codebaseOverview", key, [&] {
            return codebase_overview(host, optional_view(dir));
        })));
    });
    add("findUsages", [&host, &cache](Interpreter& interp, const Value&, Args& args) -> Value {
        auto symbol = string_arg(interp, args, 0, "symbol");
        auto glob = optional_string(interp, args, 1, "glob");
        json key = json::array({symbol, glob ? json(*glob) : json(nullptr)});
        return to_value(interp, unwrap(interp, cache.get_or_compute("findUsages", key, [&] {
            return find_usages(host, symbol, optional_view(glob));
        })));
    });
    add("analyzeDeps", [&host, &cache](Interpreter& interp, const Value&, Args& args) -> Value {
        auto file = string_arg(interp, args, 0, "file");
        auto depth = optional_int(interp, args, 1, "depth");
        json key = json::array({file, depth.value_or(kDefaultAnalyzeDepth)});
        return to_value(interp, unwrap(interp, cache.get_or_compute("analyzeDeps", key, [&] {
            return analyze_deps(host, file, depth);
        })));
    });
    fn->frozen = true;
    return fn;
}

auto make_utils(Interpreter& interp) -> script::Object* {
    auto* ns = make_namespace(interp);
    script::add_function(interp, ns, "countTokens", [](Interpreter& interp, const Value&, Args& args) -> Value {
        return count_tokens(string_arg(interp, args, 0, "text"));
    });
    script::add_function(interp, ns, "detectType", [](Interpreter& interp, const Value&, Args& args) -> Value {
        return interp.make_string(detect_type(string_arg(interp, args, 0, "content")));
    });
    script::add_function(interp, ns, "detectLanguage", [](Interpreter& interp, const Value&, Args& args) -> Value {
        return interp.make_string(detect_language(string_arg(interp, args, 0, "path")));
    });
    return ns;
}

} // anonymous namespace

Bridge::Bridge(std::filesystem::path working_dir, const CancellationToken& cancel)
    : host_(std::move(working_dir), cancel) {}

void Bridge::install(Interpreter& interp) {
    host_.set_memory_budget([&heap = interp.heap()](std::size_t bytes) { return heap.try_charge(bytes); });

    auto* ctx = interp.heap().make_object();
    auto add_namespace = [&](const std::string& name, script::Object* ns) {
        ns->frozen = true;
        ctx->properties.set(name, ns);
    };

    add_namespace("compress", make_compress(interp));
    add_namespace("code", make_code(interp));
    add_namespace("files", make_files(interp, host_));
    add_namespace("git", make_git(interp, host_));
    add_namespace("search", make_search(interp, host_));
    add_namespace("analyze", make_analyze(interp, host_));
    ctx->properties.set("pipeline", make_pipeline(interp, host_, cache_));
    add_namespace("utils", make_utils(interp));
    ctx->frozen = true;

    interp.define_global("ctx", ctx);
    LOG_DEBUG("SDK bridge installed for {}", host_.working_dir().string());
}

} // namespace ctxopt::sdk
