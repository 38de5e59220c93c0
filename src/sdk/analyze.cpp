#include "ctxopt/sdk/analyze.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <regex>
#include <unordered_set>

#include "ctxopt/ast/parser.hpp"
#include "ctxopt/core/utils.hpp"
#include "ctxopt/security/path_validator.hpp"

namespace ctxopt::sdk {

namespace fs = std::filesystem;

namespace {

constexpr std::array kResolveExtensions = {".ts", ".tsx", ".js", ".jsx", ".py", ".go", ".rs"};

auto clamp_depth(std::optional<int> depth) -> int {
    return std::clamp(depth.value_or(kDefaultAnalyzeDepth), 0, kMaxDepth);
}

void push_unique(std::vector<std::string>& out, std::string value) {
    if (std::ranges::find(out, value) == out.end()) out.push_back(std::move(value));
}

/// Splits "a, b as c" into local names, dropping aliases and `type` markers.
auto split_names(std::string_view list) -> std::vector<std::string> {
    std::vector<std::string> names;
    for (auto& part : utils::split(list, ',')) {
        auto name = utils::trim(part);
        if (name.starts_with("type ")) name = utils::trim(name.substr(5));
        if (auto as = name.find(" as "); as != std::string::npos) name = utils::trim(name.substr(0, as));
        if (!name.empty()) names.push_back(std::move(name));
    }
    return names;
}

auto parse_script_imports(const std::string& content) -> std::vector<ImportInfo> {
    static const std::regex es_import(
        R"(import\s+(?:type\s+)?(?:([A-Za-z_$][\w$]*)\s*,?\s*)?(?:\{([^}]*)\})?\s*(?:from\s+)?['"]([^'"]+)['"])");
    static const std::regex ns_import(R"(import\s+\*\s+as\s+([A-Za-z_$][\w$]*)\s+from\s+['"]([^'"]+)['"])");
    static const std::regex require_call(R"(require\s*\(\s*['"]([^'"]+)['"]\s*\))");
    static const std::regex reexport(R"(export\s+(?:\*|\{([^}]*)\})\s+from\s+['"]([^'"]+)['"])");

    std::vector<ImportInfo> imports;
    for (std::sregex_iterator it(content.begin(), content.end(), es_import), end; it != end; ++it) {
        ImportInfo info;
        info.source = (*it)[3].str();
        if ((*it)[1].matched) {
            info.names.push_back((*it)[1].str());
            info.is_default = true;
        }
        if ((*it)[2].matched) {
            auto named = split_names((*it)[2].str());
            info.names.insert(info.names.end(), named.begin(), named.end());
        }
        imports.push_back(std::move(info));
    }
    for (std::sregex_iterator it(content.begin(), content.end(), ns_import), end; it != end; ++it) {
        imports.push_back(ImportInfo{(*it)[2].str(), {(*it)[1].str()}, false, true, std::nullopt});
    }
    for (std::sregex_iterator it(content.begin(), content.end(), reexport), end; it != end; ++it) {
        imports.push_back(ImportInfo{(*it)[2].str(),
                                     (*it)[1].matched ? split_names((*it)[1].str()) : std::vector<std::string>{},
                                     false, !(*it)[1].matched, std::nullopt});
    }
    for (std::sregex_iterator it(content.begin(), content.end(), require_call), end; it != end; ++it) {
        auto source = (*it)[1].str();
        bool seen = std::ranges::any_of(imports, [&](const ImportInfo& i) { return i.source == source; });
        if (!seen) imports.push_back(ImportInfo{source, {}, true, false, std::nullopt});
    }
    return imports;
}

auto parse_python_imports(const std::string& content) -> std::vector<ImportInfo> {
    static const std::regex from_import(R"(^\s*from\s+([\w.]+)\s+import\s+(.+))");
    static const std::regex plain_import(R"(^\s*import\s+(.+))");

    std::vector<ImportInfo> imports;
    for (auto line : utils::split_lines(content)) {
        if (auto hash = line.find('#'); hash != std::string::npos) line.erase(hash);
        std::smatch m;
        if (std::regex_search(line, m, from_import)) {
            auto names = m[2].str();
            std::erase_if(names, [](char c) { return c == '(' || c == ')'; });
            imports.push_back(ImportInfo{m[1].str(), split_names(names), false, false, std::nullopt});
        } else if (std::regex_search(line, m, plain_import)) {
            for (auto& module : split_names(m[1].str())) {
                imports.push_back(ImportInfo{module, {module}, true, false, std::nullopt});
            }
        }
    }
    return imports;
}

auto parse_go_imports(const std::string& content) -> std::vector<ImportInfo> {
    static const std::regex import_decl(R"re(import\s+(?:\(([^)]*)\)|(?:([\w.]+)\s+)?"([^"]+)"))re");
    static const std::regex block_entry(R"re((?:([\w.]+)\s+)?"([^"]+)")re");

    std::vector<ImportInfo> imports;
    auto add = [&](const std::string& alias, const std::string& source) {
        auto name = alias.empty() ? fs::path(source).filename().string() : alias;
        imports.push_back(ImportInfo{source, {name}, false, alias == ".", std::nullopt});
    };
    for (std::sregex_iterator it(content.begin(), content.end(), import_decl), end; it != end; ++it) {
        if ((*it)[1].matched) {
            auto block = (*it)[1].str();
            for (std::sregex_iterator e(block.begin(), block.end(), block_entry); e != end; ++e) {
                add((*e)[1].str(), (*e)[2].str());
            }
        } else {
            add((*it)[2].str(), (*it)[3].str());
        }
    }
    return imports;
}

auto is_local_source(std::string_view source) -> bool {
    return source.starts_with('.') || source.starts_with("crate::") ||
           source.starts_with("self::") || source.starts_with("super::");
}

auto is_regular_file(const Host& host, const std::string& rel) -> bool {
    auto resolved = host.resolve(rel);
    if (!resolved) return false;
    std::error_code ec;
    return fs::is_regular_file(*resolved, ec);
}

struct SourceFile {
    std::string content;
    ast::Language language;
};

auto read_source(const Host& host, std::string_view file) -> Result<SourceFile> {
    auto content = host.read_file(file);
    if (!content) return std::unexpected(content.error());
    auto lang = ast::detect_language_from_path(file);
    if (!ast::is_parseable(lang)) {
        return std::unexpected(make_error(ErrorCode::Unsupported,
            "Unsupported language for file", std::string(file)));
    }
    return SourceFile{std::move(*content), lang};
}

/// Source lines of a declaration; 50 lines when the parser found no end.
auto body_of(const std::vector<std::string>& lines, const ast::CodeElement& el) -> std::string {
    auto start = static_cast<std::size_t>(std::max(el.start_line - 1, 0));
    auto end = el.end_line > 0 ? static_cast<std::size_t>(el.end_line) : start + 50;
    end = std::min(end, lines.size());
    std::vector<std::string> slice;
    for (auto i = start; i < end; ++i) slice.push_back(lines[i]);
    return utils::join(slice, "\n");
}

auto exports_of(const ast::FileStructure& structure, const std::vector<std::string>& lines) -> json {
    auto out = json::array();
    for (const auto& el : structure.exports) {
        auto index = static_cast<std::size_t>(std::max(el.start_line - 1, 0));
        bool is_default = el.name == "default" ||
                          (index < lines.size() && lines[index].find("export default") != std::string::npos);
        json entry{
            {"name", el.name},
            {"type", std::string(ast::element_type_to_string(el.type))},
            {"isDefault", is_default},
            {"line", el.start_line},
        };
        if (el.signature) entry["signature"] = *el.signature;
        out.push_back(std::move(entry));
    }
    return out;
}

} // anonymous namespace

auto parse_imports(std::string_view content, ast::Language lang) -> std::vector<ImportInfo> {
    const std::string text(content);
    switch (lang) {
        case ast::Language::TypeScript:
        case ast::Language::JavaScript:
            return parse_script_imports(text);
        case ast::Language::Python:
            return parse_python_imports(text);
        case ast::Language::Go:
            return parse_go_imports(text);
        default:
            break;
    }

    std::vector<ImportInfo> imports;
    auto structure = ast::parse_structure(content, lang);
    if (!structure) return imports;
    for (const auto& el : structure->imports) {
        auto last = el.name.substr(el.name.find_last_of(":\\/") == std::string::npos
                                       ? 0 : el.name.find_last_of(":\\/") + 1);
        imports.push_back(ImportInfo{el.name, {last}, false, false, std::nullopt});
    }
    return imports;
}

auto resolve_import(const Host& host, std::string_view source, std::string_view from_file,
                    ast::Language lang) -> std::optional<std::string> {
    if (!source.starts_with('.')) return std::nullopt;
    auto dir = fs::path(std::string(from_file)).parent_path();

    if (lang == ast::Language::Python) {
        // ".pkg.mod": one dot is the current package, each extra dot goes up.
        auto dots = source.find_first_not_of('.');
        auto rest = dots == std::string_view::npos ? std::string{} : std::string(source.substr(dots));
        auto levels = dots == std::string_view::npos ? source.size() : dots;
        for (std::size_t i = 1; i < levels; ++i) dir = dir.parent_path();
        std::ranges::replace(rest, '.', '/');
        auto base = (dir / rest).lexically_normal().generic_string();
        for (const auto& candidate : {base + ".py", base + "/__init__.py"}) {
            if (is_regular_file(host, candidate)) return candidate;
        }
        return std::nullopt;
    }

    auto base = (dir / std::string(source)).lexically_normal().generic_string();
    if (is_regular_file(host, base)) return base;
    for (const auto* ext : kResolveExtensions) {
        if (is_regular_file(host, base + ext)) return base + ext;
    }
    // "./util.js" written for a TypeScript sibling.
    if (base.ends_with(".js")) {
        auto stem = base.substr(0, base.size() - 3);
        for (const auto* ext : {".ts", ".tsx"}) {
            if (is_regular_file(host, stem + ext)) return stem + ext;
        }
    }
    for (const auto* ext : kResolveExtensions) {
        auto index = base + "/index" + ext;
        if (is_regular_file(host, index)) return index;
    }
    return std::nullopt;
}

auto extract_calls(std::string_view body, std::string_view self_name) -> std::vector<std::string> {
    static const std::regex call_re(R"(\b([A-Za-z_]\w*)\s*\()");
    static const std::unordered_set<std::string> keywords = {
        "if", "for", "while", "switch", "catch", "function", "return", "throw", "new",
        "typeof", "instanceof", "await", "super", "with", "elif", "and", "or", "not",
        "in", "def", "fn", "func", "match", "sizeof",
    };

    std::vector<std::string> calls;
    const std::string text(body);
    for (std::sregex_iterator it(text.begin(), text.end(), call_re), end; it != end; ++it) {
        auto name = (*it)[1].str();
        if (name == self_name || keywords.contains(name)) continue;
        push_unique(calls, std::move(name));
    }
    return calls;
}

auto analyze_dependencies(const Host& host, std::string_view file) -> Result<json> {
    auto source = read_source(host, file);
    if (!source) return std::unexpected(source.error());
    auto structure = ast::parse_structure(source->content, source->language);
    if (!structure) return std::unexpected(structure.error());

    auto imports = parse_imports(source->content, source->language);
    std::vector<std::string> internal;
    std::vector<std::string> external;
    auto imports_json = json::array();
    for (auto& imp : imports) {
        imp.resolved_path = resolve_import(host, imp.source, file, source->language);
        if (imp.resolved_path) {
            push_unique(internal, *imp.resolved_path);
        } else if (!is_local_source(imp.source)) {
            push_unique(external, imp.source);
        }

        json entry{
            {"source", imp.source},
            {"names", imp.names},
            {"isDefault", imp.is_default},
            {"isNamespace", imp.is_namespace},
        };
        if (imp.resolved_path) entry["resolvedPath"] = *imp.resolved_path;
        imports_json.push_back(std::move(entry));
    }

    return json{
        {"file", std::string(file)},
        {"imports", std::move(imports_json)},
        {"exports", exports_of(*structure, utils::split_lines(source->content))},
        {"externalDeps", external},
        {"internalDeps", internal},
    };
}

auto analyze_call_graph(const Host& host, std::string_view function_name, std::string_view file,
                        std::optional<int> depth) -> Result<json> {
    const int max_depth = clamp_depth(depth);
    auto source = read_source(host, file);
    if (!source) return std::unexpected(source.error());
    auto structure = ast::parse_structure(source->content, source->language);
    if (!structure) return std::unexpected(structure.error());

    auto find = [&](std::string_view name) -> const ast::CodeElement* {
        auto it = std::ranges::find_if(structure->functions,
                                       [&](const ast::CodeElement& el) { return el.name == name; });
        return it == structure->functions.end() ? nullptr : &*it;
    };
    if (!find(function_name)) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Function '" + std::string(function_name) + "' not found in " + std::string(file)));
    }

    struct Node {
        std::string name;
        int line = 0;
        std::vector<std::string> calls;
        std::vector<std::string> called_by;
    };
    std::vector<Node> nodes;
    std::unordered_set<std::string> visited;
    const auto lines = utils::split_lines(source->content);

    // Depth-first and confined to this file; depth counts edges from the root.
    auto visit = [&](auto& self, const std::string& name, int level) -> Result<void> {
        if (level > max_depth || visited.contains(name)) return ok_result();
        const auto* fn = find(name);
        if (!fn) return ok_result();
        if (auto cancelled = host.check_cancelled(); !cancelled) return cancelled;
        visited.insert(name);

        nodes.push_back(Node{name, fn->start_line, extract_calls(body_of(lines, *fn), name), {}});
        auto calls = nodes.back().calls;
        for (const auto& call : calls) {
            if (auto r = self(self, call, level + 1); !r) return r;
        }
        return ok_result();
    };
    if (auto r = visit(visit, std::string(function_name), 0); !r) {
        return std::unexpected(r.error());
    }

    for (const auto& node : nodes) {
        for (const auto& call : node.calls) {
            auto it = std::ranges::find_if(nodes, [&](const Node& n) { return n.name == call; });
            if (it != nodes.end()) push_unique(it->called_by, node.name);
        }
    }

    auto nodes_json = json::array();
    for (const auto& node : nodes) {
        nodes_json.push_back(json{
            {"name", node.name},
            {"file", std::string(file)},
            {"line", node.line},
            {"calls", node.calls},
            {"calledBy", node.called_by},
        });
    }
    return json{{"root", std::string(function_name)}, {"nodes", std::move(nodes_json)}, {"depth", max_depth}};
}

auto analyze_exports(const Host& host, std::string_view file) -> Result<json> {
    auto source = read_source(host, file);
    if (!source) return std::unexpected(source.error());
    auto structure = ast::parse_structure(source->content, source->language);
    if (!structure) return std::unexpected(structure.error());
    return exports_of(*structure, utils::split_lines(source->content));
}

auto analyze_structure(const Host& host, std::optional<std::string_view> dir, std::optional<int> depth)
    -> Result<json> {
    const int max_depth = clamp_depth(depth);
    auto root = host.resolve(dir.value_or("."));
    if (!root) return std::unexpected(root.error());

    std::size_t visited = 0;
    std::size_t analyzed = 0;

    auto build = [&](auto& self, const fs::path& path, int level) -> Result<json> {
        if (auto cancelled = host.check_cancelled(); !cancelled) {
            return std::unexpected(cancelled.error());
        }
        ++visited;
        auto rel = host.relative(path);
        auto name = rel == "." ? std::string(".") : path.filename().string();
        std::error_code ec;

        if (!fs::is_directory(path, ec)) {
            auto size = fs::file_size(path, ec);
            json entry{{"path", rel}, {"type", "file"}, {"name", name}, {"size", ec ? 0 : size}};
            auto lang = ast::detect_language_from_path(name);
            if (!ec && ast::is_parseable(lang) && analyzed < kMaxStructureFiles && size < kMaxFileSize) {
                auto content = host.read_for_scan(rel);
                if (!content) return std::unexpected(content.error());
                if (*content) {
                    if (auto structure = ast::parse_structure(**content, lang)) {
                        ++analyzed;
                        entry["language"] = std::string(ast::language_to_string(lang));
                        entry["functions"] = structure->functions.size();
                        entry["classes"] = structure->classes.size();
                        entry["exports"] = structure->exports.size();
                    }
                }
            }
            return entry;
        }

        json entry{{"path", rel}, {"type", "directory"}, {"name", name}};
        if (level >= max_depth) return entry;

        std::vector<fs::directory_entry> children;
        for (fs::directory_iterator it(path, fs::directory_options::skip_permission_denied, ec), end;
             !ec && it != end; it.increment(ec)) {
            children.push_back(*it);
        }
        std::ranges::sort(children, {}, [](const fs::directory_entry& e) { return e.path().filename(); });

        auto list = json::array();
        for (const auto& child : children) {
            if (visited >= kMaxFiles) break;
            auto child_name = child.path().filename().string();
            if (child_name.starts_with('.') || child_name == "node_modules") continue;
            if (security::is_sensitive_name(child_name)) continue;
            std::error_code type_ec;
            if (child.is_symlink(type_ec)) continue;
            auto sub = self(self, child.path(), level + 1);
            if (!sub) return std::unexpected(sub.error());
            list.push_back(std::move(*sub));
        }
        entry["children"] = std::move(list);
        return entry;
    };
    return build(build, *root, 0);
}

} // namespace ctxopt::sdk
