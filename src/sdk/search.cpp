#include "ctxopt/sdk/search.hpp"

#include <filesystem>
#include <memory>
#include <regex>

#include <re2/re2.h>

#include "ctxopt/ast/parser.hpp"
#include "ctxopt/core/logger.hpp"
#include "ctxopt/core/utils.hpp"

namespace ctxopt::sdk {

namespace {

auto bounded(const std::string& line) -> std::string {
    return line.size() > kMaxScanLine ? line.substr(0, kMaxScanLine) : line;
}

/// User patterns go through RE2, whose matching time is linear in the input,
/// so no pattern can stall a scan past the execution deadline.
auto compile(std::string_view pattern) -> Result<std::unique_ptr<re2::RE2>> {
    re2::RE2::Options options;
    options.set_log_errors(false);
    auto re = std::make_unique<re2::RE2>(re2::StringPiece(pattern.data(), pattern.size()), options);
    if (!re->ok()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Invalid regex pattern: " + std::string(pattern), re->error()));
    }
    return re;
}

/// Appends every match of `re` in `line`; false once `limit` is reached.
auto collect_matches(const re2::RE2& re, const std::string& file, int line_no,
                     const std::string& line, json& out, std::size_t limit) -> bool {
    const auto text = bounded(line);
    const re2::StringPiece input(text.data(), text.size());
    re2::StringPiece match;
    std::size_t pos = 0;
    while (pos <= text.size() && re.Match(input, pos, text.size(), re2::RE2::UNANCHORED, &match, 1)) {
        if (out.size() >= limit) return false;
        auto offset = static_cast<std::size_t>(match.data() - input.data());
        out.push_back(json{
            {"file", file},
            {"line", line_no},
            {"column", offset + 1},
            {"content", utils::trim(line)},
            {"match", std::string(match.data(), match.size())},
        });
        if (match.empty()) break;
        pos = offset + match.size();
    }
    return out.size() < limit;
}

auto symbol_patterns(std::string_view symbol) {
    auto escaped = utils::escape_regex(symbol);
    struct Patterns {
        std::regex definition;
        std::regex import;
        std::regex usage;
    };
    return Patterns{
        std::regex(R"((?:function|class|const|let|var|interface|type|def|fn|func|struct|enum|trait)\s+)" +
                   escaped + R"(\b)"),
        std::regex(R"(import\s+(?:\{[^}]*\b)" + escaped + R"(\b[^}]*\}|)" + escaped +
                   R"(\b)|from\s+\S+\s+import\s+.*\b)" + escaped + R"(\b)"),
        std::regex(R"(\b)" + escaped + R"(\b)"),
    };
}

} // anonymous namespace

auto search_grep(const Host& host, std::string_view pattern, std::optional<std::string_view> glob)
    -> Result<json> {
    auto re = compile(pattern);
    if (!re) return std::unexpected(re.error());
    auto files = host.glob(glob.value_or(kCodeGlob));
    if (!files) return std::unexpected(files.error());

    auto matches = json::array();
    for (const auto& file : *files) {
        if (matches.size() >= kMaxResults) break;
        auto content = host.read_for_scan(file);
        if (!content) return std::unexpected(content.error());
        if (!*content) continue;

        int line_no = 0;
        for (const auto& line : utils::split_lines(**content)) {
            ++line_no;
            if (auto cancelled = host.check_cancelled(); !cancelled) {
                return std::unexpected(cancelled.error());
            }
            if (!collect_matches(**re, file, line_no, line, matches, kMaxResults)) break;
        }
    }

    auto total = matches.size();
    return json{
        {"matches", std::move(matches)},
        {"totalMatches", total},
        {"filesSearched", files->size()},
    };
}

auto search_symbols(const Host& host, std::string_view query, std::optional<std::string_view> glob)
    -> Result<json> {
    auto files = host.glob(glob.value_or(kCodeGlob));
    if (!files) return std::unexpected(files.error());

    auto symbols = json::array();
    for (const auto& file : *files) {
        if (symbols.size() >= kMaxResults) break;
        auto lang = ast::detect_language_from_path(file);
        if (!ast::is_parseable(lang)) continue;
        auto content = host.read_for_scan(file);
        if (!content) return std::unexpected(content.error());
        if (!*content) continue;

        auto structure = ast::parse_structure(**content, lang);
        if (!structure) continue;
        for (const auto& el : ast::search_elements(*structure, query)) {
            if (symbols.size() >= kMaxResults) break;
            json entry{
                {"name", el.name},
                {"type", std::string(ast::element_type_to_string(el.type))},
                {"file", file},
                {"line", el.start_line},
            };
            if (el.signature) entry["signature"] = *el.signature;
            symbols.push_back(std::move(entry));
        }
    }

    auto total = symbols.size();
    return json{{"symbols", std::move(symbols)}, {"totalMatches", total}};
}

auto search_files(const Host& host, std::string_view pattern) -> Result<json> {
    auto files = host.glob(pattern, kMaxResults);
    if (!files) return std::unexpected(files.error());

    auto matches = json::array();
    for (const auto& file : *files) {
        auto resolved = host.resolve(file);
        if (!resolved) continue;
        std::error_code ec;
        auto size = std::filesystem::file_size(*resolved, ec);
        if (ec) continue;
        std::filesystem::path p(file);
        matches.push_back(json{
            {"path", file},
            {"name", p.filename().string()},
            {"extension", p.extension().string()},
            {"size", size},
        });
    }

    auto total = matches.size();
    return json{{"files", std::move(matches)}, {"totalMatches", total}};
}

auto search_references(const Host& host, std::string_view symbol,
                       std::optional<std::string_view> glob) -> Result<json> {
    if (utils::trim(symbol).empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument, "Symbol must not be empty"));
    }
    auto files = host.glob(glob.value_or(kCodeGlob));
    if (!files) return std::unexpected(files.error());

    const auto patterns = symbol_patterns(symbol);
    auto references = json::array();
    auto add = [&](const std::string& file, int line_no, long column, const std::string& line,
                   std::string_view type) {
        references.push_back(json{
            {"file", file},
            {"line", line_no},
            {"column", column + 1},
            {"context", utils::trim(line)},
            {"type", std::string(type)},
        });
    };

    for (const auto& file : *files) {
        if (references.size() >= kMaxResults) break;
        auto content = host.read_for_scan(file);
        if (!content) return std::unexpected(content.error());
        if (!*content) continue;

        int line_no = 0;
        for (const auto& raw : utils::split_lines(**content)) {
            ++line_no;
            if (references.size() >= kMaxResults) break;
            if (auto cancelled = host.check_cancelled(); !cancelled) {
                return std::unexpected(cancelled.error());
            }
            auto line = bounded(raw);

            try {
                std::smatch m;
                if (std::regex_search(line, m, patterns.definition)) {
                    add(file, line_no, m.position(0), raw, "definition");
                    continue;
                }
                if (std::regex_search(line, m, patterns.import)) {
                    add(file, line_no, m.position(0), raw, "import");
                    continue;
                }
                for (std::sregex_iterator it(line.begin(), line.end(), patterns.usage), end;
                     it != end && references.size() < kMaxResults; ++it) {
                    add(file, line_no, it->position(0), raw, "usage");
                }
            } catch (const std::regex_error& e) {
                LOG_DEBUG("Reference scan abandoned in {}:{}: {}", file, line_no, e.what());
            }
        }
    }
    return references;
}

} // namespace ctxopt::sdk
