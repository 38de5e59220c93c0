#include "ctxopt/text/content_type.hpp"

#include <regex>
#include <string>

#include "ctxopt/core/utils.hpp"

namespace ctxopt::text {

namespace {

auto non_empty_lines(std::string_view content) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (auto& line : utils::split_lines(content)) {
        if (line.find_first_not_of(" \t") != std::string::npos) out.push_back(std::move(line));
    }
    return out;
}

auto count_matching(const std::vector<std::string>& lines, const std::regex& re) -> std::size_t {
    std::size_t n = 0;
    for (const auto& line : lines) {
        if (std::regex_search(line, re)) ++n;
    }
    return n;
}

auto looks_like_diff(const std::vector<std::string>& lines) -> bool {
    bool has_header = false;
    bool has_hunk = false;
    for (const auto& line : lines) {
        if (line.starts_with("diff --git") || line.starts_with("+++ ") ||
            line.starts_with("--- ")) {
            has_header = true;
        }
        if (line.starts_with("@@ ")) has_hunk = true;
    }
    return has_header && has_hunk;
}

auto looks_like_stacktrace(std::string_view content, const std::vector<std::string>& lines) -> bool {
    if (content.find("Traceback (most recent call last)") != std::string_view::npos) return true;
    if (content.find("panicked at") != std::string_view::npos) return true;
    static const std::regex frame(R"(^\s+at\s+\S+.*(\(.*:\d+(:\d+)?\)|:\d+:\d+)\s*$)");
    static const std::regex goroutine(R"(^goroutine \d+ \[)");
    return count_matching(lines, frame) >= 2 || count_matching(lines, goroutine) >= 1;
}

auto looks_like_config(std::string_view content, const std::vector<std::string>& lines) -> bool {
    auto trimmed = utils::trim(content);
    if ((trimmed.starts_with("{") || trimmed.starts_with("[")) &&
        nlohmann::json::accept(trimmed)) {
        return true;
    }
    if (lines.size() < 2) return false;
    static const std::regex yaml_line(R"(^\s*(-\s+)?[\w.\-"']+\s*:(\s|$))");
    static const std::regex ini_line(R"(^\s*(\[[^\]]+\]|[\w.\-]+\s*=\s*.*)$)");
    static const std::regex comment(R"(^\s*#)");
    auto structured = count_matching(lines, yaml_line) + count_matching(lines, ini_line) +
                      count_matching(lines, comment);
    return structured * 10 >= lines.size() * 8;
}

auto looks_like_logs(const std::vector<std::string>& lines) -> bool {
    if (lines.size() < 2) return false;
    static const std::regex log_line(
        R"((^\[?\d{4}-\d{2}-\d{2}[T ]\d{2}:\d{2})|(^\[?\d{2}:\d{2}:\d{2})|)"
        R"(\b(ERROR|WARN|WARNING|INFO|DEBUG|TRACE|FATAL)\b|^\s*(npm ERR!|error\[|warning:))");
    return count_matching(lines, log_line) * 10 >= lines.size() * 3;
}

auto looks_like_code(const std::vector<std::string>& lines) -> bool {
    static const std::regex code_line(
        R"(^\s*(import|export|from|function|async|def|class|interface|type|const|let|var|)"
        R"(fn|func|pub|impl|struct|enum|package|use|return|if|for|while|#include|namespace|)"
        R"(public|private|protected|static)\b|[;{}]\s*$)");
    return count_matching(lines, code_line) * 10 >= lines.size() * 4;
}

} // anonymous namespace

auto content_type_to_string(ContentType type) -> std::string_view {
    switch (type) {
        case ContentType::Logs: return "logs";
        case ContentType::Stacktrace: return "stacktrace";
        case ContentType::Config: return "config";
        case ContentType::Diff: return "diff";
        case ContentType::Code: return "code";
        case ContentType::Generic: return "generic";
    }
    return "generic";
}

auto content_type_from_string(std::string_view name) -> ContentType {
    auto lower = utils::to_lower(name);
    if (lower == "logs" || lower == "log" || lower == "build") return ContentType::Logs;
    if (lower == "stacktrace" || lower == "stack") return ContentType::Stacktrace;
    if (lower == "config") return ContentType::Config;
    if (lower == "diff") return ContentType::Diff;
    if (lower == "code") return ContentType::Code;
    return ContentType::Generic;
}

auto detect_content_type(std::string_view content) -> ContentType {
    auto lines = non_empty_lines(content);
    if (lines.empty()) return ContentType::Generic;

    if (looks_like_diff(lines)) return ContentType::Diff;
    if (looks_like_stacktrace(content, lines)) return ContentType::Stacktrace;
    if (looks_like_config(content, lines)) return ContentType::Config;
    if (looks_like_logs(lines)) return ContentType::Logs;
    if (looks_like_code(lines)) return ContentType::Code;
    return ContentType::Generic;
}

} // namespace ctxopt::text
