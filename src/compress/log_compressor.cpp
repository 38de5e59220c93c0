#include "ctxopt/compress/compressors.hpp"

#include <regex>
#include <unordered_map>

#include "ctxopt/core/utils.hpp"
#include "ctxopt/text/tokens.hpp"

namespace ctxopt::compress {

namespace {

constexpr std::size_t kSummaryItems = 5;

auto is_error_line(const std::string& line) -> bool {
    static const std::regex error_re(
        R"(\b(error|errors|err!|failed|failure|fatal|exception|panic|panicked)\b)",
        std::regex::ECMAScript | std::regex::icase);
    static const std::regex benign_re(R"(\b(0|no)\s+(errors?|failures?|failed)\b)",
                                      std::regex::ECMAScript | std::regex::icase);
    return std::regex_search(line, error_re) && !std::regex_search(line, benign_re);
}

auto is_warning_line(const std::string& line) -> bool {
    static const std::regex warn_re(R"(\b(warn|warning|warnings|deprecated)\b)",
                                    std::regex::ECMAScript | std::regex::icase);
    static const std::regex benign_re(R"(\b(0|no)\s+warnings?\b)",
                                      std::regex::ECMAScript | std::regex::icase);
    return std::regex_search(line, warn_re) && !std::regex_search(line, benign_re);
}

auto is_progress_noise(const std::string& line) -> bool {
    static const std::regex progress_re(R"(^\s*(\[?[=#>\-. ]*\]?\s*)?\d{1,3}(\.\d+)?%\s*(\|.*)?$)");
    return std::regex_search(line, progress_re);
}

/// Masks the parts of a log line that vary between otherwise identical
/// messages so repeats collapse onto one key.
auto normalize_line(const std::string& line) -> std::string {
    static const std::regex timestamp_re(
        R"(\d{4}-\d{2}-\d{2}[T ]\d{2}:\d{2}:\d{2}(\.\d+)?(Z|[+-]\d{2}:?\d{2})?)");
    static const std::regex time_re(R"(\b\d{2}:\d{2}:\d{2}(\.\d+)?\b)");
    static const std::regex hex_re(R"(\b0x[0-9a-fA-F]+\b|\b[0-9a-f]{8,}\b)");
    static const std::regex number_re(R"(\b\d+(\.\d+)?\b)");

    auto out = std::regex_replace(line, timestamp_re, "<ts>");
    out = std::regex_replace(out, time_re, "<ts>");
    out = std::regex_replace(out, hex_re, "<hex>");
    out = std::regex_replace(out, number_re, "<n>");
    return utils::trim(out);
}

} // anonymous namespace

auto LogCompressor::supports(ContentType type) const -> bool {
    return type == ContentType::Logs;
}

auto LogCompressor::compress(std::string_view content, const CompressOptions&) const
    -> CompressedResult {
    struct Entry {
        std::string first;
        std::size_t count = 0;
    };

    std::vector<std::string> order;
    std::unordered_map<std::string, Entry> seen;

    for (const auto& line : utils::split_lines(content)) {
        if (utils::trim(line).empty()) continue;
        bool important = is_error_line(line) || is_warning_line(line);
        if (!important && is_progress_noise(line)) continue;

        auto key = normalize_line(line);
        auto [it, inserted] = seen.try_emplace(key, Entry{line, 0});
        if (inserted) order.push_back(key);
        ++it->second.count;
    }

    std::vector<std::string> out;
    out.reserve(order.size());
    for (const auto& key : order) {
        const auto& entry = seen.at(key);
        if (entry.count > 1) {
            out.push_back(entry.first + " [x" + std::to_string(entry.count) + "]");
        } else {
            out.push_back(entry.first);
        }
    }

    CompressedResult result;
    result.compressed = utils::join(out, "\n");
    result.stats.original_tokens = text::estimate_tokens(content);
    result.stats.compressed_tokens = text::estimate_tokens(result.compressed);
    result.stats.technique = "dedupe";
    return result;
}

void to_json(json& j, const LogSummary& s) {
    j = json{
        {"summary", s.summary},
        {"stats", {
            {"totalLines", s.total_lines},
            {"errorCount", s.error_count},
            {"warningCount", s.warning_count},
        }},
    };
}

auto summarize_logs(std::string_view logs) -> LogSummary {
    LogSummary summary;
    auto lines = utils::split_lines(logs);
    summary.total_lines = lines.size();

    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::unordered_map<std::string, bool> distinct;
    std::string last_line;

    for (const auto& line : lines) {
        auto trimmed = utils::trim(line);
        if (trimmed.empty()) continue;
        last_line = trimmed;

        if (is_error_line(line)) {
            ++summary.error_count;
            if (distinct.try_emplace("e:" + normalize_line(line), true).second) {
                errors.push_back(trimmed);
            }
        } else if (is_warning_line(line)) {
            ++summary.warning_count;
            if (distinct.try_emplace("w:" + normalize_line(line), true).second) {
                warnings.push_back(trimmed);
            }
        }
    }

    std::string text = std::to_string(summary.total_lines) + " lines, " +
                       std::to_string(summary.error_count) + " errors, " +
                       std::to_string(summary.warning_count) + " warnings";

    auto append_list = [&](std::string_view title, const std::vector<std::string>& items) {
        if (items.empty()) return;
        text += "\n";
        text += title;
        text += ":";
        for (std::size_t i = 0; i < items.size() && i < kSummaryItems; ++i) {
            text += "\n  - " + items[i];
        }
        if (items.size() > kSummaryItems) {
            text += "\n  ... +" + std::to_string(items.size() - kSummaryItems) + " more";
        }
    };
    append_list("Errors", errors);
    append_list("Warnings", warnings);

    if (!last_line.empty()) {
        text += "\nLast: " + last_line;
    }

    summary.summary = std::move(text);
    return summary;
}

} // namespace ctxopt::compress
