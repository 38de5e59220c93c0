#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "ctxopt/compress/compressor.hpp"

namespace ctxopt::compress {

/// Collapses repeated log lines (after masking timestamps, numbers and hex
/// ids) into one line with a repeat count, and always keeps error and
/// warning lines.
class LogCompressor : public Compressor {
public:
    [[nodiscard]] auto name() const -> std::string_view override { return "logs"; }
    [[nodiscard]] auto supports(ContentType type) const -> bool override;
    auto compress(std::string_view content, const CompressOptions& opts) const
        -> CompressedResult override;
};

/// Keeps the error message and the first application frames of each trace;
/// library and runtime-internal frames are counted, not shown.
class StacktraceCompressor : public Compressor {
public:
    [[nodiscard]] auto name() const -> std::string_view override { return "stacktrace"; }
    [[nodiscard]] auto supports(ContentType type) const -> bool override;
    auto compress(std::string_view content, const CompressOptions& opts) const
        -> CompressedResult override;
};

/// Keeps file headers, hunk headers and non-trivial changed lines, prefixed
/// by a `[diff] +A/-R lines` summary.
class DiffCompressor : public Compressor {
public:
    [[nodiscard]] auto name() const -> std::string_view override { return "diff"; }
    [[nodiscard]] auto supports(ContentType type) const -> bool override;
    auto compress(std::string_view content, const CompressOptions& opts) const
        -> CompressedResult override;
};

/// Minifies JSON; strips comments and blank lines from other config text.
class ConfigCompressor : public Compressor {
public:
    [[nodiscard]] auto name() const -> std::string_view override { return "config"; }
    [[nodiscard]] auto supports(ContentType type) const -> bool override;
    auto compress(std::string_view content, const CompressOptions& opts) const
        -> CompressedResult override;
};

/// Whitespace normalisation and consecutive-duplicate removal. Supports
/// every content type, so it is registered last as the fallback.
class GenericCompressor : public Compressor {
public:
    [[nodiscard]] auto name() const -> std::string_view override { return "generic"; }
    [[nodiscard]] auto supports(ContentType) const -> bool override { return true; }
    auto compress(std::string_view content, const CompressOptions& opts) const
        -> CompressedResult override;
};

/// Extractive compression: splits content into segments (paragraphs, code
/// fences, error lines), scores them by TF-IDF, position and keywords, and
/// keeps the best segments up to `target_ratio` of the original tokens in
/// their original order. Segments with error indicators are always kept.
class SemanticCompressor : public Compressor {
public:
    static constexpr double kDefaultRatio = 0.5;

    [[nodiscard]] auto name() const -> std::string_view override { return "semantic"; }
    [[nodiscard]] auto supports(ContentType type) const -> bool override;
    auto compress(std::string_view content, const CompressOptions& opts) const
        -> CompressedResult override;
};

struct LogSummary {
    std::string summary;
    std::size_t total_lines = 0;
    std::size_t error_count = 0;
    std::size_t warning_count = 0;
};

/// `{ summary, stats: { totalLines, errorCount, warningCount } }`
void to_json(json& j, const LogSummary& s);

/// Short overview of build/test/runtime log output: counts, the first
/// distinct errors and warnings, and the final status line when present.
auto summarize_logs(std::string_view logs) -> LogSummary;

} // namespace ctxopt::compress
