#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "ctxopt/text/content_type.hpp"

namespace ctxopt::compress {

using json = nlohmann::json;
using text::ContentType;

struct CompressOptions {
    /// Fraction of the original tokens to keep, for compressors that honour it.
    std::optional<double> target_ratio;
};

struct CompressionStats {
    std::size_t original_tokens = 0;
    std::size_t compressed_tokens = 0;
    std::string technique;

    /// round((1 - compressed / original) * 100); 0 for empty input.
    [[nodiscard]] auto reduction_percent() const -> int;
};

struct CompressedResult {
    std::string compressed;
    CompressionStats stats;
};

/// `{ compressed, stats: { original, compressed, reductionPercent } }`
void to_json(json& j, const CompressedResult& r);

/// Abstract base class for content compressors.
class Compressor {
public:
    virtual ~Compressor() = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
    [[nodiscard]] virtual auto supports(ContentType type) const -> bool = 0;
    virtual auto compress(std::string_view content, const CompressOptions& opts) const
        -> CompressedResult = 0;
};

/// Ordered set of compressors. The first compressor that supports a content
/// type handles it; the last registered one is the fallback.
class CompressorRegistry {
public:
    void add(std::unique_ptr<Compressor> compressor);

    [[nodiscard]] auto for_type(ContentType type) const -> const Compressor&;

    /// Compresses with the compressor for `type`, or for the detected type
    /// when none is given. The technique is reported as "<type>:<name>".
    auto compress(std::string_view content, std::optional<ContentType> type = std::nullopt,
                  const CompressOptions& opts = {}) const -> CompressedResult;

    [[nodiscard]] auto size() const -> std::size_t { return compressors_.size(); }

    /// Registry with logs, stacktrace, diff, config and generic compressors.
    static auto with_defaults() -> CompressorRegistry;

private:
    std::vector<std::unique_ptr<Compressor>> compressors_;
};

} // namespace ctxopt::compress
