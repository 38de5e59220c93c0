#include "ctxopt/compress/compressor.hpp"
#include "ctxopt/compress/compressors.hpp"

#include <cmath>

#include "ctxopt/core/logger.hpp"
#include "ctxopt/text/tokens.hpp"

namespace ctxopt::compress {

auto CompressionStats::reduction_percent() const -> int {
    if (original_tokens == 0) return 0;
    auto ratio = static_cast<double>(compressed_tokens) / static_cast<double>(original_tokens);
    return static_cast<int>(std::lround((1.0 - ratio) * 100.0));
}

void to_json(json& j, const CompressedResult& r) {
    j = json{
        {"compressed", r.compressed},
        {"stats", {
            {"original", r.stats.original_tokens},
            {"compressed", r.stats.compressed_tokens},
            {"reductionPercent", r.stats.reduction_percent()},
        }},
    };
}

void CompressorRegistry::add(std::unique_ptr<Compressor> compressor) {
    compressors_.push_back(std::move(compressor));
}

auto CompressorRegistry::for_type(ContentType type) const -> const Compressor& {
    for (const auto& c : compressors_) {
        if (c->supports(type)) return *c;
    }
    return *compressors_.back();
}

auto CompressorRegistry::compress(std::string_view content, std::optional<ContentType> type,
                                  const CompressOptions& opts) const -> CompressedResult {
    auto resolved = type.value_or(text::detect_content_type(content));
    if (compressors_.empty()) {
        return CompressedResult{std::string(content),
                                {text::estimate_tokens(content), text::estimate_tokens(content), "none"}};
    }

    const auto& compressor = for_type(resolved);
    auto result = compressor.compress(content, opts);
    result.stats.technique =
        std::string(text::content_type_to_string(resolved)) + ":" + result.stats.technique;
    LOG_DEBUG("Compressed {} tokens to {} ({})", result.stats.original_tokens,
              result.stats.compressed_tokens, result.stats.technique);
    return result;
}

auto CompressorRegistry::with_defaults() -> CompressorRegistry {
    CompressorRegistry registry;
    registry.add(std::make_unique<LogCompressor>());
    registry.add(std::make_unique<StacktraceCompressor>());
    registry.add(std::make_unique<DiffCompressor>());
    registry.add(std::make_unique<ConfigCompressor>());
    registry.add(std::make_unique<GenericCompressor>());
    return registry;
}

} // namespace ctxopt::compress
