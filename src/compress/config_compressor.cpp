#include "ctxopt/compress/compressors.hpp"

#include "ctxopt/core/utils.hpp"
#include "ctxopt/text/tokens.hpp"

namespace ctxopt::compress {

namespace {

auto is_comment_line(std::string_view trimmed) -> bool {
    return trimmed.starts_with("#") || trimmed.starts_with(";") || trimmed.starts_with("//");
}

auto rstrip(const std::string& line) -> std::string {
    auto end = line.find_last_not_of(" \t");
    return end == std::string::npos ? std::string{} : line.substr(0, end + 1);
}

} // anonymous namespace

auto ConfigCompressor::supports(ContentType type) const -> bool {
    return type == ContentType::Config;
}

auto ConfigCompressor::compress(std::string_view content, const CompressOptions&) const
    -> CompressedResult {
    CompressedResult result;
    result.stats.original_tokens = text::estimate_tokens(content);

    auto parsed = json::parse(content, nullptr, /*allow_exceptions=*/false);
    if (!parsed.is_discarded() && (parsed.is_object() || parsed.is_array())) {
        result.compressed = parsed.dump();
        result.stats.technique = "minify";
    } else {
        std::vector<std::string> kept;
        for (const auto& line : utils::split_lines(content)) {
            auto trimmed = utils::trim(line);
            if (trimmed.empty() || is_comment_line(trimmed)) continue;
            kept.push_back(rstrip(line));
        }
        result.compressed = utils::join(kept, "\n");
        result.stats.technique = "strip-comments";
    }

    result.stats.compressed_tokens = text::estimate_tokens(result.compressed);
    return result;
}

} // namespace ctxopt::compress
