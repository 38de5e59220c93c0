#include "ctxopt/compress/compressors.hpp"

#include "ctxopt/core/utils.hpp"
#include "ctxopt/text/tokens.hpp"

namespace ctxopt::compress {

auto GenericCompressor::compress(std::string_view content, const CompressOptions&) const
    -> CompressedResult {
    std::vector<std::string> kept;
    bool previous_blank = true;

    for (const auto& line : utils::split_lines(content)) {
        auto end = line.find_last_not_of(" \t");
        std::string stripped = end == std::string::npos ? std::string{} : line.substr(0, end + 1);

        if (stripped.empty()) {
            if (!previous_blank) kept.emplace_back();
            previous_blank = true;
            continue;
        }
        if (!kept.empty() && kept.back() == stripped) continue;

        kept.push_back(std::move(stripped));
        previous_blank = false;
    }
    while (!kept.empty() && kept.back().empty()) kept.pop_back();

    CompressedResult result;
    result.compressed = utils::join(kept, "\n");
    result.stats.original_tokens = text::estimate_tokens(content);
    result.stats.compressed_tokens = text::estimate_tokens(result.compressed);
    result.stats.technique = "whitespace";
    return result;
}

} // namespace ctxopt::compress
