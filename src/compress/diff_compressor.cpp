#include "ctxopt/compress/compressors.hpp"

#include <regex>

#include "ctxopt/core/utils.hpp"
#include "ctxopt/text/tokens.hpp"

namespace ctxopt::compress {

auto DiffCompressor::supports(ContentType type) const -> bool {
    return type == ContentType::Diff;
}

auto DiffCompressor::compress(std::string_view content, const CompressOptions&) const
    -> CompressedResult {
    static const std::regex file_re(R"(^diff --git a/(.*) b/(.*)$)");

    std::vector<std::string> kept;
    std::size_t added = 0;
    std::size_t removed = 0;

    for (const auto& line : utils::split_lines(content)) {
        if (line.starts_with("diff --git")) {
            std::smatch m;
            if (std::regex_match(line, m, file_re)) {
                kept.push_back("\n## " + m[2].str());
            }
        } else if (line.starts_with("@@")) {
            kept.push_back(line);
        } else if (line.starts_with("+") && !line.starts_with("+++")) {
            ++added;
            if (utils::trim(line).size() > 1) kept.push_back(line);
        } else if (line.starts_with("-") && !line.starts_with("---")) {
            ++removed;
            if (utils::trim(line).size() > 1) kept.push_back(line);
        }
    }

    std::string compressed =
        "[diff] +" + std::to_string(added) + "/-" + std::to_string(removed) + " lines";
    for (const auto& line : kept) {
        compressed += "\n";
        compressed += line;
    }

    CompressedResult result;
    result.compressed = std::move(compressed);
    result.stats.original_tokens = text::estimate_tokens(content);
    result.stats.compressed_tokens = text::estimate_tokens(result.compressed);
    result.stats.technique = "hunks";
    return result;
}

} // namespace ctxopt::compress
