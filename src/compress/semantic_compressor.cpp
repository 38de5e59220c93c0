#include "ctxopt/compress/compressors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <unordered_map>
#include <unordered_set>

#include "ctxopt/core/utils.hpp"
#include "ctxopt/text/tokens.hpp"

namespace ctxopt::compress {

namespace {

/// Below this many tokens there is nothing worth dropping.
constexpr std::size_t kMinTokens = 100;

constexpr double kTfidfWeight = 0.4;
constexpr double kPositionWeight = 0.3;
constexpr double kKeywordWeight = 0.3;

struct Segment {
    std::string text;
    std::size_t start_line = 0;
    double position = 0.0;
    std::size_t tokens = 0;
    bool preserved = false;
    double importance = 0.0;
};

auto has_error_indicators(const std::string& text) -> bool {
    static const std::regex error_re(
        R"(\b(error|Error|ERROR|fail|Fail|FAIL|failed|exception|Exception|EXCEPTION|panic|crash|fatal|critical)\b)");
    return std::regex_search(text, error_re);
}

/// U-shaped weight: the first and last tenth of a document matter most.
auto position_weight(double position) -> double {
    if (position <= 0.1 || position >= 0.9) return 1.0;
    if (position <= 0.2 || position >= 0.8) return 0.85;
    if (position <= 0.3 || position >= 0.7) return 0.7;
    return 0.6;
}

auto keyword_boost(const std::string& text) -> double {
    struct Boost {
        std::regex pattern;
        double weight;
    };
    static const std::vector<Boost> boosts = {
        {std::regex(R"(\b(must|MUST|should|SHOULD|required|Required|REQUIRED|important|Important|IMPORTANT|note|Note|NOTE|warning|Warning|WARNING|todo|TODO|fixme|FIXME)\b)"), 0.3},
        {std::regex("```|`[^`]+`"), 0.2},
        {std::regex(R"((^|\n)(#{1,6}\s|[-*+]\s|\d+\.\s|>\s))"), 0.15},
        {std::regex(R"(\b(function|class|interface|type|const|let|var|async|await|return|import|export|def|fn|struct|impl|pub|private|public|protected)\b)"), 0.1},
        {std::regex(R"(\?\s*($|\n))"), 0.15},
        {std::regex(R"(https?://\S+|@\w+|#\w+)"), 0.1},
    };

    double boost = has_error_indicators(text) ? 0.4 : 0.0;
    for (const auto& b : boosts) {
        if (std::regex_search(text, b.pattern)) boost += b.weight;
    }
    return std::min(boost, 1.0);
}

auto is_stopword(const std::string& word) -> bool {
    static const std::unordered_set<std::string> stopwords = {
        "an", "the", "and", "or", "but", "in", "on", "at", "to", "for", "of", "with", "by",
        "from", "as", "is", "was", "are", "were", "been", "be", "have", "has", "had", "do",
        "does", "did", "will", "would", "could", "should", "may", "might", "must", "shall",
        "can", "it", "its", "this", "that", "these", "those", "you", "he", "she", "we",
        "they", "me", "him", "her", "us", "them", "my", "your", "his", "our", "their",
        "what", "which", "who", "when", "where", "why", "how", "all", "each", "if", "then",
        "else", "so", "than", "too", "very", "just", "not", "no", "only", "also", "there",
        "here", "into", "out", "up", "down", "about", "over", "such", "some", "any",
    };
    return stopwords.contains(word);
}

auto tokenize_words(const std::string& text) -> std::vector<std::string> {
    std::vector<std::string> words;
    std::string current;
    auto flush = [&] {
        if (current.size() >= 2 && !is_stopword(current)) words.push_back(current);
        current.clear();
    };
    for (char c : text) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '_') {
            current.push_back(static_cast<char>(std::tolower(uc)));
        } else {
            flush();
        }
    }
    flush();
    return words;
}

/// Mean TF-IDF of a segment's terms, squashed into [0, 1].
auto tfidf_scores(const std::vector<Segment>& segments) -> std::vector<double> {
    std::vector<std::vector<std::string>> tokens;
    tokens.reserve(segments.size());
    std::unordered_map<std::string, std::size_t> df;

    for (const auto& s : segments) {
        tokens.push_back(tokenize_words(s.text));
        std::unordered_set<std::string> unique(tokens.back().begin(), tokens.back().end());
        for (const auto& term : unique) ++df[term];
    }

    auto n = static_cast<double>(segments.size());
    std::vector<double> scores;
    scores.reserve(segments.size());
    for (const auto& words : tokens) {
        if (words.empty()) {
            scores.push_back(0.0);
            continue;
        }
        std::unordered_map<std::string, std::size_t> counts;
        for (const auto& w : words) ++counts[w];

        double sum = 0.0;
        for (const auto& [term, count] : counts) {
            double tf = static_cast<double>(count) / static_cast<double>(words.size());
            double idf = std::log(n / static_cast<double>(df[term]));
            sum += tf * idf;
        }
        double avg = sum / static_cast<double>(counts.size());
        scores.push_back(std::min(avg / 2.0, 1.0));
    }
    return scores;
}

/// Paragraphs separated by blank lines; fenced code blocks stay whole;
/// paragraphs with error indicators are split into single lines.
auto segment_content(std::string_view content) -> std::vector<Segment> {
    auto lines = utils::split_lines(content);
    auto total = static_cast<double>(lines.size());
    std::vector<Segment> segments;

    auto make = [&](std::string body, std::size_t start) {
        Segment s;
        s.text = std::move(body);
        s.start_line = start;
        s.position = total > 0 ? static_cast<double>(start) / total : 0.0;
        s.tokens = text::estimate_tokens(s.text);
        return s;
    };

    std::vector<std::string> current;
    std::size_t start = 0;
    bool in_fence = false;
    std::string fence;

    auto flush_paragraph = [&] {
        if (current.empty()) return;
        auto paragraph = utils::trim(utils::join(current, "\n"));
        if (!paragraph.empty()) {
            if (current.size() > 1 && has_error_indicators(paragraph)) {
                for (std::size_t j = 0; j < current.size(); ++j) {
                    auto line = utils::trim(current[j]);
                    if (!line.empty()) segments.push_back(make(std::move(line), start + j));
                }
            } else {
                segments.push_back(make(std::move(paragraph), start));
            }
        }
        current.clear();
    };

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        auto trimmed = utils::trim(line);

        if (trimmed.starts_with("```") || trimmed.starts_with("~~~")) {
            auto marker = trimmed.substr(0, 3);
            if (!in_fence) {
                flush_paragraph();
                current = {line};
                start = i;
                in_fence = true;
                fence = marker;
                continue;
            }
            if (marker == fence) {
                current.push_back(line);
                segments.push_back(make(utils::join(current, "\n"), start));
                current.clear();
                start = i + 1;
                in_fence = false;
                continue;
            }
        }

        if (in_fence) {
            current.push_back(line);
            continue;
        }

        if (trimmed.empty()) {
            flush_paragraph();
            start = i + 1;
            continue;
        }
        current.push_back(line);
    }

    if (in_fence) {
        auto block = utils::trim(utils::join(current, "\n"));
        if (!block.empty()) segments.push_back(make(std::move(block), start));
    } else {
        flush_paragraph();
    }
    return segments;
}

auto unchanged(std::string_view content, std::size_t tokens, std::string technique)
    -> CompressedResult {
    CompressedResult result;
    result.compressed = std::string(content);
    result.stats.original_tokens = tokens;
    result.stats.compressed_tokens = tokens;
    result.stats.technique = std::move(technique);
    return result;
}

} // anonymous namespace

auto SemanticCompressor::supports(ContentType type) const -> bool {
    return type == ContentType::Generic || type == ContentType::Code || type == ContentType::Logs;
}

auto SemanticCompressor::compress(std::string_view content, const CompressOptions& opts) const
    -> CompressedResult {
    auto original_tokens = text::estimate_tokens(content);
    if (original_tokens < kMinTokens) {
        return unchanged(content, original_tokens, "semantic (too small)");
    }

    auto segments = segment_content(content);
    if (segments.size() <= 1) {
        return unchanged(content, original_tokens, "semantic (single segment)");
    }

    auto ratio = opts.target_ratio.value_or(kDefaultRatio);
    auto target = static_cast<std::size_t>(std::floor(static_cast<double>(original_tokens) * ratio));

    auto tfidf = tfidf_scores(segments);
    for (std::size_t i = 0; i < segments.size(); ++i) {
        auto& s = segments[i];
        s.preserved = has_error_indicators(s.text);
        s.importance = kTfidfWeight * tfidf[i] + kPositionWeight * position_weight(s.position) +
                       kKeywordWeight * keyword_boost(s.text);
    }

    std::vector<const Segment*> selected;
    std::vector<const Segment*> regular;
    std::size_t used = 0;
    for (const auto& s : segments) {
        if (s.preserved) {
            selected.push_back(&s);
            used += s.tokens;
        } else {
            regular.push_back(&s);
        }
    }

    std::ranges::stable_sort(regular, [](const Segment* a, const Segment* b) {
        return a->importance > b->importance;
    });
    for (const auto* s : regular) {
        if (used >= target) break;
        if (used + s->tokens <= target) {
            selected.push_back(s);
            used += s->tokens;
        }
    }

    std::ranges::sort(selected, [](const Segment* a, const Segment* b) {
        return a->start_line < b->start_line;
    });

    std::vector<std::string> parts;
    parts.reserve(selected.size());
    for (const auto* s : selected) parts.push_back(s->text);

    CompressedResult result;
    result.compressed = utils::join(parts, "\n\n");
    result.stats.original_tokens = original_tokens;
    result.stats.compressed_tokens = text::estimate_tokens(result.compressed);
    result.stats.technique = "semantic";
    return result;
}

} // namespace ctxopt::compress
