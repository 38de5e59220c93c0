#include "ctxopt/sdk/glob.hpp"

#include <algorithm>

namespace ctxopt::sdk {

namespace {

/// Index of the '}' closing the '{' at `open`, or npos.
auto matching_brace(std::string_view s, std::size_t open) -> std::size_t {
    int depth = 0;
    for (std::size_t i = open; i < s.size(); ++i) {
        if (s[i] == '{') ++depth;
        else if (s[i] == '}' && --depth == 0) return i;
    }
    return std::string_view::npos;
}

/// Splits the body of a brace group on top-level commas.
auto split_alternatives(std::string_view body) -> std::vector<std::string> {
    std::vector<std::string> parts;
    int depth = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i < body.size(); ++i) {
        if (body[i] == '{') ++depth;
        else if (body[i] == '}') --depth;
        else if (body[i] == ',' && depth == 0) {
            parts.emplace_back(body.substr(start, i - start));
            start = i + 1;
        }
    }
    parts.emplace_back(body.substr(start));
    return parts;
}

auto literal_prefix_dir(std::string_view pattern) -> std::string {
    auto wildcard = pattern.find_first_of("*?[{");
    auto literal = pattern.substr(0, wildcard);
    auto slash = literal.rfind('/');
    if (slash == std::string_view::npos) return {};
    return std::string(literal.substr(0, slash));
}

} // anonymous namespace

auto expand_braces(std::string_view pattern) -> std::vector<std::string> {
    auto open = pattern.find('{');
    if (open == std::string_view::npos) return {std::string(pattern)};
    auto close = matching_brace(pattern, open);
    if (close == std::string_view::npos) return {std::string(pattern)};

    auto head = pattern.substr(0, open);
    auto body = pattern.substr(open + 1, close - open - 1);
    auto tail = pattern.substr(close + 1);

    std::vector<std::string> out;
    for (const auto& alt : split_alternatives(body)) {
        std::string combined;
        combined.reserve(head.size() + alt.size() + tail.size());
        combined.append(head).append(alt).append(tail);
        for (auto& expanded : expand_braces(combined)) {
            if (std::ranges::find(out, expanded) == out.end()) out.push_back(std::move(expanded));
        }
    }
    return out;
}

auto glob_to_regex(std::string_view pattern) -> std::string {
    std::string re;
    re.reserve(pattern.size() * 2);
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        switch (c) {
            case '*':
                if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                    bool at_segment_start = i == 0 || pattern[i - 1] == '/';
                    if (at_segment_start && i + 2 < pattern.size() && pattern[i + 2] == '/') {
                        re += "(?:.*/)?";
                        i += 2;
                    } else {
                        re += ".*";
                        ++i;
                    }
                } else {
                    re += "[^/]*";
                }
                break;
            case '?':
                re += "[^/]";
                break;
            case '[': {
                auto close = pattern.find(']', i + 1);
                if (close == std::string_view::npos) {
                    re += "\\[";
                    break;
                }
                auto cls = pattern.substr(i + 1, close - i - 1);
                re += '[';
                if (!cls.empty() && cls.front() == '!') {
                    re += '^';
                    cls.remove_prefix(1);
                }
                for (char ch : cls) {
                    if (ch == '\\' || ch == ']' || ch == '[') re += '\\';
                    re += ch;
                }
                re += ']';
                i = close;
                break;
            }
            case '.': case '+': case '(': case ')': case '^': case '$':
            case '|': case '\\': case '{': case '}': case ']':
                re += '\\';
                re += c;
                break;
            default:
                re += c;
        }
    }
    return re;
}

GlobMatcher::GlobMatcher(std::string_view pattern) {
    auto alternatives = expand_braces(pattern);
    for (std::size_t i = 0; i < alternatives.size(); ++i) {
        auto& alt = alternatives[i];
        while (alt.starts_with("./")) alt.erase(0, 2);
        alternatives_.emplace_back("^" + glob_to_regex(alt) + "$", std::regex::ECMAScript);
        if (alt.starts_with('.') || alt.find("/.") != std::string::npos) {
            includes_hidden_ = true;
        }
        auto base = literal_prefix_dir(alt);
        if (i == 0) {
            base_dir_ = base;
        } else {
            // Shrink to the common directory prefix of all alternatives.
            while (!base_dir_.empty() && base != base_dir_ && !base.starts_with(base_dir_ + "/")) {
                auto slash = base_dir_.rfind('/');
                base_dir_ = slash == std::string::npos ? std::string{} : base_dir_.substr(0, slash);
            }
        }
    }
}

auto GlobMatcher::matches(std::string_view relative_path) const -> bool {
    const std::string path(relative_path);
    return std::ranges::any_of(alternatives_, [&](const std::regex& re) {
        return std::regex_match(path, re);
    });
}

} // namespace ctxopt::sdk
