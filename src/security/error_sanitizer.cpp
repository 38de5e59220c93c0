#include "ctxopt/security/error_sanitizer.hpp"

#include <algorithm>
#include <cstdlib>
#include <regex>
#include <vector>

#include "ctxopt/core/utils.hpp"

namespace ctxopt::security {

namespace fs = std::filesystem;

namespace {

/// All spellings of the working directory worth replacing, longest first so
/// a canonical path that extends a symlinked spelling is replaced whole.
auto working_dir_spellings(const fs::path& working_dir) -> std::vector<std::string> {
    std::vector<std::string> spellings;
    if (working_dir.empty()) return spellings;

    auto add = [&](std::string s) {
        while (s.size() > 1 && (s.back() == '/' || s.back() == '\\')) s.pop_back();
        // A root or empty working dir would erase every slash in the message.
        if (s.empty() || s == "/" || s == "\\" || s == ".") return;
        if (std::find(spellings.begin(), spellings.end(), s) == spellings.end()) {
            spellings.push_back(std::move(s));
        }
    };

    add(working_dir.string());
    add(working_dir.lexically_normal().string());

    std::error_code ec;
    auto abs = fs::absolute(working_dir, ec);
    if (!ec) add(abs.lexically_normal().string());

    auto canonical = fs::canonical(working_dir, ec);
    if (!ec) add(canonical.string());

    std::ranges::sort(spellings, [](const auto& a, const auto& b) { return a.size() > b.size(); });
    return spellings;
}

} // anonymous namespace

auto sanitize_error(std::string_view message, const fs::path& working_dir) -> std::string {
    auto first_newline = message.find_first_of("\r\n");
    std::string out(message.substr(0, first_newline));

    for (const auto& spelling : working_dir_spellings(working_dir)) {
        out = utils::replace_all(std::move(out), spelling, kWorkdirPlaceholder);
    }

    if (auto* home = std::getenv("HOME")) {
        std::string h(home);
        while (h.size() > 1 && h.back() == '/') h.pop_back();
        if (h.size() > 1) {
            out = utils::replace_all(std::move(out), h, kHomePlaceholder);
        }
    }

    static const std::regex posix_home(R"((/home|/Users)/[^/\s'"`:]+)");
    static const std::regex windows_home(R"([A-Za-z]:\\Users\\[^\\\s'"`:]+)",
                                         std::regex::ECMAScript | std::regex::icase);
    out = std::regex_replace(out, posix_home, std::string(kHomePlaceholder));
    out = std::regex_replace(out, windows_home, std::string(kHomePlaceholder));

    return out;
}

} // namespace ctxopt::security
