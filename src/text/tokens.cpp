#include "ctxopt/text/tokens.hpp"

#include <cctype>

namespace ctxopt::text {

auto estimate_tokens(std::string_view text) -> std::size_t {
    std::size_t tokens = 0;
    std::size_t run = 0;

    auto flush = [&] {
        tokens += (run + 3) / 4;
        run = 0;
    };

    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        // Bytes >= 0x80 are UTF-8 sequences; treat them as word material.
        if (std::isalnum(c) || c == '_' || c >= 0x80) {
            ++run;
            continue;
        }
        flush();
        if (!std::isspace(c)) ++tokens;
    }
    flush();
    return tokens;
}

} // namespace ctxopt::text
