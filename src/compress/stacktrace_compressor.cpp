#include "ctxopt/compress/compressors.hpp"

#include <regex>

#include "ctxopt/core/utils.hpp"
#include "ctxopt/text/tokens.hpp"

namespace ctxopt::compress {

namespace {

constexpr std::size_t kAppFramesPerTrace = 5;

auto is_frame(const std::string& line) -> bool {
    static const std::vector<std::regex> frame_res = {
        std::regex(R"(^\s+at\s)"),                        // JavaScript, Java
        std::regex(R"(^\s*File\s+".*",\s+line\s+\d+)"),   // Python
        std::regex(R"(^\s+\S+\.go:\d+)"),                 // Go
        std::regex(R"(^\s*\d+:\s+\S)"),                   // Rust backtrace
        std::regex(R"(^\s+#\d+\s)"),                      // PHP, gdb
    };
    for (const auto& r : frame_res) {
        if (std::regex_search(line, r)) return true;
    }
    return false;
}

auto is_library_frame(const std::string& line) -> bool {
    static const std::regex library_re(
        R"(node_modules|node:internal|internal/|site-packages|dist-packages|/usr/lib/|/rustc/|\.cargo/registry|/go/src/runtime/|<frozen |vendor/)");
    return std::regex_search(line, library_re);
}

auto is_python_source_line(const std::string& line, bool after_python_frame) -> bool {
    return after_python_frame && line.starts_with("    ") && !is_frame(line);
}

} // anonymous namespace

auto StacktraceCompressor::supports(ContentType type) const -> bool {
    return type == ContentType::Stacktrace;
}

auto StacktraceCompressor::compress(std::string_view content, const CompressOptions&) const
    -> CompressedResult {
    std::vector<std::string> out;
    std::size_t app_frames = 0;
    std::size_t omitted = 0;
    std::size_t omitted_library = 0;
    bool last_kept = false;
    bool after_python_frame = false;

    auto flush_omitted = [&] {
        if (omitted == 0) return;
        std::string note = "    ... " + std::to_string(omitted) + " frames omitted";
        if (omitted_library > 0) {
            note += " (" + std::to_string(omitted_library) + " library)";
        }
        out.push_back(std::move(note));
        omitted = 0;
        omitted_library = 0;
    };

    for (const auto& line : utils::split_lines(content)) {
        if (utils::trim(line).empty()) continue;

        if (is_python_source_line(line, after_python_frame)) {
            if (last_kept) out.push_back(line);
            after_python_frame = false;
            continue;
        }

        if (!is_frame(line)) {
            // A message line starts a new trace (or a "Caused by" section).
            flush_omitted();
            out.push_back(line);
            app_frames = 0;
            last_kept = true;
            after_python_frame = false;
            continue;
        }

        after_python_frame = line.find("File \"") != std::string::npos;
        bool library = is_library_frame(line);
        if (!library && app_frames < kAppFramesPerTrace) {
            flush_omitted();
            out.push_back(line);
            ++app_frames;
            last_kept = true;
        } else {
            ++omitted;
            if (library) ++omitted_library;
            last_kept = false;
        }
    }
    flush_omitted();

    CompressedResult result;
    result.compressed = utils::join(out, "\n");
    result.stats.original_tokens = text::estimate_tokens(content);
    result.stats.compressed_tokens = text::estimate_tokens(result.compressed);
    result.stats.technique = "frames";
    return result;
}

} // namespace ctxopt::compress
