#include "ctxopt/sdk/compress.hpp"

#include <algorithm>

#include "ctxopt/compress/compressors.hpp"

namespace ctxopt::sdk {

namespace {

auto registry() -> const compress::CompressorRegistry& {
    static const auto instance = compress::CompressorRegistry::with_defaults();
    return instance;
}

auto to_sdk_json(const compress::CompressedResult& result) -> json {
    nlohmann::json j = result;
    return json(j);
}

} // anonymous namespace

auto compress_auto(std::string_view content, std::optional<std::string_view> hint) -> json {
    std::optional<text::ContentType> type;
    if (hint && !hint->empty()) {
        type = text::content_type_from_string(*hint);
    }
    return to_sdk_json(registry().compress(content, type));
}

auto compress_logs(std::string_view logs) -> json {
    nlohmann::json j = compress::summarize_logs(logs);
    return json(j);
}

auto compress_diff(std::string_view diff) -> json {
    return to_sdk_json(compress::DiffCompressor{}.compress(diff, {}));
}

auto compress_semantic(std::string_view content, double ratio) -> json {
    compress::CompressOptions opts;
    opts.target_ratio = std::clamp(ratio, kMinSemanticRatio, kMaxSemanticRatio);
    return to_sdk_json(compress::SemanticCompressor{}.compress(content, opts));
}

} // namespace ctxopt::sdk
