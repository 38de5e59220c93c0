#include "ctxopt/sdk/files.hpp"

#include "ctxopt/ast/parser.hpp"

namespace ctxopt::sdk {

auto files_read(const Host& host, std::string_view path) -> Result<std::string> {
    return host.read_file(path);
}

auto files_exists(const Host& host, std::string_view path) -> bool {
    return host.exists(path);
}

auto files_glob(const Host& host, std::string_view pattern) -> Result<json> {
    auto paths = host.glob(pattern, kMaxFiles);
    if (!paths) return std::unexpected(paths.error());
    return json(*paths);
}

auto files_read_structure(const Host& host, std::string_view path) -> Result<json> {
    auto content = host.read_file(path);
    if (!content) return std::unexpected(content.error());

    auto lang = ast::detect_language_from_path(path);
    if (!ast::is_parseable(lang)) {
        return std::unexpected(make_error(ErrorCode::Unsupported,
            "Unsupported language for file", std::string(path)));
    }
    auto structure = ast::parse_structure(*content, lang);
    if (!structure) return std::unexpected(structure.error());
    nlohmann::json j = *structure;
    return json(j);
}

} // namespace ctxopt::sdk
