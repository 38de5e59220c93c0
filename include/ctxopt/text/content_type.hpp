#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

namespace ctxopt::text {

/// Coarse classification used to route content to a compressor.
enum class ContentType {
    Logs,
    Stacktrace,
    Config,
    Diff,
    Code,
    Generic,
};

NLOHMANN_JSON_SERIALIZE_ENUM(ContentType, {
    {ContentType::Generic, "generic"},
    {ContentType::Logs, "logs"},
    {ContentType::Stacktrace, "stacktrace"},
    {ContentType::Config, "config"},
    {ContentType::Diff, "diff"},
    {ContentType::Code, "code"},
})

auto content_type_to_string(ContentType type) -> std::string_view;

/// Parses a lower-case name ("logs", "diff", ...). Unknown names map to Generic.
auto content_type_from_string(std::string_view name) -> ContentType;

/// Heuristic detection, checked in order: diff, stacktrace, config, logs,
/// code, generic.
[[nodiscard]] auto detect_content_type(std::string_view content) -> ContentType;

} // namespace ctxopt::text
