#pragma once

#include <optional>
#include <string>
#include <vector>
#include <utility>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "ctxopt/core/error.hpp"

namespace ctxopt::tools {

using json = nlohmann::json;
using boost::asio::awaitable;

/// Describes a single parameter for a tool.
struct ToolParameter {
    std::string name;
    std::string type;         // JSON Schema type: "string", "number", "boolean", "object", "array"
    std::string description;  // omitted from the schema when empty
    bool required = true;
    std::optional<json> default_value;
};

/// Full definition of a tool as announced to protocol clients.
struct ToolDefinition {
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;

    /// `{ name, description, input_schema }` with a JSON Schema object
    /// describing the parameters.
    [[nodiscard]] auto to_json() const -> json;
};

/// Abstract base class for tools exposed to protocol clients.
///
/// A tool result is `{ content: [{ type: "text", text }], isError? }`.
/// Failures of the tool's own work are reported inside the result with
/// `isError`; the Result error channel is reserved for malformed calls.
class Tool {
public:
    virtual ~Tool() = default;

    [[nodiscard]] virtual auto definition() const -> ToolDefinition = 0;

    virtual auto execute(json params) -> awaitable<Result<json>> = 0;
};

/// `{ content: [{ type: "text", text }] }`, plus `isError: true` when set.
auto text_result(std::string text, bool is_error = false) -> json;

} // namespace ctxopt::tools
