#include "ctxopt/tools/tool.hpp"

namespace ctxopt::tools {

auto ToolDefinition::to_json() const -> json {
    json j;
    j["name"] = name;
    j["description"] = description;

    json schema;
    schema["type"] = "object";

    json properties = json::object();
    json required_params = json::array();

    for (const auto& param : parameters) {
        json prop;
        prop["type"] = param.type;
        if (!param.description.empty()) {
            prop["description"] = param.description;
        }
        if (param.default_value.has_value()) {
            prop["default"] = *param.default_value;
        }

        properties[param.name] = prop;

        if (param.required) {
            required_params.push_back(param.name);
        }
    }

    schema["properties"] = properties;
    if (!required_params.empty()) {
        schema["required"] = required_params;
    }

    j["input_schema"] = schema;
    return j;
}

auto text_result(std::string text, bool is_error) -> json {
    json result;
    result["content"] = json::array({json{{"type", "text"}, {"text", std::move(text)}}});
    if (is_error) {
        result["isError"] = true;
    }
    return result;
}

} // namespace ctxopt::tools
