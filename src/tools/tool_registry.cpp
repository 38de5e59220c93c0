#include "ctxopt/tools/tool_registry.hpp"

#include "ctxopt/core/logger.hpp"

namespace ctxopt::tools {

void ToolRegistry::register_tool(std::unique_ptr<Tool> tool) {
    if (!tool) {
        LOG_WARN("Attempted to register a null tool");
        return;
    }

    auto name = tool->definition().name;
    if (tools_.contains(name)) {
        LOG_WARN("Replacing existing tool: {}", name);
    } else {
        LOG_DEBUG("Registered tool: {}", name);
    }
    tools_[std::move(name)] = std::move(tool);
}

auto ToolRegistry::get(std::string_view name) const -> Tool* {
    auto it = tools_.find(name);
    return it != tools_.end() ? it->second.get() : nullptr;
}

auto ToolRegistry::to_json() const -> json {
    json defs = json::array();
    for (const auto& [name, tool] : tools_) {
        defs.push_back(tool->definition().to_json());
    }
    return defs;
}

auto ToolRegistry::execute(std::string_view name, json params)
    -> boost::asio::awaitable<Result<json>> {
    auto* tool = get(name);
    if (!tool) {
        co_return std::unexpected(make_error(
            ErrorCode::NotFound,
            "Tool not found",
            std::string(name)));
    }

    // Parameters carry untrusted code; only the tool name is logged.
    LOG_DEBUG("Executing tool: {}", name);
    auto result = co_await tool->execute(std::move(params));
    if (!result) {
        LOG_WARN("Tool {} call rejected: {}", name, result.error().what());
    }
    co_return result;
}

auto ToolRegistry::contains(std::string_view name) const -> bool {
    return tools_.find(name) != tools_.end();
}

} // namespace ctxopt::tools
