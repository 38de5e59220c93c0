#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <utility>

#include <boost/asio.hpp>

#include "ctxopt/core/error.hpp"
#include "ctxopt/tools/tool.hpp"

namespace ctxopt::tools {

/// Owns the tools announced to protocol clients and dispatches calls by name.
class ToolRegistry {
public:
    ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    /// Register a tool. A tool with the same name is replaced.
    void register_tool(std::unique_ptr<Tool> tool);

    /// Look up a tool by name. Returns nullptr if not found.
    [[nodiscard]] auto get(std::string_view name) const -> Tool*;

    /// Definitions of every registered tool, ordered by name.
    [[nodiscard]] auto to_json() const -> json;

    /// Execute a tool by name. NotFound when no such tool is registered.
    auto execute(std::string_view name, json params)
        -> boost::asio::awaitable<Result<json>>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return tools_.size(); }
    [[nodiscard]] auto contains(std::string_view name) const -> bool;

private:
    std::map<std::string, std::unique_ptr<Tool>, std::less<>> tools_;
};

} // namespace ctxopt::tools
