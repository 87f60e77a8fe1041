#ifndef MCPTOOLS_MCP_TOOLS_HPP
#define MCPTOOLS_MCP_TOOLS_HPP

// MCP tool registry: registration, listing, and lookup of tools.
// Built once at startup; the dispatcher only reads it afterwards.

#include <nlohmann/json.hpp>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcp_tools {

using json = nlohmann::json;

// Outcome of checking a tools/call "arguments" object.
// On success, "arguments" holds the normalized values the handler receives.
struct ValidationResult {
    bool valid = false;
    json arguments = json::object();
    std::string error;
};

// Domain-level outcome of a tool. A failed tool is still a successful RPC;
// the dispatcher reports it with isError: true.
struct ToolResult {
    bool success = false;
    json payload = json::object();
};

using ArgumentValidator = std::function<ValidationResult(const json &arguments)>;
using ToolHandler = std::function<ToolResult(const json &validated_arguments)>;

// Description of a registered tool, matching the MCP tool schema.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
    ArgumentValidator validator;
    ToolHandler handler;
};

class DuplicateToolError : public std::runtime_error {
public:
    explicit DuplicateToolError(const std::string &tool_name);
};

class ToolRegistry {
public:
    // Throws DuplicateToolError if a tool with the same name is registered.
    void register_tool(ToolDefinition definition);

    // Registered tools in registration order.
    const std::vector<ToolDefinition> &list_tools() const { return registered_tools; }

    // Returns nullptr if no tool has this name.
    const ToolDefinition *find_tool(const std::string &tool_name) const;

    std::vector<std::string> tool_names() const;

    // Payload for tools/list: {"tools": [{name, description, inputSchema}, ...]}.
    json build_tools_list_response() const;

    // Capability map advertised by initialize: {"tools": {name: {...}}}.
    json build_capabilities() const;

private:
    std::vector<ToolDefinition> registered_tools;
};

// Validator for tools that accept any arguments object unchanged.
ValidationResult accept_any_arguments(const json &arguments);

// Builders for handler results.
ToolResult success_result(json payload);
ToolResult failure_result(json payload);

} // namespace mcp_tools

#endif // MCPTOOLS_MCP_TOOLS_HPP
