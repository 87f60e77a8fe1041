#include "mcp/mcp_tools.hpp"

#include <utility>

namespace mcp_tools {

static json describe_tool(const ToolDefinition &tool) {
    json entry;
    entry["name"] = tool.name;
    entry["description"] = tool.description;
    entry["inputSchema"] = tool.input_schema;
    return entry;
}

DuplicateToolError::DuplicateToolError(const std::string &tool_name)
    : std::runtime_error("Tool already registered: " + tool_name) {}

void ToolRegistry::register_tool(ToolDefinition definition) {
    if (find_tool(definition.name) != nullptr) {
        throw DuplicateToolError(definition.name);
    }
    if (!definition.validator) {
        definition.validator = accept_any_arguments;
    }
    registered_tools.push_back(std::move(definition));
}

const ToolDefinition *ToolRegistry::find_tool(const std::string &tool_name) const {
    for (const auto &tool : registered_tools) {
        if (tool.name == tool_name) {
            return &tool;
        }
    }
    return nullptr;
}

std::vector<std::string> ToolRegistry::tool_names() const {
    std::vector<std::string> names;
    names.reserve(registered_tools.size());
    for (const auto &tool : registered_tools) {
        names.push_back(tool.name);
    }
    return names;
}

json ToolRegistry::build_tools_list_response() const {
    json tools_array = json::array();
    for (const auto &tool : registered_tools) {
        tools_array.push_back(describe_tool(tool));
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

json ToolRegistry::build_capabilities() const {
    json tools_map = json::object();
    for (const auto &tool : registered_tools) {
        tools_map[tool.name] = describe_tool(tool);
    }

    json capabilities;
    capabilities["tools"] = tools_map;
    return capabilities;
}

ValidationResult accept_any_arguments(const json &arguments) {
    ValidationResult result;
    result.valid = true;
    result.arguments = arguments;
    return result;
}

ToolResult success_result(json payload) {
    ToolResult result;
    result.success = true;
    payload["success"] = true;
    result.payload = std::move(payload);
    return result;
}

ToolResult failure_result(json payload) {
    ToolResult result;
    result.success = false;
    payload["success"] = false;
    result.payload = std::move(payload);
    return result;
}

} // namespace mcp_tools
