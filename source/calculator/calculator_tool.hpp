#ifndef MCPTOOLS_CALCULATOR_TOOL_HPP
#define MCPTOOLS_CALCULATOR_TOOL_HPP

// Shared pieces of the four calculator tools: schema and result payload.

#include <nlohmann/json.hpp>
#include <string>

#include "calculator/arithmetic.hpp"
#include "mcp/mcp_tools.hpp"

namespace calculator_tool {

using json = nlohmann::json;

// inputSchema with two required numbers "a" and "b" and no other properties.
json build_operand_schema(const std::string &a_description, const std::string &b_description);

// Run the operation on validated arguments {"a": double, "b": double}.
// Success payload: {success, operacion, operandos, resultado, descripcion}.
// Failure payload: {success, operacion, error, error_type: "calculation_error"}.
mcp_tools::ToolResult run_operation(arithmetic::Operation operation, const json &validated_arguments);

// Register one calculator tool with the shared validator.
void register_operation(mcp_tools::ToolRegistry &registry, arithmetic::Operation operation,
                        const std::string &description, const std::string &a_description,
                        const std::string &b_description);

} // namespace calculator_tool

#endif // MCPTOOLS_CALCULATOR_TOOL_HPP
