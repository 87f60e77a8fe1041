#include "tool_handlers/tool_handlers.hpp"
#include "calculator/calculator_tool.hpp"

// Division by zero is reported as a failed tool result (isError), not a JSON-RPC error.

namespace tool_division {

void register_tool(mcp_tools::ToolRegistry &registry) {
    calculator_tool::register_operation(registry, arithmetic::Operation::Quotient,
                                        "Divide dos números",
                                        "Dividendo",
                                        "Divisor (no puede ser cero)");
}

} // namespace tool_division
