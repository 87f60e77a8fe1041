#include "tool_handlers/tool_handlers.hpp"
#include "calculator/calculator_tool.hpp"

namespace tool_suma {

void register_tool(mcp_tools::ToolRegistry &registry) {
    calculator_tool::register_operation(registry, arithmetic::Operation::Sum,
                                        "Suma dos números",
                                        "Primer número",
                                        "Segundo número");
}

} // namespace tool_suma
