#include "tool_handlers/tool_handlers.hpp"
#include "calculator/calculator_tool.hpp"

namespace tool_multiplicacion {

void register_tool(mcp_tools::ToolRegistry &registry) {
    calculator_tool::register_operation(registry, arithmetic::Operation::Product,
                                        "Multiplica dos números",
                                        "Primer número",
                                        "Segundo número");
}

} // namespace tool_multiplicacion
