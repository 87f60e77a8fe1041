#include "tool_handlers/tool_handlers.hpp"
#include "calculator/calculator_tool.hpp"

namespace tool_resta {

void register_tool(mcp_tools::ToolRegistry &registry) {
    calculator_tool::register_operation(registry, arithmetic::Operation::Difference,
                                        "Resta dos números",
                                        "Primer número (minuendo)",
                                        "Segundo número (sustraendo)");
}

} // namespace tool_resta
