// Calculadora MCP Server – four arithmetic tools over stdio.
// Entry point: stdio MCP server loop.
//
// Reads one JSON-RPC 2.0 request per line from stdin, writes one response line to stdout.
// Logs go to stderr; stdout carries only protocol messages.

#include <iostream>
#include <string>

#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/shutdown_signal.hpp"
#include "version.hpp"

int main() {
    shutdown_signal::install();

    mcp_tools::ToolRegistry registry;
    tool_handlers::register_calculator_tools(registry);

    mcp_dispatch::Dispatcher dispatcher(registry, {
        "Calculadora MCP Server",
        MCPTOOLS_VERSION,
        "Servidor MCP para operaciones matemáticas básicas"
    });

    mcp_stdio::log_message("Iniciando Calculadora MCP Server " MCPTOOLS_VERSION "...");
    mcp_stdio::log_message("Servidor listo para recibir solicitudes.");

    long served = mcp_stdio::serve(dispatcher, std::cin, std::cout, shutdown_signal::requested_flag());

    mcp_stdio::log_message("Calculadora MCP Server finalizado (" + std::to_string(served) + " solicitudes atendidas).");
    return 0;
}
