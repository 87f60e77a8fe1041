#ifndef MCPTOOLS_MCP_DISPATCH_HPP
#define MCPTOOLS_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.
// Routes initialize, tools/list, tools/call and ping to their handlers and
// turns every other outcome into a JSON-RPC error object.

#include <nlohmann/json.hpp>
#include <string>

#include "mcp/mcp_tools.hpp"

namespace mcp_dispatch {

using json = nlohmann::json;

// Protocol version announced in the initialize handshake.
constexpr const char *PROTOCOL_VERSION = "2024-11-05";

// Static server identity reported by initialize and ping.
struct ServerInfo {
    std::string name;
    std::string version;
    std::string description;
};

class Dispatcher {
public:
    // The registry must outlive the dispatcher.
    Dispatcher(const mcp_tools::ToolRegistry &registry, ServerInfo server_info);

    // Handle one raw input line. Always returns exactly one response object.
    json dispatch_line(const std::string &raw_line) const;

    // Handle one already-parsed message. Faults escaping a method handler are
    // reported as -32603 with the request id echoed.
    json dispatch_message(const json &message) const;

private:
    json handle_initialize(const json &request_id) const;
    json handle_tools_list(const json &request_id) const;
    json handle_tools_call(const json &request_id, const json &params) const;
    json handle_ping(const json &request_id) const;

    const mcp_tools::ToolRegistry &registry;
    ServerInfo server_info;
};

} // namespace mcp_dispatch

#endif // MCPTOOLS_MCP_DISPATCH_HPP
