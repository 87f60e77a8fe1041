#ifndef MCPTOOLS_MCP_STDIO_HPP
#define MCPTOOLS_MCP_STDIO_HPP

// MCP stdio transport: newline-delimited JSON requests in, one JSON response
// line out per request. Logs go to stderr (stdout is the protocol channel).

#include <csignal>
#include <iosfwd>
#include <string>

#include "mcp/mcp_dispatch.hpp"

namespace mcp_stdio {

// Read the next non-blank line from input into line (trimmed).
// Returns false on end-of-input or a stream failure.
bool read_message(std::istream &input, std::string &line);

// Write one serialized message followed by a newline, then flush.
void write_message(std::ostream &output, const std::string &json_string);

// Write an operator-facing message to stderr.
void log_message(const std::string &message);

// Serve requests until end-of-input or until *shutdown_requested becomes nonzero.
// Returns the number of responses written.
long serve(const mcp_dispatch::Dispatcher &dispatcher, std::istream &input, std::ostream &output,
           const volatile std::sig_atomic_t *shutdown_requested = nullptr);

} // namespace mcp_stdio

#endif // MCPTOOLS_MCP_STDIO_HPP
