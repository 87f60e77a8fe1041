#ifndef MCPTOOLS_JSON_RPC_HPP
#define MCPTOOLS_JSON_RPC_HPP

// JSON-RPC 2.0 helpers shared by both tool servers.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

constexpr const char *PROTOCOL_TAG = "2.0";

// Identifier reported when a request carries no usable id.
constexpr const char *UNKNOWN_ID = "unknown";

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response without a data field.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Build a JSON-RPC 2.0 error response with a human-readable data string.
json build_error_response(const json &request_id, int error_code, const std::string &error_message,
                          const std::string &error_data);

// Extract method name. Returns empty if missing or not a string.
std::string get_method(const json &message);

// Extract the id verbatim, or "unknown" if the message has none.
json get_id(const json &message);

// Extract params. Returns an empty object if missing or not an object.
json get_params(const json &message);

// Serialize a message as a single line. Invalid UTF-8 is replaced rather than thrown.
std::string serialize(const json &message);

} // namespace json_rpc

#endif // MCPTOOLS_JSON_RPC_HPP
