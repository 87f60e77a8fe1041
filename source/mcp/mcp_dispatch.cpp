#include "mcp/mcp_dispatch.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <exception>
#include <string>
#include <utility>

namespace mcp_dispatch {

static const char SUPPORTED_METHODS_NOTE[] =
    "Este servidor MCP solo soporta initialize, tools/list, tools/call y ping";

static std::string join_names(const std::vector<std::string> &names) {
    std::string joined;
    for (const auto &name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

Dispatcher::Dispatcher(const mcp_tools::ToolRegistry &registry, ServerInfo server_info)
    : registry(registry), server_info(std::move(server_info)) {}

// Handle the "initialize" request.
json Dispatcher::handle_initialize(const json &request_id) const {
    json server_identity;
    server_identity["name"] = server_info.name;
    server_identity["version"] = server_info.version;
    server_identity["description"] = server_info.description;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = registry.build_capabilities();
    result["serverInfo"] = server_identity;

    return json_rpc::build_response(request_id, result);
}

json Dispatcher::handle_tools_list(const json &request_id) const {
    return json_rpc::build_response(request_id, registry.build_tools_list_response());
}

// Handle the "tools/call" request: lookup, validation, invocation, wrapping.
json Dispatcher::handle_tools_call(const json &request_id, const json &params) const {
    if (!params.contains("name") || !params["name"].is_string()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                              "Argumentos inválidos",
                                              "Falta el campo 'name' (string) en tools/call");
    }
    std::string tool_name = params["name"].get<std::string>();

    const mcp_tools::ToolDefinition *tool = registry.find_tool(tool_name);
    if (tool == nullptr) {
        return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                              "Herramienta no encontrada: " + tool_name,
                                              "Las herramientas disponibles son: " +
                                                  join_names(registry.tool_names()));
    }

    json arguments = json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        if (!params["arguments"].is_object()) {
            return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                                  "Argumentos inválidos",
                                                  "El campo 'arguments' debe ser un objeto");
        }
        arguments = params["arguments"];
    }

    mcp_tools::ValidationResult validation = tool->validator(arguments);
    if (!validation.valid) {
        debug_log::log("tools/call " + tool_name + " rejected: " + validation.error);
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                              "Argumentos inválidos", validation.error);
    }

    mcp_tools::ToolResult tool_result;
    try {
        tool_result = tool->handler(validation.arguments);
    } catch (const std::exception &error) {
        return json_rpc::build_error_response(request_id, json_rpc::INTERNAL_ERROR,
                                              "Error al ejecutar la herramienta",
                                              std::string("Error: ") + error.what());
    }

    json text_content;
    text_content["type"] = "text";
    text_content["text"] = tool_result.payload.dump(2, ' ', false, json::error_handler_t::replace);

    json result;
    result["content"] = json::array({text_content});
    result["isError"] = !tool_result.success;
    return json_rpc::build_response(request_id, result);
}

json Dispatcher::handle_ping(const json &request_id) const {
    json result;
    result["message"] = "Pong - " + server_info.name + " funcionando correctamente";
    return json_rpc::build_response(request_id, result);
}

json Dispatcher::dispatch_message(const json &message) const {
    json request_id = json_rpc::get_id(message);

    try {
        std::string method = json_rpc::get_method(message);
        debug_log::log("dispatch method=" + method + " id=" + request_id.dump());

        if (method == "initialize") {
            return handle_initialize(request_id);
        }
        if (method == "tools/list") {
            return handle_tools_list(request_id);
        }
        if (method == "tools/call") {
            return handle_tools_call(request_id, json_rpc::get_params(message));
        }
        if (method == "ping") {
            return handle_ping(request_id);
        }

        return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                              "Método no soportado: " + method,
                                              SUPPORTED_METHODS_NOTE);
    } catch (const std::exception &error) {
        return json_rpc::build_error_response(request_id, json_rpc::INTERNAL_ERROR,
                                              "Error interno del servidor",
                                              std::string("Error: ") + error.what());
    }
}

json Dispatcher::dispatch_line(const std::string &raw_line) const {
    json parsed_message;
    try {
        parsed_message = json::parse(raw_line);
    } catch (const json::parse_error &error) {
        debug_log::log(std::string("Failed to parse incoming JSON: ") + error.what());
        return json_rpc::build_error_response(json_rpc::UNKNOWN_ID, json_rpc::PARSE_ERROR,
                                              "JSON inválido en la solicitud",
                                              "Los datos recibidos no son un JSON válido");
    } catch (const json::exception &error) {
        // Number literals outside the double range (e.g. 1e999) fail here, not as parse_error.
        debug_log::log(std::string("Rejected incoming JSON: ") + error.what());
        return json_rpc::build_error_response(json_rpc::UNKNOWN_ID, json_rpc::PARSE_ERROR,
                                              "JSON inválido en la solicitud",
                                              "Número fuera del rango representable");
    }

    if (!parsed_message.is_object()) {
        return json_rpc::build_error_response(json_rpc::UNKNOWN_ID, json_rpc::INVALID_REQUEST,
                                              "Solicitud inválida",
                                              "La solicitud debe ser un objeto JSON");
    }

    return dispatch_message(parsed_message);
}

} // namespace mcp_dispatch
