#include "mcp/mcp_stdio.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"
#include "utils/text.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <utility>

namespace mcp_stdio {

bool read_message(std::istream &input, std::string &line) {
    std::string raw_line;
    while (std::getline(input, raw_line)) {
        // Tolerate CRLF framing and surrounding whitespace.
        std::string trimmed = text::trim(raw_line);
        if (trimmed.empty()) {
            continue;
        }
        line = std::move(trimmed);
        return true;
    }
    return false;
}

void write_message(std::ostream &output, const std::string &json_string) {
    output << json_string << "\n";
    output.flush();
}

void log_message(const std::string &message) {
    std::cerr << "[mcptools] " << message << std::endl;
}

long serve(const mcp_dispatch::Dispatcher &dispatcher, std::istream &input, std::ostream &output,
           const volatile std::sig_atomic_t *shutdown_requested) {
    long responses_written = 0;
    std::string line;

    while (shutdown_requested == nullptr || *shutdown_requested == 0) {
        if (!read_message(input, line)) {
            debug_log::log("EOF on input. Leaving the server loop.");
            break;
        }

        json_rpc::json response;
        try {
            response = dispatcher.dispatch_line(line);
        } catch (const std::exception &error) {
            log_message(std::string("Unhandled error while dispatching: ") + error.what());
            response = json_rpc::build_error_response(json_rpc::UNKNOWN_ID, json_rpc::INTERNAL_ERROR,
                                                      "Error interno del servidor",
                                                      std::string("Error: ") + error.what());
        }
        write_message(output, json_rpc::serialize(response));
        responses_written++;
    }

    return responses_written;
}

} // namespace mcp_stdio
