#include "http/lws/lws_http_client.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <chrono>
#include <cstring>
#include <string>
#include <utility>

namespace lws_http_client {

// State of one in-flight GET, handed to libwebsockets as the connection's user data.
struct HttpExchange {
    bool completed = false;
    bool failed = false;
    int status_code = 0;
    std::string body;
    std::string error_detail;
};

static int http_callback(struct lws *connection, enum lws_callback_reasons reason,
                         void *user_data, void *incoming_data, size_t incoming_length);

static const struct lws_protocols http_protocols[] = {
    {
        "http",
        http_callback,
        0,   // per-session data is supplied through connect_info.userdata
        4096 // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

// --- HTTP client callback ---

static int http_callback(struct lws *connection, enum lws_callback_reasons reason,
                         void *user_data, void *incoming_data, size_t incoming_length) {
    HttpExchange *exchange = static_cast<HttpExchange *>(user_data);

    switch (reason) {
    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR:
        if (exchange != nullptr) {
            exchange->failed = true;
            exchange->error_detail = incoming_data ? static_cast<const char *>(incoming_data)
                                                   : "connection error";
        }
        break;

    case LWS_CALLBACK_ESTABLISHED_CLIENT_HTTP:
        if (exchange != nullptr) {
            exchange->status_code = static_cast<int>(lws_http_client_http_response(connection));
            debug_log::log("HTTP status " + std::to_string(exchange->status_code));
        }
        break;

    case LWS_CALLBACK_RECEIVE_CLIENT_HTTP_READ:
        if (exchange != nullptr) {
            exchange->body.append(static_cast<const char *>(incoming_data), incoming_length);
        }
        return 0;

    case LWS_CALLBACK_RECEIVE_CLIENT_HTTP: {
        // Pull the pending body chunk; it is delivered through RECEIVE_CLIENT_HTTP_READ.
        char read_buffer[LWS_PRE + 4096];
        char *read_pointer = read_buffer + LWS_PRE;
        int read_length = static_cast<int>(sizeof(read_buffer) - LWS_PRE);
        if (lws_http_client_read(connection, &read_pointer, &read_length) < 0) {
            return -1;
        }
        return 0;
    }

    case LWS_CALLBACK_COMPLETED_CLIENT_HTTP:
        if (exchange != nullptr) {
            exchange->completed = true;
        }
        lws_cancel_service(lws_get_context(connection));
        break;

    case LWS_CALLBACK_CLOSED_CLIENT_HTTP:
        if (exchange != nullptr && !exchange->completed && !exchange->failed) {
            exchange->failed = true;
            exchange->error_detail = "connection closed before the response completed";
        }
        lws_cancel_service(lws_get_context(connection));
        break;

    default:
        break;
    }

    return lws_callback_http_dummy(connection, reason, user_data, incoming_data, incoming_length);
}

LwsHttpClient::LwsHttpClient(int timeout_milliseconds) : timeout_milliseconds(timeout_milliseconds) {
    lws_set_log_level(LLL_ERR, nullptr);
}

http_client::HttpResponse LwsHttpClient::get(const std::string &url) {
    http_client::HttpResponse response;

    http_client::ParsedUrl target = http_client::parse_url(url);
    if (!target.valid) {
        response.error_detail = "URL no válida";
        return response;
    }

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = http_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;

    struct lws_context *context = lws_create_context(&context_info);
    if (context == nullptr) {
        response.error_detail = "no se pudo crear el contexto de libwebsockets";
        return response;
    }

    HttpExchange exchange;

    struct lws_client_connect_info connect_info;
    memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = context;
    connect_info.address = target.host.c_str();
    connect_info.port = target.port;
    connect_info.path = target.path.c_str();
    connect_info.host = target.host.c_str();
    connect_info.origin = target.host.c_str();
    connect_info.method = "GET";
    connect_info.protocol = http_protocols[0].name;
    connect_info.ssl_connection = target.use_tls ? LCCSCF_USE_SSL : 0;
    connect_info.userdata = &exchange;

    debug_log::log("HTTP GET host=" + target.host + " port=" + std::to_string(target.port));
    if (lws_client_connect_via_info(&connect_info) == nullptr && !exchange.failed) {
        exchange.failed = true;
        exchange.error_detail = "lws_client_connect_via_info failed";
    }

    auto start_time = std::chrono::steady_clock::now();
    while (!exchange.completed && !exchange.failed) {
        if (lws_service(context, 50) < 0) {
            exchange.failed = true;
            exchange.error_detail = "lws_service failed";
            break;
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > timeout_milliseconds) {
            response.timed_out = true;
            exchange.failed = true;
            exchange.error_detail = "timed out after " + std::to_string(timeout_milliseconds) + " ms";
            break;
        }
    }

    // Destroying the context closes the connection while exchange is still alive.
    lws_context_destroy(context);

    response.success = exchange.completed && !response.timed_out;
    response.status_code = exchange.status_code;
    response.body = std::move(exchange.body);
    response.error_detail = std::move(exchange.error_detail);
    if (!response.success) {
        debug_log::log("HTTP GET failed: " + response.error_detail);
    }
    return response;
}

} // namespace lws_http_client
