#ifndef MCPTOOLS_LWS_HTTP_CLIENT_HPP
#define MCPTOOLS_LWS_HTTP_CLIENT_HPP

// HTTP/1.1 GET client on top of libwebsockets' client connections.
// Each call creates its own lws context, services it until the response
// completes or the timeout expires, then destroys it.

#include <string>

#include "http/http_client.hpp"

namespace lws_http_client {

class LwsHttpClient : public http_client::HttpClient {
public:
    explicit LwsHttpClient(int timeout_milliseconds);

    http_client::HttpResponse get(const std::string &url) override;

private:
    int timeout_milliseconds;
};

} // namespace lws_http_client

#endif // MCPTOOLS_LWS_HTTP_CLIENT_HPP
