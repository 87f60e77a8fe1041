#ifndef MCPTOOLS_HTTP_CLIENT_HPP
#define MCPTOOLS_HTTP_CLIENT_HPP

// Outbound HTTP abstraction used by the weather tools.
// The libwebsockets implementation lives under http/lws/; tests substitute
// their own client. Transport faults are reported in HttpResponse, never thrown.

#include <string>
#include <utility>
#include <vector>

namespace http_client {

// Outcome of one GET exchange.
// success is true when a complete HTTP response arrived, whatever its status.
struct HttpResponse {
    bool success = false;
    bool timed_out = false;
    int status_code = 0;
    std::string body;
    std::string error_detail;

    bool is_ok_status() const { return status_code >= 200 && status_code < 300; }
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Blocking GET with the client's own timeout.
    virtual HttpResponse get(const std::string &url) = 0;
};

// Components of an http:// or https:// URL.
struct ParsedUrl {
    bool valid = false;
    bool use_tls = false;
    std::string host;
    int port = 0;
    std::string path = "/"; // path plus query string
};

ParsedUrl parse_url(const std::string &url);

using QueryParameters = std::vector<std::pair<std::string, std::string>>;

// Append percent-encoded query parameters to a URL without a query string.
std::string build_url(const std::string &base_url, const std::string &path,
                      const QueryParameters &parameters);

} // namespace http_client

#endif // MCPTOOLS_HTTP_CLIENT_HPP
