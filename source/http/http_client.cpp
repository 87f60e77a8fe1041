#include "http/http_client.hpp"
#include "utils/text.hpp"

#include <cctype>

namespace http_client {

ParsedUrl parse_url(const std::string &url) {
    ParsedUrl parsed;

    std::string remainder;
    if (url.compare(0, 8, "https://") == 0) {
        parsed.use_tls = true;
        parsed.port = 443;
        remainder = url.substr(8);
    } else if (url.compare(0, 7, "http://") == 0) {
        parsed.port = 80;
        remainder = url.substr(7);
    } else {
        return parsed;
    }

    // Split host[:port] from path.
    std::string host_and_port = remainder;
    auto slash_position = remainder.find('/');
    if (slash_position != std::string::npos) {
        host_and_port = remainder.substr(0, slash_position);
        parsed.path = remainder.substr(slash_position);
    }

    auto colon_position = host_and_port.find(':');
    if (colon_position != std::string::npos) {
        std::string port_text = host_and_port.substr(colon_position + 1);
        if (port_text.empty() || port_text.size() > 5) {
            return parsed;
        }
        for (char character : port_text) {
            if (!std::isdigit(static_cast<unsigned char>(character))) {
                return parsed;
            }
        }
        parsed.port = std::stoi(port_text);
        host_and_port = host_and_port.substr(0, colon_position);
    }

    if (host_and_port.empty() || parsed.port <= 0 || parsed.port > 65535) {
        return parsed;
    }

    parsed.host = host_and_port;
    parsed.valid = true;
    return parsed;
}

std::string build_url(const std::string &base_url, const std::string &path,
                      const QueryParameters &parameters) {
    std::string url = base_url;
    if (!url.empty() && url.back() == '/' && !path.empty() && path.front() == '/') {
        url.pop_back();
    }
    url += path;

    char separator = '?';
    for (const auto &parameter : parameters) {
        url += separator;
        url += text::url_encode(parameter.first);
        url += '=';
        url += text::url_encode(parameter.second);
        separator = '&';
    }
    return url;
}

} // namespace http_client
