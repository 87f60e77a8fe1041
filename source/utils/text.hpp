#ifndef MCPTOOLS_TEXT_HPP
#define MCPTOOLS_TEXT_HPP

// Small string helpers shared by the transport, validators and HTTP layer.

#include <cstdint>
#include <string>

namespace text {

// Strip leading and trailing ASCII whitespace (including '\r').
std::string trim(const std::string &input);

std::string to_lower(const std::string &input);

// Parse the whole string as a floating-point number (surrounding whitespace allowed).
// Accepts decimal forms strtod accepts, including "nan" and "inf"; callers check finiteness.
// Hexadecimal forms ("0x10", "0x1p3") are rejected.
bool parse_double(const std::string &input, double &output);

// Percent-encode for use inside a URL query component (RFC 3986 unreserved set kept).
std::string url_encode(const std::string &input);

// Local wall-clock time of a Unix timestamp as "HH:MM".
std::string format_clock_time(std::int64_t unix_seconds);

// Current local time as "YYYY-MM-DDTHH:MM:SS".
std::string current_iso_timestamp();

} // namespace text

#endif // MCPTOOLS_TEXT_HPP
