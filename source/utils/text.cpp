#include "utils/text.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <ctime>

namespace text {

static bool is_space(char character) {
    return std::isspace(static_cast<unsigned char>(character)) != 0;
}

std::string trim(const std::string &input) {
    size_t begin = 0;
    size_t end = input.size();
    while (begin < end && is_space(input[begin])) {
        begin++;
    }
    while (end > begin && is_space(input[end - 1])) {
        end--;
    }
    return input.substr(begin, end - begin);
}

std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

bool parse_double(const std::string &input, double &output) {
    std::string trimmed = trim(input);
    if (trimmed.empty()) {
        return false;
    }

    // Decimal only: strtod would also take hexadecimal forms such as "0x10".
    if (trimmed.find_first_of("xX") != std::string::npos) {
        return false;
    }

    errno = 0;
    char *end_pointer = nullptr;
    double value = std::strtod(trimmed.c_str(), &end_pointer);
    if (end_pointer != trimmed.c_str() + trimmed.size()) {
        return false;
    }
    // ERANGE on overflow still yields +/-HUGE_VAL, which the caller rejects as infinite.
    output = value;
    return true;
}

std::string url_encode(const std::string &input) {
    static const char hex_digits[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(input.size() * 3);

    for (unsigned char character : input) {
        if (std::isalnum(character) || character == '-' || character == '_' ||
            character == '.' || character == '~') {
            encoded += static_cast<char>(character);
        } else {
            encoded += '%';
            encoded += hex_digits[character >> 4];
            encoded += hex_digits[character & 0x0F];
        }
    }
    return encoded;
}

static std::string format_local(std::time_t seconds, const char *format) {
    std::tm local_time{};
    if (localtime_r(&seconds, &local_time) == nullptr) {
        return "";
    }
    char buffer[64];
    size_t length = std::strftime(buffer, sizeof(buffer), format, &local_time);
    return std::string(buffer, length);
}

std::string format_clock_time(std::int64_t unix_seconds) {
    return format_local(static_cast<std::time_t>(unix_seconds), "%H:%M");
}

std::string current_iso_timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return format_local(now, "%Y-%m-%dT%H:%M:%S");
}

} // namespace text
