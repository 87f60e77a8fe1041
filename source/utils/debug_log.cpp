#include "utils/debug_log.hpp"
#include "utils/text.hpp"

#include <cstdlib>
#include <iostream>

namespace debug_log {

bool is_debug_enabled() {
    const char *value = std::getenv("MCPTOOLS_DEBUG");
    if (value == nullptr) {
        return false;
    }
    std::string normalized = text::to_lower(text::trim(value));
    return normalized == "1" || normalized == "true" || normalized == "yes";
}

void log(const std::string &message) {
    if (!is_debug_enabled()) {
        return;
    }
    std::cerr << "[mcptools] [debug] " << message << std::endl;
}

} // namespace debug_log
