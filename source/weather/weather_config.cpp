#include "weather/weather_config.hpp"
#include "utils/debug_log.hpp"
#include "utils/text.hpp"

#include <cmath>
#include <cstdlib>

namespace weather_config {

ConfigLoadResult load_config_from_environment() {
    ConfigLoadResult result;

    const char *api_key = std::getenv(API_KEY_VARIABLE);
    if (api_key == nullptr || text::trim(api_key).empty()) {
        result.error_message = std::string("Variable de entorno ") + API_KEY_VARIABLE + " no encontrada";
        return result;
    }
    result.config.api_key = text::trim(api_key);

    const char *timeout_value = std::getenv(TIMEOUT_VARIABLE);
    if (timeout_value != nullptr && timeout_value[0] != '\0') {
        double timeout_seconds = 0.0;
        if (!text::parse_double(timeout_value, timeout_seconds) || !std::isfinite(timeout_seconds) ||
            timeout_seconds <= 0.0 || timeout_seconds > MAXIMUM_TIMEOUT_SECONDS) {
            result.error_message = std::string("Valor inválido en ") + TIMEOUT_VARIABLE + ": '" +
                                   timeout_value + "' (se esperan segundos, número positivo hasta " +
                                   std::to_string(static_cast<long>(MAXIMUM_TIMEOUT_SECONDS)) + ")";
            return result;
        }
        result.config.timeout_seconds = timeout_seconds;
    }

    debug_log::log("Weather config loaded: timeout=" + std::to_string(result.config.timeout_seconds) +
                   " s, api key length=" + std::to_string(result.config.api_key.size()));
    result.success = true;
    return result;
}

} // namespace weather_config
