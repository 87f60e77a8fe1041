#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"
#include "utils/text.hpp"
#include "version.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "validar_configuracion".
// Reports the effective configuration and probes the weather endpoint once.
// Always a successful tool result: the report itself carries the health state.

static const char API_HOST_PREFIX[] = "https://api.openweathermap.org";

static std::string describe_base_url(const std::string &base_url) {
    std::string prefix = API_HOST_PREFIX;
    if (base_url.compare(0, prefix.size(), prefix) == 0) {
        return "OpenWeatherMap API" + base_url.substr(prefix.size());
    }
    return base_url;
}

static std::string describe_probe(const http_client::HttpResponse &response) {
    if (response.timed_out) {
        return "Timeout: la API tardó demasiado en responder";
    }
    if (!response.success) {
        return "Error de conexión: " + response.error_detail;
    }
    if (response.status_code == 200) {
        return "Conectado";
    }
    if (response.status_code == 401) {
        return "API key inválida";
    }
    return "Error HTTP " + std::to_string(response.status_code);
}

static mcp_tools::ToolResult handle_validar_configuracion(openweather::WeatherApi &weather_api) {
    const weather_config::WeatherConfig &config = weather_api.config();

    debug_log::log("validar_configuracion invoked");
    http_client::HttpResponse probe = weather_api.probe();
    bool api_working = probe.success && probe.status_code == 200;

    json configuration;
    configuration["api_key_configurada"] = config.has_usable_api_key();
    configuration["timeout_segundos"] = config.timeout_seconds;
    configuration["url_base"] = describe_base_url(config.base_url);
    configuration["cliente_http"] = "Configurado";
    configuration["version_servidor"] = MCPTOOLS_VERSION;
    configuration["api_funcional"] = api_working;
    configuration["estado_conexion"] = describe_probe(probe);

    json payload;
    payload["configuracion"] = configuration;
    payload["timestamp"] = text::current_iso_timestamp();
    payload["estado_general"] = api_working ? "OK" : "REQUIERE_ATENCION";
    return mcp_tools::success_result(payload);
}

namespace tool_validar_configuracion {

void register_tool(mcp_tools::ToolRegistry &registry, openweather::WeatherApi &weather_api) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["required"] = json::array();

    registry.register_tool({
        "validar_configuracion",
        "Valida la configuración del servidor y API key",
        input_schema,
        mcp_tools::accept_any_arguments,
        [&weather_api](const json &) {
            return handle_validar_configuracion(weather_api);
        }
    });
}

} // namespace tool_validar_configuracion
