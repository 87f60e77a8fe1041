// Clima MCP Server – OpenWeatherMap lookups over stdio.
// Entry point: loads configuration from the environment, then runs the stdio MCP server loop.
//
// A missing OPENWEATHERMAP_API_KEY is fatal: reported on stderr, exit status 1.

#include <iostream>
#include <string>

#include "http/lws/lws_http_client.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/shutdown_signal.hpp"
#include "version.hpp"
#include "weather/openweather.hpp"
#include "weather/weather_config.hpp"

int main() {
    weather_config::ConfigLoadResult loaded = weather_config::load_config_from_environment();
    if (!loaded.success) {
        mcp_stdio::log_message("Error de configuración: " + loaded.error_message);
        mcp_stdio::log_message(std::string("Por favor, asegúrate de tener configurada la variable ") +
                               weather_config::API_KEY_VARIABLE);
        return 1;
    }
    const weather_config::WeatherConfig &config = loaded.config;

    shutdown_signal::install();

    lws_http_client::LwsHttpClient lws_client(config.timeout_milliseconds());
    openweather::WeatherApi weather_api(config, lws_client);

    mcp_tools::ToolRegistry registry;
    tool_handlers::register_weather_tools(registry, weather_api);

    mcp_dispatch::Dispatcher dispatcher(registry, {
        "clima-servidor",
        MCPTOOLS_VERSION,
        "Servidor MCP para consulta de información meteorológica"
    });

    if (!config.has_usable_api_key()) {
        mcp_stdio::log_message("Advertencia: la API key parece inválida (menos de 10 caracteres).");
    }
    mcp_stdio::log_message("Servidor MCP de clima inicializado correctamente.");

    long served = mcp_stdio::serve(dispatcher, std::cin, std::cout, shutdown_signal::requested_flag());

    mcp_stdio::log_message("Servidor MCP de clima finalizado (" + std::to_string(served) + " solicitudes atendidas).");
    return 0;
}
