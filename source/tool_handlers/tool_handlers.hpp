#ifndef MCPTOOLS_TOOL_HANDLERS_HPP
#define MCPTOOLS_TOOL_HANDLERS_HPP

// Tool handler registration.
// Each tool_*.cpp file provides a register function that is called during startup.

#include "mcp/mcp_tools.hpp"
#include "weather/openweather.hpp"

namespace tool_handlers {

// Register suma, resta, multiplicacion and division, in that order.
void register_calculator_tools(mcp_tools::ToolRegistry &registry);

// Register consultar_clima_actual, buscar_ciudades and validar_configuracion.
// The WeatherApi must outlive the registry.
void register_weather_tools(mcp_tools::ToolRegistry &registry, openweather::WeatherApi &weather_api);

} // namespace tool_handlers

#endif // MCPTOOLS_TOOL_HANDLERS_HPP
