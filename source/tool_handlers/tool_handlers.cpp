#include "tool_handlers/tool_handlers.hpp"

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_suma { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_resta { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_multiplicacion { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_division { void register_tool(mcp_tools::ToolRegistry &registry); }

namespace tool_consultar_clima_actual {
void register_tool(mcp_tools::ToolRegistry &registry, openweather::WeatherApi &weather_api);
}
namespace tool_buscar_ciudades {
void register_tool(mcp_tools::ToolRegistry &registry, openweather::WeatherApi &weather_api);
}
namespace tool_validar_configuracion {
void register_tool(mcp_tools::ToolRegistry &registry, openweather::WeatherApi &weather_api);
}

namespace tool_handlers {

void register_calculator_tools(mcp_tools::ToolRegistry &registry) {
    tool_suma::register_tool(registry);
    tool_resta::register_tool(registry);
    tool_multiplicacion::register_tool(registry);
    tool_division::register_tool(registry);
}

void register_weather_tools(mcp_tools::ToolRegistry &registry, openweather::WeatherApi &weather_api) {
    tool_consultar_clima_actual::register_tool(registry, weather_api);
    tool_buscar_ciudades::register_tool(registry, weather_api);
    tool_validar_configuracion::register_tool(registry, weather_api);
}

} // namespace tool_handlers
