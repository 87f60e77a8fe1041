#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"
#include "utils/text.hpp"

#include <nlohmann/json.hpp>
#include <cctype>

using json = nlohmann::json;

// Tool handler for "consultar_clima_actual".
// Resolves the city through the geocoding endpoint, then fetches and renames
// the current weather fields.

static bool is_country_code(const std::string &value) {
    return value.size() == 2 && std::isupper(static_cast<unsigned char>(value[0])) &&
           std::isupper(static_cast<unsigned char>(value[1]));
}

static bool is_known_units(const std::string &units) {
    return units == "metric" || units == "imperial" || units == "standard";
}

static mcp_tools::ValidationResult validate_arguments(const json &arguments) {
    mcp_tools::ValidationResult result;

    for (auto iterator = arguments.begin(); iterator != arguments.end(); ++iterator) {
        const std::string &key = iterator.key();
        if (key != "ciudad" && key != "codigo_pais" && key != "unidades" && key != "idioma") {
            result.error = "Argumento no permitido: '" + key + "'";
            return result;
        }
    }

    if (!arguments.contains("ciudad") || !arguments["ciudad"].is_string()) {
        result.error = "Falta el argumento requerido 'ciudad' (string)";
        return result;
    }

    std::string country_code;
    if (arguments.contains("codigo_pais") && !arguments["codigo_pais"].is_null()) {
        if (!arguments["codigo_pais"].is_string() ||
            !is_country_code(arguments["codigo_pais"].get<std::string>())) {
            result.error = "'codigo_pais' debe ser un código ISO de 2 letras mayúsculas (ej: 'ES')";
            return result;
        }
        country_code = arguments["codigo_pais"].get<std::string>();
    }

    std::string units = "metric";
    if (arguments.contains("unidades") && !arguments["unidades"].is_null()) {
        if (!arguments["unidades"].is_string() || !is_known_units(arguments["unidades"].get<std::string>())) {
            result.error = "'unidades' debe ser 'metric', 'imperial' o 'standard'";
            return result;
        }
        units = arguments["unidades"].get<std::string>();
    }

    std::string language = "es";
    if (arguments.contains("idioma") && !arguments["idioma"].is_null()) {
        if (!arguments["idioma"].is_string() || text::trim(arguments["idioma"].get<std::string>()).empty()) {
            result.error = "'idioma' debe ser un código de idioma (ej: 'es', 'en')";
            return result;
        }
        language = text::trim(arguments["idioma"].get<std::string>());
    }

    result.valid = true;
    result.arguments = {
        {"ciudad", arguments["ciudad"].get<std::string>()},
        {"codigo_pais", country_code},
        {"unidades", units},
        {"idioma", language}
    };
    return result;
}

static mcp_tools::ToolResult handle_consultar_clima_actual(openweather::WeatherApi &weather_api,
                                                           const json &arguments) {
    std::string city = text::trim(arguments["ciudad"].get<std::string>());
    std::string country_code = arguments["codigo_pais"].get<std::string>();
    std::string units = arguments["unidades"].get<std::string>();
    std::string language = arguments["idioma"].get<std::string>();

    if (city.empty()) {
        return mcp_tools::failure_result(openweather::failure_payload(
            {openweather::CODE_INVALID_PARAMETER, "Nombre de ciudad requerido"}));
    }

    // Checked before any outbound call.
    if (!weather_api.config().has_usable_api_key()) {
        return mcp_tools::failure_result(openweather::failure_payload(
            {openweather::CODE_INVALID_API_KEY, "API key no configurada o inválida"}));
    }

    debug_log::log("consultar_clima_actual invoked ciudad=" + city);
    openweather::GeocodeResult geocode = weather_api.locate_city(city, country_code);
    if (!geocode.success) {
        return mcp_tools::failure_result(openweather::failure_payload(geocode.failure));
    }
    if (geocode.locations.empty()) {
        return mcp_tools::failure_result(openweather::failure_payload(
            {openweather::CODE_CITY_NOT_FOUND,
             "Ciudad '" + city + "' no encontrada. Verifica el nombre e intenta con código de país."}));
    }

    const openweather::Location &location = geocode.locations.front();
    openweather::WeatherResult weather =
        weather_api.current_weather(location.latitude, location.longitude, units, language);
    if (!weather.success) {
        return mcp_tools::failure_result(openweather::failure_payload(weather.failure));
    }

    return mcp_tools::success_result(openweather::build_weather_payload(weather.data, units));
}

namespace tool_consultar_clima_actual {

void register_tool(mcp_tools::ToolRegistry &registry, openweather::WeatherApi &weather_api) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"ciudad", {
            {"type", "string"},
            {"description", "Nombre de la ciudad (ej: 'Madrid', 'New York', 'Paris')"},
            {"minLength", 1}
        }},
        {"codigo_pais", {
            {"type", "string"},
            {"description", "Código de país ISO de 2 letras (ej: 'ES', 'US', 'FR'). Opcional, mejora la precisión"},
            {"pattern", "^[A-Z]{2}$"}
        }},
        {"unidades", {
            {"type", "string"},
            {"description", "Unidades de medida: 'metric' (Celsius), 'imperial' (Fahrenheit), 'standard' (Kelvin)"},
            {"enum", json::array({"metric", "imperial", "standard"})},
            {"default", "metric"}
        }},
        {"idioma", {
            {"type", "string"},
            {"description", "Código de idioma para la respuesta (ej: 'es', 'en', 'fr')"},
            {"default", "es"}
        }}
    };
    input_schema["required"] = json::array({"ciudad"});
    input_schema["additionalProperties"] = false;

    registry.register_tool({
        "consultar_clima_actual",
        "Consulta el clima actual para una ciudad específica usando OpenWeatherMap API",
        input_schema,
        validate_arguments,
        [&weather_api](const json &arguments) {
            return handle_consultar_clima_actual(weather_api, arguments);
        }
    });
}

} // namespace tool_consultar_clima_actual
