#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"
#include "utils/text.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static constexpr int MINIMUM_LIMIT = 1;
static constexpr int MAXIMUM_LIMIT = 20;
static constexpr int DEFAULT_LIMIT = 5;

static mcp_tools::ValidationResult validate_arguments(const json &arguments) {
    mcp_tools::ValidationResult result;

    for (auto iterator = arguments.begin(); iterator != arguments.end(); ++iterator) {
        if (iterator.key() != "query" && iterator.key() != "limit") {
            result.error = "Argumento no permitido: '" + iterator.key() + "'";
            return result;
        }
    }

    if (!arguments.contains("query") || !arguments["query"].is_string()) {
        result.error = "Falta el argumento requerido 'query' (string)";
        return result;
    }
    std::string query = text::trim(arguments["query"].get<std::string>());
    if (query.size() < 2) {
        result.error = "'query' debe tener al menos 2 caracteres";
        return result;
    }

    int limit = DEFAULT_LIMIT;
    if (arguments.contains("limit") && !arguments["limit"].is_null()) {
        const json &raw_limit = arguments["limit"];
        if (!raw_limit.is_number_integer() || raw_limit.get<long long>() < MINIMUM_LIMIT ||
            raw_limit.get<long long>() > MAXIMUM_LIMIT) {
            result.error = "'limit' debe ser un entero entre 1 y 20";
            return result;
        }
        limit = raw_limit.get<int>();
    }

    result.valid = true;
    result.arguments = {{"query", query}, {"limit", limit}};
    return result;
}

static json describe_location(const openweather::Location &location) {
    json entry;
    entry["nombre"] = location.name;
    entry["pais"] = location.country;
    entry["estado"] = location.state.empty() ? json(nullptr) : json(location.state);
    entry["latitud"] = location.latitude;
    entry["longitud"] = location.longitude;
    return entry;
}

static mcp_tools::ToolResult handle_buscar_ciudades(openweather::WeatherApi &weather_api, const json &arguments) {
    std::string query = arguments["query"].get<std::string>();
    int limit = arguments["limit"].get<int>();

    if (!weather_api.config().has_usable_api_key()) {
        return mcp_tools::failure_result(openweather::failure_payload(
            {openweather::CODE_INVALID_API_KEY, "API key no configurada o inválida"}));
    }

    debug_log::log("buscar_ciudades invoked query=" + query + " limit=" + std::to_string(limit));
    openweather::GeocodeResult geocode = weather_api.geocode(query, limit);
    if (!geocode.success) {
        return mcp_tools::failure_result(openweather::failure_payload(geocode.failure));
    }

    json payload;
    payload["query"] = query;
    payload["total"] = geocode.locations.size();
    payload["resultados"] = json::array();

    if (geocode.locations.empty()) {
        payload["mensaje"] = "No se encontraron ciudades que coincidan con '" + query + "'";
        return mcp_tools::success_result(payload);
    }

    for (const auto &location : geocode.locations) {
        payload["resultados"].push_back(describe_location(location));
    }
    payload["mensaje"] = "Se encontraron " + std::to_string(geocode.locations.size()) + " ciudades";
    return mcp_tools::success_result(payload);
}

namespace tool_buscar_ciudades {

void register_tool(mcp_tools::ToolRegistry &registry, openweather::WeatherApi &weather_api) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"query", {
            {"type", "string"},
            {"description", "Término de búsqueda para ciudades (ej: 'Madrid', 'New York', 'Tor')"},
            {"minLength", 2}
        }},
        {"limit", {
            {"type", "integer"},
            {"description", "Número máximo de resultados a devolver"},
            {"minimum", MINIMUM_LIMIT},
            {"maximum", MAXIMUM_LIMIT},
            {"default", DEFAULT_LIMIT}
        }}
    };
    input_schema["required"] = json::array({"query"});
    input_schema["additionalProperties"] = false;

    registry.register_tool({
        "buscar_ciudades",
        "Busca ciudades que coincidan con un término de búsqueda",
        input_schema,
        validate_arguments,
        [&weather_api](const json &arguments) {
            return handle_buscar_ciudades(weather_api, arguments);
        }
    });
}

} // namespace tool_buscar_ciudades
