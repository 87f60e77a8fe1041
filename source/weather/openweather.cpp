#include "weather/openweather.hpp"
#include "utils/debug_log.hpp"
#include "utils/text.hpp"

#include <cstdint>
#include <limits>
#include <utility>

namespace openweather {

// Member of an object, or null when the value is not an object or lacks the key.
static json member(const json &object, const char *key) {
    if (object.is_object()) {
        auto iterator = object.find(key);
        if (iterator != object.end()) {
            return *iterator;
        }
    }
    return nullptr;
}

static json number_or(const json &value, const json &fallback) {
    return value.is_number() ? value : fallback;
}

static std::string string_or_empty(const json &value) {
    return value.is_string() ? value.get<std::string>() : std::string();
}

// Integral timestamps only; floats and out-of-range values read as 0.
static std::int64_t unix_seconds_or_zero(const json &value) {
    if (value.is_number_unsigned()) {
        std::uint64_t seconds = value.get<std::uint64_t>();
        return seconds <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())
                   ? static_cast<std::int64_t>(seconds)
                   : 0;
    }
    if (value.is_number_integer()) {
        return value.get<std::int64_t>();
    }
    return 0;
}

static std::string format_coordinate(double value) {
    return json(value).dump();
}

ApiFailure map_http_failure(const http_client::HttpResponse &response) {
    ApiFailure failure;

    if (response.timed_out) {
        failure.code = CODE_TIMEOUT;
        failure.message = "Timeout: la API tardó demasiado en responder";
        return failure;
    }
    if (!response.success) {
        failure.code = CODE_API_ERROR;
        failure.message = "Error de conexión con la API: " + response.error_detail;
        return failure;
    }

    switch (response.status_code) {
    case 401:
        failure.code = CODE_INVALID_API_KEY;
        failure.message = "API key inválida o sin permisos";
        break;
    case 404:
        failure.code = CODE_CITY_NOT_FOUND;
        failure.message = "Ubicación no encontrada en la API";
        break;
    case 429:
        failure.code = CODE_RATE_LIMIT;
        failure.message = "Límite de solicitudes API excedido";
        break;
    default:
        failure.code = CODE_API_ERROR;
        failure.message = "Error del servidor API (HTTP " + std::to_string(response.status_code) + ")";
        break;
    }
    return failure;
}

json failure_payload(const ApiFailure &failure) {
    json payload;
    payload["error"] = failure.message;
    payload["codigo_error"] = failure.code;
    return payload;
}

std::string units_label(const std::string &units) {
    if (units == "metric") {
        return units + " (°C)";
    }
    if (units == "imperial") {
        return units + " (°F)";
    }
    if (units == "standard") {
        return units + " (K)";
    }
    return units + " (N/A)";
}

json build_weather_payload(const json &data, const std::string &units) {
    json main_block = member(data, "main");
    json system_block = member(data, "sys");
    json wind_block = member(data, "wind");
    json clouds_block = member(data, "clouds");
    json coordinates_block = member(data, "coord");

    json first_condition = json::object();
    json conditions = member(data, "weather");
    if (conditions.is_array() && !conditions.empty()) {
        first_condition = conditions[0];
    }

    json payload;
    payload["ciudad"] = string_or_empty(member(data, "name"));
    payload["pais"] = string_or_empty(member(system_block, "country"));
    payload["coordenadas"] = {
        {"latitud", number_or(member(coordinates_block, "lat"), 0.0)},
        {"longitud", number_or(member(coordinates_block, "lon"), 0.0)}
    };
    payload["temperatura"] = number_or(member(main_block, "temp"), 0.0);
    payload["sensacion_termica"] = number_or(member(main_block, "feels_like"), 0.0);
    payload["humedad"] = number_or(member(main_block, "humidity"), 0);
    payload["presion"] = number_or(member(main_block, "pressure"), 0);
    payload["visibilidad"] = number_or(member(data, "visibility"), nullptr);
    payload["condiciones"] = string_or_empty(member(first_condition, "description"));
    payload["viento"] = {
        {"velocidad", number_or(member(wind_block, "speed"), 0.0)},
        {"direccion", number_or(member(wind_block, "deg"), 0)},
        {"rafagas", number_or(member(wind_block, "gust"), nullptr)}
    };
    payload["nubes"] = {
        {"porcentaje", number_or(member(clouds_block, "all"), 0)}
    };

    payload["amanecer"] = text::format_clock_time(unix_seconds_or_zero(member(system_block, "sunrise")));
    payload["atardecer"] = text::format_clock_time(unix_seconds_or_zero(member(system_block, "sunset")));
    payload["timezone"] = number_or(member(data, "timezone"), 0);
    payload["timestamp"] = text::current_iso_timestamp();
    payload["unidades"] = units_label(units);
    return payload;
}

WeatherApi::WeatherApi(const weather_config::WeatherConfig &config, http_client::HttpClient &client)
    : api_config(config), client(client) {}

GeocodeResult WeatherApi::geocode(const std::string &query, int limit) {
    GeocodeResult result;

    std::string url = http_client::build_url(api_config.geo_url, "/direct", {
        {"q", query},
        {"limit", std::to_string(limit)},
        {"appid", api_config.api_key}
    });

    debug_log::log("Geocoding query: " + query);
    http_client::HttpResponse response = client.get(url);
    if (!response.success || !response.is_ok_status()) {
        result.failure = map_http_failure(response);
        return result;
    }

    json body = json::parse(response.body, nullptr, false);
    if (!body.is_array()) {
        result.failure.code = CODE_API_ERROR;
        result.failure.message = "Respuesta de geocodificación inválida";
        return result;
    }

    for (const auto &entry : body) {
        if (!entry.is_object()) {
            continue;
        }
        Location location;
        location.name = string_or_empty(member(entry, "name"));
        location.country = string_or_empty(member(entry, "country"));
        location.state = string_or_empty(member(entry, "state"));
        location.latitude = number_or(member(entry, "lat"), 0.0).get<double>();
        location.longitude = number_or(member(entry, "lon"), 0.0).get<double>();
        result.locations.push_back(location);
    }

    result.success = true;
    return result;
}

GeocodeResult WeatherApi::locate_city(const std::string &city, const std::string &country_code) {
    if (country_code.empty()) {
        return geocode(city, 1);
    }

    GeocodeResult result = geocode(city + "," + country_code, 1);
    if (result.success && result.locations.empty()) {
        debug_log::log("No match for " + city + "," + country_code + ", retrying without country code.");
        result = geocode(city, 1);
    }
    return result;
}

WeatherResult WeatherApi::current_weather(double latitude, double longitude, const std::string &units,
                                          const std::string &language) {
    WeatherResult result;

    std::string url = http_client::build_url(api_config.base_url, "/weather", {
        {"lat", format_coordinate(latitude)},
        {"lon", format_coordinate(longitude)},
        {"appid", api_config.api_key},
        {"units", units},
        {"lang", language}
    });

    http_client::HttpResponse response = client.get(url);
    if (!response.success || !response.is_ok_status()) {
        result.failure = map_http_failure(response);
        return result;
    }

    json body = json::parse(response.body, nullptr, false);
    if (!body.is_object()) {
        result.failure.code = CODE_WEATHER_API_ERROR;
        result.failure.message = "No se pudieron obtener datos meteorológicos";
        return result;
    }

    result.success = true;
    result.data = std::move(body);
    return result;
}

http_client::HttpResponse WeatherApi::probe() {
    std::string url = http_client::build_url(api_config.base_url, "/weather", {
        {"q", "London,UK"},
        {"appid", api_config.api_key},
        {"units", "metric"}
    });
    return client.get(url);
}

} // namespace openweather
