#ifndef MCPTOOLS_OPENWEATHER_HPP
#define MCPTOOLS_OPENWEATHER_HPP

// OpenWeatherMap access for the weather tools: geocoding, current weather,
// mapping of transport/HTTP failures to the tools' error codes, and the
// renaming of API fields into the tools' payloads.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "http/http_client.hpp"
#include "weather/weather_config.hpp"

namespace openweather {

using json = nlohmann::json;

// Error codes carried in "codigo_error".
constexpr const char *CODE_INVALID_PARAMETER = "PARAMETRO_INVALIDO";
constexpr const char *CODE_INVALID_API_KEY = "API_KEY_INVALIDA";
constexpr const char *CODE_CITY_NOT_FOUND = "CIUDAD_NO_ENCONTRADA";
constexpr const char *CODE_RATE_LIMIT = "RATE_LIMIT";
constexpr const char *CODE_TIMEOUT = "TIMEOUT";
constexpr const char *CODE_API_ERROR = "ERROR_API";
constexpr const char *CODE_WEATHER_API_ERROR = "ERROR_API_CLIMA";

struct ApiFailure {
    std::string code;
    std::string message;
};

struct Location {
    std::string name;
    std::string country;
    std::string state; // empty when the API omits it
    double latitude = 0.0;
    double longitude = 0.0;
};

struct GeocodeResult {
    bool success = false;
    std::vector<Location> locations;
    ApiFailure failure;
};

struct WeatherResult {
    bool success = false;
    json data; // raw /weather response body
    ApiFailure failure;
};

// Map a failed or non-2xx exchange to an error code.
// 401 -> API_KEY_INVALIDA, 404 -> CIUDAD_NO_ENCONTRADA, 429 -> RATE_LIMIT,
// timeout -> TIMEOUT, anything else -> ERROR_API.
ApiFailure map_http_failure(const http_client::HttpResponse &response);

// Payload {"error": message, "codigo_error": code} for a failed tool result.
json failure_payload(const ApiFailure &failure);

// Turn a /weather response into the consultar_clima_actual payload fields.
json build_weather_payload(const json &data, const std::string &units);

// Display label for a units value, e.g. "metric (°C)".
std::string units_label(const std::string &units);

class WeatherApi {
public:
    // Both references must outlive the WeatherApi.
    WeatherApi(const weather_config::WeatherConfig &config, http_client::HttpClient &client);

    // GET {geo_url}/direct?q=query&limit=N.
    GeocodeResult geocode(const std::string &query, int limit);

    // Resolve a city, retrying without the country code when that lookup is empty.
    GeocodeResult locate_city(const std::string &city, const std::string &country_code);

    // GET {base_url}/weather?lat&lon&units&lang.
    WeatherResult current_weather(double latitude, double longitude, const std::string &units,
                                  const std::string &language);

    // Connectivity check used by validar_configuracion (returns the raw exchange).
    http_client::HttpResponse probe();

    const weather_config::WeatherConfig &config() const { return api_config; }

private:
    const weather_config::WeatherConfig &api_config;
    http_client::HttpClient &client;
};

} // namespace openweather

#endif // MCPTOOLS_OPENWEATHER_HPP
