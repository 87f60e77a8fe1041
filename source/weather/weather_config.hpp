#ifndef MCPTOOLS_WEATHER_CONFIG_HPP
#define MCPTOOLS_WEATHER_CONFIG_HPP

// Weather server configuration, read once from the environment at startup.

#include <cstddef>
#include <string>

namespace weather_config {

constexpr const char *API_KEY_VARIABLE = "OPENWEATHERMAP_API_KEY";
constexpr const char *TIMEOUT_VARIABLE = "API_TIMEOUT";

// Largest API_TIMEOUT accepted, in seconds; its millisecond value must fit in an int.
constexpr double MAXIMUM_TIMEOUT_SECONDS = 2000000.0;

// Keys shorter than this are rejected by the tools before any network call.
constexpr std::size_t MINIMUM_API_KEY_LENGTH = 10;

struct WeatherConfig {
    std::string api_key;
    std::string base_url = "https://api.openweathermap.org/data/2.5";
    std::string geo_url = "https://api.openweathermap.org/geo/1.0";
    double timeout_seconds = 30.0;

    bool has_usable_api_key() const { return api_key.size() >= MINIMUM_API_KEY_LENGTH; }
    int timeout_milliseconds() const { return static_cast<int>(timeout_seconds * 1000.0); }
};

struct ConfigLoadResult {
    bool success = false;
    WeatherConfig config;
    std::string error_message;
};

// Fails if OPENWEATHERMAP_API_KEY is unset or empty, or API_TIMEOUT is not a positive
// number no larger than MAXIMUM_TIMEOUT_SECONDS.
ConfigLoadResult load_config_from_environment();

} // namespace weather_config

#endif // MCPTOOLS_WEATHER_CONFIG_HPP
