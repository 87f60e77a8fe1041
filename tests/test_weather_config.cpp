// Tests for reading the weather configuration from the environment.

#include "weather/weather_config.hpp"
#include "test_support.hpp"

#include <cstdlib>

using test_support::report;

namespace test_weather_config {

static void clear_environment() {
    unsetenv(weather_config::API_KEY_VARIABLE);
    unsetenv(weather_config::TIMEOUT_VARIABLE);
}

static bool test_missing_key_fails() {
    clear_environment();
    weather_config::ConfigLoadResult result = weather_config::load_config_from_environment();
    bool success = !result.success && result.error_message.find("OPENWEATHERMAP_API_KEY") != std::string::npos;
    return report(success, "a missing API key is a startup error", result.error_message);
}

static bool test_blank_key_fails() {
    clear_environment();
    setenv(weather_config::API_KEY_VARIABLE, "   ", 1);
    weather_config::ConfigLoadResult result = weather_config::load_config_from_environment();
    clear_environment();
    return report(!result.success, "a blank API key is a startup error", result.error_message);
}

static bool test_defaults() {
    clear_environment();
    setenv(weather_config::API_KEY_VARIABLE, "abcdef0123456789", 1);
    weather_config::ConfigLoadResult result = weather_config::load_config_from_environment();
    clear_environment();

    const weather_config::WeatherConfig &config = result.config;
    bool success = result.success && config.api_key == "abcdef0123456789" && config.timeout_seconds == 30.0 &&
                   config.timeout_milliseconds() == 30000 &&
                   config.base_url == "https://api.openweathermap.org/data/2.5" &&
                   config.geo_url == "https://api.openweathermap.org/geo/1.0" && config.has_usable_api_key();
    return report(success, "timeout and endpoints default when only the key is set", result.error_message);
}

static bool test_custom_timeout() {
    clear_environment();
    setenv(weather_config::API_KEY_VARIABLE, "abcdef0123456789", 1);
    setenv(weather_config::TIMEOUT_VARIABLE, "2.5", 1);
    weather_config::ConfigLoadResult result = weather_config::load_config_from_environment();
    clear_environment();

    bool success = result.success && result.config.timeout_seconds == 2.5 &&
                   result.config.timeout_milliseconds() == 2500;
    return report(success, "API_TIMEOUT sets the request timeout in seconds", result.error_message);
}

static bool test_invalid_timeout_fails() {
    const char *bad_values[] = {"abc", "0", "-5", "inf", "nan"};

    bool success = true;
    for (const char *value : bad_values) {
        clear_environment();
        setenv(weather_config::API_KEY_VARIABLE, "abcdef0123456789", 1);
        setenv(weather_config::TIMEOUT_VARIABLE, value, 1);
        weather_config::ConfigLoadResult result = weather_config::load_config_from_environment();
        if (result.success || result.error_message.find("API_TIMEOUT") == std::string::npos) {
            success = false;
            std::cout << "    API_TIMEOUT=" << value << " was accepted" << std::endl;
        }
    }
    clear_environment();
    return report(success, "non-numeric or non-positive API_TIMEOUT is rejected");
}

static bool test_timeout_upper_bound() {
    clear_environment();
    setenv(weather_config::API_KEY_VARIABLE, "abcdef0123456789", 1);
    setenv(weather_config::TIMEOUT_VARIABLE, "1e12", 1);
    weather_config::ConfigLoadResult too_large = weather_config::load_config_from_environment();

    setenv(weather_config::TIMEOUT_VARIABLE, "2000000", 1);
    weather_config::ConfigLoadResult largest = weather_config::load_config_from_environment();
    clear_environment();

    bool success = !too_large.success && too_large.error_message.find("API_TIMEOUT") != std::string::npos &&
                   largest.success && largest.config.timeout_milliseconds() == 2000000000;
    return report(success, "API_TIMEOUT above the int millisecond range is rejected", too_large.error_message);
}

static bool test_short_key_loads_but_is_unusable() {
    clear_environment();
    setenv(weather_config::API_KEY_VARIABLE, "short", 1);
    weather_config::ConfigLoadResult result = weather_config::load_config_from_environment();
    clear_environment();

    bool success = result.success && !result.config.has_usable_api_key();
    return report(success, "a short key loads but is flagged unusable");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_missing_key_fails();
    all_passed &= test_blank_key_fails();
    all_passed &= test_defaults();
    all_passed &= test_custom_timeout();
    all_passed &= test_invalid_timeout_fails();
    all_passed &= test_timeout_upper_bound();
    all_passed &= test_short_key_loads_but_is_unusable();
    return all_passed;
}

} // namespace test_weather_config
