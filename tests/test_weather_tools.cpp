// Tests for the weather tools, with a scripted HTTP client in place of the network.

#include "mcp/mcp_dispatch.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/text.hpp"
#include "weather/openweather.hpp"
#include "test_support.hpp"

using json = nlohmann::json;
using test_support::report;

namespace test_weather_tools {

static const char MADRID_GEOCODE[] =
    R"([{"name":"Madrid","lat":40.4168,"lon":-3.7038,"country":"ES","state":"Community of Madrid"}])";

static const char MADRID_WEATHER[] = R"({
    "coord": {"lon": -3.7038, "lat": 40.4168},
    "weather": [{"id": 800, "main": "Clear", "description": "cielo claro", "icon": "01d"}],
    "main": {"temp": 22.5, "feels_like": 21.9, "pressure": 1015, "humidity": 40},
    "visibility": 10000,
    "wind": {"speed": 3.6, "deg": 250},
    "clouds": {"all": 0},
    "sys": {"country": "ES", "sunrise": 1700000000, "sunset": 1700036000},
    "timezone": 3600,
    "name": "Madrid"
})";

// Everything a weather server needs, wired the way main() wires it.
struct WeatherFixture {
    explicit WeatherFixture(const std::string &api_key = "0123456789abcdef")
        : config(make_config(api_key)), weather_api(config, client),
          dispatcher(registry, {"clima-servidor", "1.0.0", "Servidor MCP para consulta de información meteorológica"}) {
        tool_handlers::register_weather_tools(registry, weather_api);
    }

    json call(const std::string &tool, const json &arguments) {
        json request = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"},
                        {"params", {{"name", tool}, {"arguments", arguments}}}};
        return dispatcher.dispatch_message(request);
    }

    static weather_config::WeatherConfig make_config(const std::string &api_key) {
        weather_config::WeatherConfig weather_settings;
        weather_settings.api_key = api_key;
        return weather_settings;
    }

    weather_config::WeatherConfig config;
    test_support::ScriptedHttpClient client;
    openweather::WeatherApi weather_api;
    mcp_tools::ToolRegistry registry;
    mcp_dispatch::Dispatcher dispatcher;
};

static bool contains(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}

static bool test_tools_are_listed() {
    WeatherFixture fixture;
    json listing = fixture.registry.build_tools_list_response();
    bool success = listing["tools"].size() == 3 && listing["tools"][0]["name"] == "consultar_clima_actual" &&
                   listing["tools"][1]["name"] == "buscar_ciudades" &&
                   listing["tools"][2]["name"] == "validar_configuracion" &&
                   listing["tools"][0]["inputSchema"]["required"] == json::array({"ciudad"});
    return report(success, "the weather server lists its three tools in order", listing.dump());
}

static bool test_current_weather_success() {
    WeatherFixture fixture;
    fixture.client.enqueue(test_support::http_response(200, MADRID_GEOCODE));
    fixture.client.enqueue(test_support::http_response(200, MADRID_WEATHER));

    json response = fixture.call("consultar_clima_actual", {{"ciudad", "Madrid"}, {"codigo_pais", "ES"}});
    json payload = test_support::tool_payload(response);

    bool success = response["result"]["isError"] == false && payload["success"] == true &&
                   payload["ciudad"] == "Madrid" && payload["pais"] == "ES" && payload["temperatura"] == 22.5 &&
                   payload["sensacion_termica"] == 21.9 && payload["humedad"] == 40 &&
                   payload["presion"] == 1015 && payload["visibilidad"] == 10000 &&
                   payload["condiciones"] == "cielo claro" && payload["viento"]["velocidad"] == 3.6 &&
                   payload["viento"]["direccion"] == 250 && payload["viento"]["rafagas"].is_null() &&
                   payload["nubes"]["porcentaje"] == 0 && payload["coordenadas"]["latitud"] == 40.4168 &&
                   payload["timezone"] == 3600 && payload["unidades"] == "metric (°C)" &&
                   payload["amanecer"].get<std::string>().size() == 5 && payload.contains("timestamp");
    return report(success, "consultar_clima_actual renames the weather fields", payload.dump());
}

static bool test_current_weather_request_urls() {
    WeatherFixture fixture;
    fixture.client.enqueue(test_support::http_response(200, MADRID_GEOCODE));
    fixture.client.enqueue(test_support::http_response(200, MADRID_WEATHER));

    fixture.call("consultar_clima_actual", {{"ciudad", "Madrid"}, {"codigo_pais", "ES"}, {"unidades", "imperial"}});

    const std::vector<std::string> &urls = fixture.client.requested_urls;
    bool success = urls.size() == 2 &&
                   contains(urls[0], "https://api.openweathermap.org/geo/1.0/direct?q=Madrid%2CES&limit=1") &&
                   contains(urls[0], "appid=0123456789abcdef") &&
                   contains(urls[1], "https://api.openweathermap.org/data/2.5/weather?lat=40.4168&lon=-3.7038") &&
                   contains(urls[1], "units=imperial") && contains(urls[1], "lang=es");
    return report(success, "geocoding then weather are requested with encoded parameters",
                  urls.empty() ? "" : urls[0]);
}

static bool test_country_code_fallback() {
    WeatherFixture fixture;
    fixture.client.enqueue(test_support::http_response(200, "[]"));
    fixture.client.enqueue(test_support::http_response(200, MADRID_GEOCODE));
    fixture.client.enqueue(test_support::http_response(200, MADRID_WEATHER));

    json response = fixture.call("consultar_clima_actual", {{"ciudad", "Madrid"}, {"codigo_pais", "MX"}});
    const std::vector<std::string> &urls = fixture.client.requested_urls;

    bool success = response["result"]["isError"] == false && urls.size() == 3 &&
                   contains(urls[0], "q=Madrid%2CMX") && contains(urls[1], "q=Madrid&");
    return report(success, "an empty lookup with country code is retried without it");
}

static bool test_city_not_found() {
    WeatherFixture fixture;
    fixture.client.enqueue(test_support::http_response(200, "[]"));

    json response = fixture.call("consultar_clima_actual", {{"ciudad", "Xyzzyqwerty"}});
    json payload = test_support::tool_payload(response);

    bool success = !response.contains("error") && response["result"]["isError"] == true &&
                   payload["success"] == false && payload["codigo_error"] == "CIUDAD_NO_ENCONTRADA" &&
                   contains(payload["error"].get<std::string>(), "Xyzzyqwerty") &&
                   fixture.client.requested_urls.size() == 1;
    return report(success, "an empty geocoding result gives CIUDAD_NO_ENCONTRADA", payload.dump());
}

static bool test_http_status_mapping() {
    struct Case {
        int status;
        const char *code;
    };
    const Case cases[] = {{401, "API_KEY_INVALIDA"}, {404, "CIUDAD_NO_ENCONTRADA"},
                          {429, "RATE_LIMIT"}, {500, "ERROR_API"}, {503, "ERROR_API"}};

    bool success = true;
    for (const auto &test_case : cases) {
        WeatherFixture fixture;
        fixture.client.enqueue(test_support::http_response(test_case.status, R"({"cod":"x"})"));
        json payload = test_support::tool_payload(fixture.call("consultar_clima_actual", {{"ciudad", "Madrid"}}));
        if (payload["codigo_error"] != test_case.code) {
            success = false;
            std::cout << "    HTTP " << test_case.status << " -> " << payload.dump() << std::endl;
        }
    }
    return report(success, "HTTP failure statuses map to their error codes");
}

static bool test_weather_endpoint_failure_is_mapped() {
    WeatherFixture fixture;
    fixture.client.enqueue(test_support::http_response(200, MADRID_GEOCODE));
    fixture.client.enqueue(test_support::http_response(429, "{}"));

    json payload = test_support::tool_payload(fixture.call("consultar_clima_actual", {{"ciudad", "Madrid"}}));
    bool success = payload["codigo_error"] == "RATE_LIMIT";
    return report(success, "a failing weather request maps like a failing geocode request", payload.dump());
}

static bool test_timeout() {
    WeatherFixture fixture;
    fixture.client.enqueue(test_support::timed_out_response());

    json response = fixture.call("consultar_clima_actual", {{"ciudad", "Madrid"}});
    json payload = test_support::tool_payload(response);
    bool success = response["result"]["isError"] == true && payload["codigo_error"] == "TIMEOUT";
    return report(success, "a timed-out request gives TIMEOUT", payload.dump());
}

static bool test_connection_failure() {
    WeatherFixture fixture;

    json payload = test_support::tool_payload(fixture.call("consultar_clima_actual", {{"ciudad", "Madrid"}}));
    bool success = payload["codigo_error"] == "ERROR_API";
    return report(success, "a connection failure gives ERROR_API", payload.dump());
}

static bool test_malformed_weather_body() {
    WeatherFixture fixture;
    fixture.client.enqueue(test_support::http_response(200, MADRID_GEOCODE));
    fixture.client.enqueue(test_support::http_response(200, "<html>oops</html>"));

    json payload = test_support::tool_payload(fixture.call("consultar_clima_actual", {{"ciudad", "Madrid"}}));
    bool success = payload["codigo_error"] == "ERROR_API_CLIMA";
    return report(success, "an unparsable weather body gives ERROR_API_CLIMA", payload.dump());
}

static bool test_short_api_key_makes_no_request() {
    WeatherFixture fixture("short");

    json clima = test_support::tool_payload(fixture.call("consultar_clima_actual", {{"ciudad", "Madrid"}}));
    json ciudades = test_support::tool_payload(fixture.call("buscar_ciudades", {{"query", "Madrid"}}));

    bool success = clima["codigo_error"] == "API_KEY_INVALIDA" && ciudades["codigo_error"] == "API_KEY_INVALIDA" &&
                   fixture.client.requested_urls.empty();
    return report(success, "a key shorter than 10 characters fails before any request", clima.dump());
}

static bool test_blank_city() {
    WeatherFixture fixture;

    json response = fixture.call("consultar_clima_actual", {{"ciudad", "   "}});
    json payload = test_support::tool_payload(response);
    bool success = response["result"]["isError"] == true && payload["codigo_error"] == "PARAMETRO_INVALIDO" &&
                   fixture.client.requested_urls.empty();
    return report(success, "a blank city gives PARAMETRO_INVALIDO", payload.dump());
}

static bool test_schema_violations() {
    const json bad_arguments[] = {
        json::object(),
        {{"ciudad", 42}},
        {{"ciudad", "Madrid"}, {"codigo_pais", "es"}},
        {{"ciudad", "Madrid"}, {"codigo_pais", "ESP"}},
        {{"ciudad", "Madrid"}, {"unidades", "kelvin"}},
        {{"ciudad", "Madrid"}, {"viento", true}},
    };

    bool success = true;
    for (const auto &arguments : bad_arguments) {
        WeatherFixture fixture;
        json response = fixture.call("consultar_clima_actual", arguments);
        if (response["error"]["code"] != -32602 || !fixture.client.requested_urls.empty()) {
            success = false;
            std::cout << "    " << arguments.dump() << " -> " << response.dump() << std::endl;
        }
    }
    return report(success, "schema violations give -32602 without touching the network");
}

static bool test_search_cities() {
    WeatherFixture fixture;
    fixture.client.enqueue(test_support::http_response(200, R"([
        {"name":"Madrid","lat":40.4168,"lon":-3.7038,"country":"ES","state":"Community of Madrid"},
        {"name":"Madrid","lat":41.8781,"lon":-93.8238,"country":"US"}
    ])"));

    json response = fixture.call("buscar_ciudades", {{"query", "  Madrid "}, {"limit", 2}});
    json payload = test_support::tool_payload(response);

    bool success = payload["success"] == true && payload["total"] == 2 && payload["query"] == "Madrid" &&
                   payload["resultados"][0]["nombre"] == "Madrid" &&
                   payload["resultados"][0]["estado"] == "Community of Madrid" &&
                   payload["resultados"][1]["estado"].is_null() && payload["resultados"][1]["pais"] == "US" &&
                   payload["resultados"][1]["longitud"] == -93.8238 &&
                   contains(fixture.client.requested_urls[0], "q=Madrid&limit=2");
    return report(success, "buscar_ciudades lists every match", payload.dump());
}

static bool test_search_cities_without_matches() {
    WeatherFixture fixture;
    fixture.client.enqueue(test_support::http_response(200, "[]"));

    json payload = test_support::tool_payload(fixture.call("buscar_ciudades", {{"query", "Qqqq"}}));
    bool success = payload["success"] == true && payload["total"] == 0 && payload["resultados"].empty() &&
                   contains(payload["mensaje"].get<std::string>(), "Qqqq") &&
                   contains(fixture.client.requested_urls[0], "limit=5");
    return report(success, "no matches is still a successful search", payload.dump());
}

static bool test_search_cities_argument_checks() {
    const json bad_arguments[] = {
        {{"query", "M"}},
        {{"query", " M "}},
        {{"query", "Madrid"}, {"limit", 0}},
        {{"query", "Madrid"}, {"limit", 21}},
        {{"query", "Madrid"}, {"limit", 2.5}},
        {{"limit", 3}},
    };

    bool success = true;
    for (const auto &arguments : bad_arguments) {
        WeatherFixture fixture;
        json response = fixture.call("buscar_ciudades", arguments);
        if (response["error"]["code"] != -32602) {
            success = false;
            std::cout << "    " << arguments.dump() << " -> " << response.dump() << std::endl;
        }
    }
    return report(success, "short queries and out-of-range limits give -32602");
}

static bool test_validate_configuration_ok() {
    WeatherFixture fixture;
    fixture.client.enqueue(test_support::http_response(200, MADRID_WEATHER));

    json response = fixture.call("validar_configuracion", json::object());
    json payload = test_support::tool_payload(response);
    const json &configuration = payload["configuracion"];

    bool success = response["result"]["isError"] == false && payload["estado_general"] == "OK" &&
                   configuration["api_key_configurada"] == true && configuration["api_funcional"] == true &&
                   configuration["timeout_segundos"] == 30.0 &&
                   configuration["url_base"] == "OpenWeatherMap API/data/2.5" &&
                   configuration["version_servidor"] == "1.0.0" &&
                   contains(fixture.client.requested_urls[0], "/data/2.5/weather?q=London%2CUK");
    return report(success, "validar_configuracion reports OK when the probe succeeds", payload.dump());
}

static bool test_validate_configuration_needs_attention() {
    WeatherFixture fixture;
    fixture.client.enqueue(test_support::http_response(401, R"({"cod":401})"));

    json response = fixture.call("validar_configuracion", json::object());
    json payload = test_support::tool_payload(response);

    bool success = response["result"]["isError"] == false && payload["success"] == true &&
                   payload["estado_general"] == "REQUIERE_ATENCION" &&
                   payload["configuracion"]["api_funcional"] == false &&
                   payload["configuracion"]["estado_conexion"] == "API key inválida";
    return report(success, "a rejected probe is reported, not raised", payload.dump());
}

static bool test_failure_mapping_directly() {
    http_client::HttpResponse refused;
    refused.error_detail = "connection refused";
    openweather::ApiFailure failure = openweather::map_http_failure(refused);

    json payload = openweather::failure_payload(failure);
    bool success = failure.code == "ERROR_API" && contains(failure.message, "connection refused") &&
                   payload["codigo_error"] == "ERROR_API" && payload.size() == 2;
    return report(success, "transport failures carry their detail into the message", payload.dump());
}

static bool test_weather_payload_tolerates_missing_fields() {
    json payload = openweather::build_weather_payload(json::parse(R"({"name":"Nada","wind":{"gust":9.1}})"), "standard");
    bool success = payload["ciudad"] == "Nada" && payload["temperatura"] == 0.0 &&
                   payload["visibilidad"].is_null() && payload["viento"]["rafagas"] == 9.1 &&
                   payload["condiciones"] == "" && payload["unidades"] == "standard (K)";
    return report(success, "missing weather fields fall back to defaults", payload.dump());
}

static bool test_weather_payload_ignores_non_integral_sun_times() {
    json data = json::parse(R"({"name":"Rara","sys":{"sunrise":1e30,"sunset":-2.5}})");
    json payload = openweather::build_weather_payload(data, "metric");
    std::string midnight = text::format_clock_time(0);
    bool success = payload["amanecer"] == midnight && payload["atardecer"] == midnight;
    return report(success, "sunrise and sunset that are not integers read as 0", payload.dump());
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_tools_are_listed();
    all_passed &= test_current_weather_success();
    all_passed &= test_current_weather_request_urls();
    all_passed &= test_country_code_fallback();
    all_passed &= test_city_not_found();
    all_passed &= test_http_status_mapping();
    all_passed &= test_weather_endpoint_failure_is_mapped();
    all_passed &= test_timeout();
    all_passed &= test_connection_failure();
    all_passed &= test_malformed_weather_body();
    all_passed &= test_short_api_key_makes_no_request();
    all_passed &= test_blank_city();
    all_passed &= test_schema_violations();
    all_passed &= test_search_cities();
    all_passed &= test_search_cities_without_matches();
    all_passed &= test_search_cities_argument_checks();
    all_passed &= test_validate_configuration_ok();
    all_passed &= test_validate_configuration_needs_attention();
    all_passed &= test_failure_mapping_directly();
    all_passed &= test_weather_payload_tolerates_missing_fields();
    all_passed &= test_weather_payload_ignores_non_integral_sun_times();
    return all_passed;
}

} // namespace test_weather_tools
