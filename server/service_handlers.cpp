#include "service_handlers.hpp"

#include <iostream>

#include "utils.h"

namespace {

HandlerResponse error_response(int status, const std::string& error, const std::string& details)
{
    nlohmann::json j = {{"error", error}, {"details", details}};
    return HandlerResponse{status, j.dump()};
}

long long required_integer(const nlohmann::json& j, const char* field)
{
    if (!j.contains(field)) {
        throw ConfigError(std::string("Missing field '") + field + "'");
    }
    const auto& v = j.at(field);
    if (!v.is_number_integer()) {
        throw ConfigError(std::string("Field '") + field + "' must be an integer");
    }
    return v.get<long long>();
}

std::string required_string(const nlohmann::json& j, const char* field)
{
    if (!j.contains(field)) {
        throw ConfigError(std::string("Missing field '") + field + "'");
    }
    const auto& v = j.at(field);
    if (!v.is_string()) {
        throw ConfigError(std::string("Field '") + field + "' must be a string");
    }
    return v.get<std::string>();
}

} // namespace

LoadTestConfig config_from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        throw ConfigError("Request body must be a JSON object");
    }

    LoadTestConfig config;
    config.url = required_string(j, "url");
    config.method = parse_method(required_string(j, "method"));
    config.requests = required_integer(j, "requests");
    config.concurrency = required_integer(j, "concurrency");

    if (j.contains("timeout_ms") && !j.at("timeout_ms").is_null()) {
        config.timeout = std::chrono::milliseconds(required_integer(j, "timeout_ms"));
    }

    if (j.contains("headers") && !j.at("headers").is_null()) {
        const auto& headers = j.at("headers");
        if (!headers.is_object()) {
            throw ConfigError("Field 'headers' must be an object of name/value strings");
        }
        for (const auto& item : headers.items()) {
            if (!item.value().is_string()) {
                throw ConfigError("Header '" + item.key() + "' must have a string value");
            }
            config.headers.emplace_back(item.key(), item.value().get<std::string>());
        }
    }

    if (j.contains("body") && !j.at("body").is_null()) {
        const auto& body = j.at("body");
        config.body = body.is_string() ? body.get<std::string>() : body.dump();
    }

    validate_config(config);
    return config;
}

HandlerResponse handle_health()
{
    nlohmann::json j = {{"status", "healthy"}, {"version", HTTPLOAD_VERSION}};
    return HandlerResponse{200, j.dump()};
}

HandlerResponse handle_load_test(const std::string& body, const LoadTestRunner& runner)
{
    LoadTestConfig config;
    try {
        config = config_from_json(nlohmann::json::parse(body));
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[Server] Rejected malformed load-test body: " << e.what() << std::endl;
        return error_response(400, "Invalid request body", e.what());
    } catch (const ConfigError& e) {
        std::cerr << "[Server] Rejected load-test config: " << e.what() << std::endl;
        return error_response(400, "Invalid configuration", e.what());
    }

    std::cout << "[Server] Load test " << to_string(config.method) << " " << config.url
              << " requests=" << config.requests << " concurrency=" << config.concurrency
              << std::endl;

    try {
        LoadTestReport report = runner(config);
        return HandlerResponse{200, report_to_json(report).dump()};
    } catch (const ConfigError& e) {
        return error_response(400, "Invalid configuration", e.what());
    } catch (const std::exception& e) {
        std::cerr << "[Server] Load test failed: " << e.what() << std::endl;
        return error_response(500, "Failed to run load test", e.what());
    }
}
