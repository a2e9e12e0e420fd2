#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "LoadTestConfig.h"
#include "LoadTestReport.h"

#ifndef HTTPLOAD_VERSION
#define HTTPLOAD_VERSION "0.0.0"
#endif

using LoadTestRunner = std::function<LoadTestReport(const LoadTestConfig&)>;

// Backend-independent response produced by a route handler.
struct HandlerResponse {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
};

// GET /health
HandlerResponse handle_health();

/**
 * @brief POST /load-test: parses the JSON config, runs it and returns the
 * report. Malformed JSON or an invalid config yields 400.
 */
HandlerResponse handle_load_test(const std::string& body, const LoadTestRunner& runner);

/**
 * @brief Builds and validates a config from the request JSON
 * (url, method, requests, concurrency, [timeout_ms], [headers], [body]).
 * @throws ConfigError on missing fields, wrong types or invalid values.
 */
LoadTestConfig config_from_json(const nlohmann::json& j);
