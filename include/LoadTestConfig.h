#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

enum class HttpMethod { GET, POST, PUT, PATCH, DELETE };

// Longest per-request timeout accepted.
constexpr std::chrono::milliseconds kMaxTimeout{24LL * 60 * 60 * 1000};

/**
 * @brief Thrown when a load test cannot start because its configuration
 * is invalid (bad URL, zero counts, unknown method, ...).
 */
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// Scheme/host/port/path split of an absolute http(s) URL.
struct TargetUrl {
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path;   // path + query, always starts with '/'

    // "scheme://host:port", the form httplib::Client accepts.
    std::string origin() const;
};

/**
 * @brief Everything needed to run one load test. Immutable once a run starts.
 */
struct LoadTestConfig {
    std::string url;
    HttpMethod method = HttpMethod::GET;
    long long requests = 1;
    long long concurrency = 1;
    std::chrono::milliseconds timeout{30000};
    std::vector<std::pair<std::string, std::string>> headers;
    std::optional<std::string> body;
};

const char* to_string(HttpMethod method);
HttpMethod parse_method(const std::string& text);
bool method_accepts_body(HttpMethod method);

TargetUrl parse_target_url(const std::string& url);

// "key:value,key:value" -> ordered pairs. Throws ConfigError on a bad entry.
std::vector<std::pair<std::string, std::string>> parse_header_list(const std::string& text);

// Throws ConfigError describing the first violated constraint.
void validate_config(const LoadTestConfig& config);
