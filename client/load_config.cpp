#include "LoadTestConfig.h"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace {

std::string trim(const std::string& s)
{
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool is_valid_header_name(const std::string& name)
{
    if (name.empty()) return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
}

} // namespace

std::string TargetUrl::origin() const
{
    return scheme + "://" + host + ":" + std::to_string(port);
}

const char* to_string(HttpMethod method)
{
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::PATCH: return "PATCH";
        case HttpMethod::DELETE: return "DELETE";
    }
    return "GET";
}

HttpMethod parse_method(const std::string& text)
{
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "GET") return HttpMethod::GET;
    if (upper == "POST") return HttpMethod::POST;
    if (upper == "PUT") return HttpMethod::PUT;
    if (upper == "PATCH") return HttpMethod::PATCH;
    if (upper == "DELETE") return HttpMethod::DELETE;
    throw ConfigError("Invalid method: " + text);
}

bool method_accepts_body(HttpMethod method)
{
    return method != HttpMethod::GET;
}

TargetUrl parse_target_url(const std::string& url)
{
    // scheme :// host-or-[ipv6] [:port] [path/query/fragment]
    static const std::regex urlRegex(
        "^([A-Za-z][A-Za-z0-9+.-]*)://([^/?#:\\[\\]@]+|\\[[0-9A-Fa-f:.]+\\])(?::([0-9]+))?([/?#].*)?$");

    std::smatch match;
    if (!std::regex_match(url, match, urlRegex)) {
        throw ConfigError("Invalid URL: " + url);
    }

    TargetUrl target;
    target.scheme = match[1].str();
    std::transform(target.scheme.begin(), target.scheme.end(), target.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (target.scheme != "http" && target.scheme != "https") {
        throw ConfigError("Invalid URL: unsupported scheme '" + target.scheme + "'");
    }

    target.host = match[2].str();

    if (match[3].matched) {
        const std::string portText = match[3].str();
        if (portText.size() > 5) {
            throw ConfigError("Invalid URL: port out of range in " + url);
        }
        target.port = std::stoi(portText);
        if (target.port < 1 || target.port > 65535) {
            throw ConfigError("Invalid URL: port out of range in " + url);
        }
    } else {
        target.port = (target.scheme == "https") ? 443 : 80;
    }

    std::string rest = match[4].matched ? match[4].str() : "";
    size_t hash = rest.find('#');
    if (hash != std::string::npos) rest.erase(hash);
    if (rest.empty() || rest[0] != '/') rest.insert(0, "/");
    target.path = rest;

    return target;
}

std::vector<std::pair<std::string, std::string>> parse_header_list(const std::string& text)
{
    std::vector<std::pair<std::string, std::string>> headers;
    std::stringstream ss(text);
    std::string entry;
    while (std::getline(ss, entry, ',')) {
        if (trim(entry).empty()) continue;

        size_t colon = entry.find(':');
        if (colon == std::string::npos) {
            throw ConfigError("Invalid header format: '" + entry + "' (expected key:value)");
        }
        std::string name = trim(entry.substr(0, colon));
        std::string value = trim(entry.substr(colon + 1));
        if (!is_valid_header_name(name)) {
            throw ConfigError("Invalid header name: '" + name + "'");
        }
        headers.emplace_back(name, value);
    }
    return headers;
}

void validate_config(const LoadTestConfig& config)
{
    parse_target_url(config.url);

    if (config.requests < 1) {
        throw ConfigError("Invalid number of requests: must be greater than 0");
    }
    if (config.concurrency < 1) {
        throw ConfigError("Invalid concurrency: must be greater than 0");
    }
    if (config.timeout.count() <= 0) {
        throw ConfigError("Invalid timeout: must be greater than 0");
    }
    if (config.timeout > kMaxTimeout) {
        throw ConfigError("Invalid timeout: must not exceed " +
                          std::to_string(kMaxTimeout.count()) + " ms");
    }
    for (const auto& header : config.headers) {
        if (!is_valid_header_name(header.first)) {
            throw ConfigError("Invalid header name: '" + header.first +
                              "' contains invalid characters");
        }
    }
}
