#pragma once

#include <optional>
#include <string>
#include <vector>

#include "LoadTestConfig.h"

enum class OutputFormat { Text, Json };

struct CliOptions {
    std::string url;
    long long requests = 100;
    std::optional<long long> concurrency;   // unset = number of hardware threads
    std::string method = "GET";
    long long timeout_sec = 30;
    unsigned worker_threads = 0;            // 0 = number of hardware threads
    std::string body;
    bool has_body = false;
    std::vector<std::string> header_lists;  // each "k:v,k:v"
    OutputFormat format = OutputFormat::Text;
    bool verbose = false;
    bool show_help = false;
};

/**
 * @brief Parses the command line. Flags take their value as the next
 * argument (`-n 100`) or after '=' (`--requests=100`).
 * @throws std::invalid_argument on unknown flags, missing or bad values.
 */
CliOptions parse_cli_args(int argc, const char* const argv[]);

// Throws ConfigError when the options do not form a valid config.
LoadTestConfig to_load_test_config(const CliOptions& options);

std::string usage(const std::string& program);
