#include "cli_args.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace {

long long parse_integer(const std::string& flag, const std::string& value)
{
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + flag + ": '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("Invalid value for " + flag + ": '" + value + "'");
    }
    return parsed;
}

} // namespace

CliOptions parse_cli_args(int argc, const char* const argv[])
{
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;
        bool inline_value = false;

        if (arg.rfind("--", 0) == 0) {
            size_t eq = arg.find('=');
            if (eq != std::string::npos) {
                value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                inline_value = true;
            }
        }

        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
            continue;
        }
        if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
            continue;
        }

        if (!inline_value) {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            value = argv[++i];
        }

        if (arg == "-u" || arg == "--url") {
            options.url = value;
        } else if (arg == "-n" || arg == "--requests") {
            options.requests = parse_integer(arg, value);
        } else if (arg == "-c" || arg == "--concurrency") {
            options.concurrency = parse_integer(arg, value);
        } else if (arg == "-m" || arg == "--method") {
            options.method = value;
        } else if (arg == "-w" || arg == "--workers") {
            long long workers = parse_integer(arg, value);
            if (workers < 0 || workers > 4096) {
                throw std::invalid_argument("Invalid value for " + arg + ": '" + value + "'");
            }
            options.worker_threads = static_cast<unsigned>(workers);
        } else if (arg == "-t" || arg == "--timeout") {
            options.timeout_sec = parse_integer(arg, value);
        } else if (arg == "-b" || arg == "--body") {
            options.body = value;
            options.has_body = true;
        } else if (arg == "-H" || arg == "--headers") {
            options.header_lists.push_back(value);
        } else if (arg == "-f" || arg == "--format") {
            if (value == "text") {
                options.format = OutputFormat::Text;
            } else if (value == "json") {
                options.format = OutputFormat::Json;
            } else {
                throw std::invalid_argument("Invalid output format: '" + value + "' (text or json)");
            }
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    if (!options.show_help && options.url.empty()) {
        throw std::invalid_argument("Missing required option --url");
    }
    return options;
}

LoadTestConfig to_load_test_config(const CliOptions& options)
{
    LoadTestConfig config;
    config.url = options.url;
    config.method = parse_method(options.method);
    config.requests = options.requests;

    if (options.concurrency.has_value()) {
        config.concurrency = *options.concurrency;
    } else {
        config.concurrency = std::max(1u, std::thread::hardware_concurrency());
    }

    // Range-checked here; seconds this large would overflow as milliseconds
    if (options.timeout_sec < 1 || options.timeout_sec > kMaxTimeout.count() / 1000) {
        throw ConfigError("Invalid timeout: must be between 1 and " +
                          std::to_string(kMaxTimeout.count() / 1000) + " seconds");
    }
    config.timeout = std::chrono::seconds(options.timeout_sec);

    for (const auto& list : options.header_lists) {
        auto parsed = parse_header_list(list);
        config.headers.insert(config.headers.end(), parsed.begin(), parsed.end());
    }
    if (options.has_body) {
        config.body = options.body;
    }

    validate_config(config);
    return config;
}

std::string usage(const std::string& program)
{
    std::ostringstream ss;
    ss << "Usage: " << program << " --url <url> [options]\n"
       << "  -u, --url <url>            Target URL (http or https)\n"
       << "  -n, --requests <n>         Total requests to send (default 100)\n"
       << "  -c, --concurrency <n>      Concurrent requests (default: hardware threads)\n"
       << "  -m, --method <method>      GET, POST, PUT, PATCH or DELETE (default GET)\n"
       << "  -t, --timeout <sec>        Per-request timeout in seconds (default 30)\n"
       << "  -w, --workers <n>          I/O threads shared by all slots (default: hardware threads)\n"
       << "  -b, --body <json>          Request body (not sent with GET)\n"
       << "  -H, --headers <k:v,...>    Request headers, comma separated, repeatable\n"
       << "  -f, --format <text|json>   Report format (default text)\n"
       << "  -v, --verbose              Log progress to stderr\n"
       << "Example: " << program << " -u http://localhost:8080/ -n 1000 -c 16\n";
    return ss.str();
}
