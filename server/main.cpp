#include <cstdlib>
#include <iostream>
#include <string>

#include "load_server.hpp"
#include "load_server_cw.hpp"

int main(int argc, char* argv[])
{
    if (argc < 2 || argc > 4) {
        std::cerr << "Usage: " << argv[0]
                  << " <port> [threads] [httplib|civetweb]\n"
                  << "Listen host is taken from HTTPLOAD_HOST (default 0.0.0.0).\n";
        return 1;
    }

    int port;
    int num_threads = 8;
    std::string backend = "httplib";

    try {
        port = std::stoi(argv[1]);
        if (argc >= 3) {
            num_threads = std::stoi(argv[2]);
        }
        if (argc == 4) {
            backend = argv[3];
        }
        if (port < 1 || port > 65535 || num_threads < 1) {
            throw std::invalid_argument("port must be 1-65535 and threads positive");
        }
        if (backend != "httplib" && backend != "civetweb") {
            throw std::invalid_argument("Invalid backend '" + backend + "'");
        }
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        return 1;
    }

    const char* env_host = std::getenv("HTTPLOAD_HOST");
    std::string host = (env_host && *env_host) ? env_host : "0.0.0.0";

    std::cout << "httpload server " << HTTPLOAD_VERSION << " (" << backend << ", "
              << num_threads << " threads)" << std::endl;

    if (backend == "civetweb") {
        LoadServerCw svr(num_threads);
        return svr.Listen(host, port) == 0 ? 0 : 1;
    }

    LoadServer svr(num_threads);
    return svr.Listen(host, port) == 0 ? 0 : 1;
}
