#pragma once

#include <atomic>
#include <string>

#include <httplib.h>
#include "service_handlers.hpp"

/**
 * @brief REST front end on httplib::Server: GET /health and POST /load-test.
 * Requests are served by a fixed-size thread pool; every load test runs
 * with its own dispatcher and aggregator, so concurrent runs never share
 * state.
 */
class LoadServer
{
    httplib::Server server;
    LoadTestRunner runner;

    std::atomic<long long> active_runs{0};

public:
    LoadServer(int thread_count=8, LoadTestRunner run_fn=nullptr);

    void Health(const httplib::Request &req, httplib::Response &res);

    void RunLoadTest(const httplib::Request &req, httplib::Response &res);

    // Blocks until Stop() is called. Returns -1 if the port cannot be bound.
    int Listen(const std::string &host, int port);

    // Binds to an ephemeral port and returns it (-1 on failure); serve with ListenAfterBind().
    int BindToAnyPort(const std::string &host);
    bool ListenAfterBind();
    void WaitUntilReady();

    void Stop();

    // Load tests currently being served by this instance.
    long long ActiveRuns() const { return active_runs.load(); }
};
