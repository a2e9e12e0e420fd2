#pragma once

#include <condition_variable>
#include <mutex>
#include <string>

#include "civetweb.h"
#include "service_handlers.hpp"

/**
 * @brief Same routes as LoadServer, served by CivetWeb's worker threads.
 */
class LoadServerCw
{
public:
    LoadServerCw(int thread_count=8, LoadTestRunner run_fn=nullptr);
    ~LoadServerCw();

    LoadServerCw(const LoadServerCw&) = delete;
    LoadServerCw& operator=(const LoadServerCw&) = delete;

    // Starts the worker threads and returns; throws std::runtime_error on failure.
    void Start(const std::string &host, int port);

    // Start() then block until Stop() is called from another thread.
    int Listen(const std::string &host, int port);

    void Stop();

    // CivetWeb context
    mg_context* ctx = nullptr;

    int thread_count;
    LoadTestRunner runner;

    std::mutex stop_mtx;
    std::condition_variable stop_cv;
    bool stop_requested = false;

    // Handlers
    void HandleHealth(struct mg_connection *conn);
    void HandleLoadTest(struct mg_connection *conn);

    // Helper utilities
    std::string read_body(struct mg_connection *conn);
    void send_response(struct mg_connection *conn, const HandlerResponse &out);
};
