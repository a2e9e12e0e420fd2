#include "load_server.hpp"

#include <iostream>

#include "load_runner.hpp"

namespace {

void apply(const HandlerResponse &out, httplib::Response &res)
{
    res.status = out.status;
    res.set_content(out.body, out.content_type);
}

// Holds one slot of a run counter for the lifetime of a request.
class RunCounterGuard
{
    std::atomic<long long> &counter;

public:
    explicit RunCounterGuard(std::atomic<long long> &c): counter(c) { ++counter; }
    ~RunCounterGuard() { --counter; }

    RunCounterGuard(const RunCounterGuard&) = delete;
    RunCounterGuard& operator=(const RunCounterGuard&) = delete;
};

} // namespace

LoadServer::LoadServer(int thread_count, LoadTestRunner run_fn):
    runner(std::move(run_fn))
{
    if (!runner) {
        runner = [](const LoadTestConfig &config) { return run_load_test(config); };
    }

    server.new_task_queue = [thread_count]{
        return new httplib::ThreadPool(thread_count);
    };

    server.set_tcp_nodelay(true);

    server.Get("/health", [this](const httplib::Request &req, httplib::Response &res) {
        Health(req, res);
    });
    server.Post("/load-test", [this](const httplib::Request &req, httplib::Response &res) {
        RunLoadTest(req, res);
    });
}

void LoadServer::Health(const httplib::Request & /*req*/, httplib::Response &res)
{
    apply(handle_health(), res);
}

void LoadServer::RunLoadTest(const httplib::Request &req, httplib::Response &res)
{
    RunCounterGuard guard(active_runs);
    std::cout << "[Server] Accepted load test (" << active_runs.load() << " running)" << std::endl;

    apply(handle_load_test(req.body, runner), res);
}

int LoadServer::Listen(const std::string &host, int port)
{
    std::cout << "Starting server on http://" << host << ":" << port << std::endl;
    if (!server.listen(host, port))
    {
        std::cerr << "Failed to start server!" << std::endl;
        return -1;
    }
    return 0;
}

int LoadServer::BindToAnyPort(const std::string &host)
{
    return server.bind_to_any_port(host);
}

bool LoadServer::ListenAfterBind()
{
    return server.listen_after_bind();
}

void LoadServer::WaitUntilReady()
{
    server.wait_until_ready();
}

void LoadServer::Stop()
{
    server.stop();
}
