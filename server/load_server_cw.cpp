#include "load_server_cw.hpp"

#include <cstring>
#include <iostream>
#include <stdexcept>

#include "load_runner.hpp"

static int dispatch_handler(struct mg_connection *conn, void *user_data);

LoadServerCw::LoadServerCw(int thread_count, LoadTestRunner run_fn)
    : thread_count(thread_count),
      runner(std::move(run_fn))
{
    if (!runner) {
        runner = [](const LoadTestConfig &config) { return run_load_test(config); };
    }
    mg_init_library(0);
}

LoadServerCw::~LoadServerCw()
{
    Stop();
    mg_exit_library();
}

static int dispatch_handler(struct mg_connection *conn, void *user_data)
{
    LoadServerCw* self = static_cast<LoadServerCw*>(user_data);
    const mg_request_info* info = mg_get_request_info(conn);

    std::string uri(info->local_uri ? info->local_uri : "");
    const char* method = info->request_method ? info->request_method : "";

    if (uri == "/health" && std::strcmp(method, "GET") == 0) {
        self->HandleHealth(conn);
        return 1;
    }

    if (uri == "/load-test" && std::strcmp(method, "POST") == 0) {
        self->HandleLoadTest(conn);
        return 1;
    }

    // Unknown route
    nlohmann::json j = {{"error", "Not Found"}, {"details", std::string(method) + " " + uri}};
    self->send_response(conn, HandlerResponse{404, j.dump()});
    return 1;
}

void LoadServerCw::HandleHealth(struct mg_connection *conn)
{
    send_response(conn, handle_health());
}

void LoadServerCw::HandleLoadTest(struct mg_connection *conn)
{
    std::string body = read_body(conn);
    send_response(conn, handle_load_test(body, runner));
}

std::string LoadServerCw::read_body(struct mg_connection *conn)
{
    std::string body;
    char buf[8192];
    int len;
    while ((len = mg_read(conn, buf, sizeof(buf))) > 0) {
        body.append(buf, static_cast<size_t>(len));
    }
    return body;
}

void LoadServerCw::send_response(struct mg_connection *conn, const HandlerResponse &out)
{
    mg_printf(conn,
        "HTTP/1.1 %d %s\r\n"
        "Content-Type: %s\r\n"
        "Content-Length: %zu\r\n"
        "Connection: close\r\n"
        "\r\n",
        out.status, mg_get_response_code_text(conn, out.status),
        out.content_type.c_str(), out.body.size());
    mg_write(conn, out.body.data(), out.body.size());
}

void LoadServerCw::Start(const std::string &host, int port)
{
    // Option strings must outlive mg_start()
    std::string ports = (host.empty() || host == "0.0.0.0")
        ? std::to_string(port)
        : host + ":" + std::to_string(port);
    std::string threads = std::to_string(thread_count);

    const char *options[] = {
        "listening_ports", ports.c_str(),
        "num_threads", threads.c_str(),
        "tcp_nodelay", "1",
        nullptr
    };

    mg_callbacks callbacks{};
    ctx = mg_start(&callbacks, this, options);

    if (!ctx) {
        throw std::runtime_error("Could not start CivetWeb on " + ports);
    }

    // Routes
    mg_set_request_handler(ctx, "/", dispatch_handler, this);

    std::lock_guard<std::mutex> lock(stop_mtx);
    stop_requested = false;
}

int LoadServerCw::Listen(const std::string &host, int port)
{
    try {
        Start(host, port);
    } catch (const std::exception &e) {
        std::cerr << "Failed to start server! " << e.what() << std::endl;
        return -1;
    }

    std::cout << "Server running on http://" << host << ":" << port << " (civetweb)" << std::endl;

    std::unique_lock<std::mutex> lock(stop_mtx);
    stop_cv.wait(lock, [this] { return stop_requested; });
    return 0;
}

void LoadServerCw::Stop()
{
    if (ctx) {
        mg_stop(ctx);
        ctx = nullptr;
    }
    {
        std::lock_guard<std::mutex> lock(stop_mtx);
        stop_requested = true;
    }
    stop_cv.notify_all();
}
