#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "LoadTestConfig.h"
#include "../request_executor.hpp"

/**
 * @brief Executor that issues the configured HTTP request over its own
 * persistent keep-alive connection (plain TCP or TLS).
 *
 * Every attempt runs under one deadline that covers resolve, connect, TLS
 * handshake, write and the whole response. When it expires the connection
 * is closed, which aborts whatever operation is pending.
 */
class HttpRequestExecutor : public IRequestExecutor {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;

    // Prototype: holds the settings shared by every clone, no I/O objects.
    explicit HttpRequestExecutor(std::shared_ptr<const LoadTestConfig> cfg);

    HttpRequestExecutor(std::shared_ptr<const LoadTestConfig> cfg,
                        std::shared_ptr<boost::asio::ssl::context> tls,
                        boost::asio::io_context& ioc);

    // False when no TLS context could be set up for an https target.
    bool prepare() const override;

    void async_execute(OutcomeHandler handler) override;

    std::unique_ptr<IRequestExecutor> clone(boost::asio::io_context& ioc) const override;

    // Request as it will be sent on every attempt.
    Request build_request() const;

private:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;
    using PlainStream = boost::beast::tcp_stream;
    using TlsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;
    using Parser = boost::beast::http::response_parser<boost::beast::http::string_body>;

    template <class Fn>
    void with_stream(Fn&& fn)
    {
        if (tls_stream) fn(*tls_stream);
        else fn(*plain_stream);
    }

    void begin_attempt();
    void start_resolve();
    void on_resolve(const boost::system::error_code& ec,
                    boost::asio::ip::tcp::resolver::results_type results);
    void start_connect();
    void on_connect(const boost::system::error_code& ec);
    void on_handshake(const boost::system::error_code& ec);
    void start_write();
    void on_write(const boost::system::error_code& ec);
    void on_read_header(const boost::system::error_code& ec);
    void on_read_body(const boost::system::error_code& ec);
    void on_deadline(const boost::system::error_code& ec, unsigned long long attempt);

    void fail(const boost::system::error_code& ec);
    void finish(TransportStatus transport);
    void close_connection();

    std::shared_ptr<const LoadTestConfig> config;
    TargetUrl target;
    std::string resolve_host;   // host without IPv6 brackets
    bool use_tls = false;
    std::shared_ptr<boost::asio::ssl::context> tls_ctx;

    // Bound to an io_context (clones only)
    std::optional<Strand> strand;
    std::unique_ptr<boost::asio::ip::tcp::resolver> resolver;
    std::unique_ptr<boost::asio::steady_timer> deadline;
    std::unique_ptr<PlainStream> plain_stream;
    std::unique_ptr<TlsStream> tls_stream;
    std::optional<boost::asio::ip::tcp::resolver::results_type> endpoints;
    bool connected = false;
    Request request;

    // --- Current Attempt ---
    OutcomeHandler pending;
    unsigned long long attempt_id = 0;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::microseconds header_elapsed{0};
    boost::beast::flat_buffer buffer;
    std::optional<Parser> parser;
    int status_code = 0;
    bool timed_out = false;
    bool reused_connection = false;
    bool retried = false;
};
