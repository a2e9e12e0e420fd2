#include "http_executor.hpp"

#include <cstdint>
#include <iostream>
#include <limits>

#include <boost/asio/post.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace http = boost::beast::http;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

http::verb to_verb(HttpMethod method)
{
    switch (method) {
        case HttpMethod::GET: return http::verb::get;
        case HttpMethod::POST: return http::verb::post;
        case HttpMethod::PUT: return http::verb::put;
        case HttpMethod::PATCH: return http::verb::patch;
        case HttpMethod::DELETE: return http::verb::delete_;
    }
    return http::verb::get;
}

std::string unbracketed(const std::string& host)
{
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

} // namespace

HttpRequestExecutor::HttpRequestExecutor(std::shared_ptr<const LoadTestConfig> cfg)
    : config(std::move(cfg)), target(parse_target_url(config->url))
{
    resolve_host = unbracketed(target.host);
    use_tls = target.scheme == "https";

    if (use_tls) {
        try {
            auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
            ctx->set_default_verify_paths();
            ctx->set_verify_mode(ssl::verify_peer);
            tls_ctx = std::move(ctx);
        } catch (const boost::system::system_error& e) {
            std::cerr << "[Executor] TLS setup failed: " << e.what() << std::endl;
        }
    }
    request = build_request();
}

HttpRequestExecutor::HttpRequestExecutor(std::shared_ptr<const LoadTestConfig> cfg,
                                         std::shared_ptr<ssl::context> tls,
                                         boost::asio::io_context& ioc)
    : config(std::move(cfg)), target(parse_target_url(config->url)), tls_ctx(std::move(tls))
{
    resolve_host = unbracketed(target.host);
    use_tls = target.scheme == "https";

    strand.emplace(boost::asio::make_strand(ioc));
    resolver = std::make_unique<tcp::resolver>(*strand);
    deadline = std::make_unique<boost::asio::steady_timer>(*strand);
    request = build_request();
}

bool HttpRequestExecutor::prepare() const
{
    return !use_tls || tls_ctx != nullptr;
}

HttpRequestExecutor::Request HttpRequestExecutor::build_request() const
{
    Request req{to_verb(config->method), target.path, 11};

    std::string host = target.host;
    const int default_port = use_tls ? 443 : 80;
    if (target.port != default_port) {
        host += ":" + std::to_string(target.port);
    }
    req.set(http::field::host, host);
    req.set(http::field::user_agent, "httpload");

    for (const auto& header : config->headers) {
        if (boost::beast::iequals(header.first, "Host")) {
            req.set(http::field::host, header.second);
        } else {
            req.insert(header.first, header.second);
        }
    }
    req.keep_alive(true);

    if (config->body.has_value() && method_accepts_body(config->method)) {
        req.body() = *config->body;
        if (req.find(http::field::content_type) == req.end()) {
            req.set(http::field::content_type, "application/json");
        }
    }
    req.prepare_payload();
    return req;
}

void HttpRequestExecutor::async_execute(OutcomeHandler handler)
{
    pending = std::move(handler);
    boost::asio::post(*strand, [this]() { begin_attempt(); });
}

std::unique_ptr<IRequestExecutor> HttpRequestExecutor::clone(boost::asio::io_context& ioc) const
{
    return std::make_unique<HttpRequestExecutor>(config, tls_ctx, ioc);
}

// --- Attempt State Machine ---
// Every step below runs on the strand, so the deadline handler and the I/O
// completions of one attempt never overlap.

void HttpRequestExecutor::begin_attempt()
{
    ++attempt_id;
    timed_out = false;
    retried = false;
    status_code = 0;
    header_elapsed = std::chrono::microseconds(0);
    start_time = std::chrono::steady_clock::now();

    deadline->expires_after(config->timeout);
    deadline->async_wait([this, id = attempt_id](const boost::system::error_code& ec) {
        on_deadline(ec, id);
    });

    if (connected) {
        reused_connection = true;
        start_write();
    } else if (endpoints) {
        reused_connection = false;
        start_connect();
    } else {
        reused_connection = false;
        start_resolve();
    }
}

void HttpRequestExecutor::start_resolve()
{
    resolver->async_resolve(resolve_host, std::to_string(target.port),
        [this](const boost::system::error_code& ec, tcp::resolver::results_type results) {
            on_resolve(ec, std::move(results));
        });
}

void HttpRequestExecutor::on_resolve(const boost::system::error_code& ec,
                                     tcp::resolver::results_type results)
{
    if (ec) {
        fail(ec);
        return;
    }
    endpoints = std::move(results);
    start_connect();
}

void HttpRequestExecutor::start_connect()
{
    close_connection();
    buffer.consume(buffer.size());

    if (use_tls) {
        plain_stream.reset();
        tls_stream = std::make_unique<TlsStream>(*strand, *tls_ctx);
        // SNI, then certificate checked against the host name
        if (!SSL_set_tlsext_host_name(tls_stream->native_handle(), resolve_host.c_str())) {
            fail(boost::system::error_code(static_cast<int>(::ERR_get_error()),
                                           boost::asio::error::get_ssl_category()));
            return;
        }
        tls_stream->set_verify_callback(ssl::host_name_verification(resolve_host));
    } else {
        tls_stream.reset();
        plain_stream = std::make_unique<PlainStream>(*strand);
    }

    with_stream([this](auto& stream) {
        boost::beast::get_lowest_layer(stream).async_connect(*endpoints,
            [this](const boost::system::error_code& ec, const tcp::endpoint&) {
                on_connect(ec);
            });
    });
}

void HttpRequestExecutor::on_connect(const boost::system::error_code& ec)
{
    if (ec) {
        fail(ec);
        return;
    }
    if (tls_stream) {
        tls_stream->async_handshake(ssl::stream_base::client,
            [this](const boost::system::error_code& hec) { on_handshake(hec); });
        return;
    }
    connected = true;
    start_write();
}

void HttpRequestExecutor::on_handshake(const boost::system::error_code& ec)
{
    if (ec) {
        fail(ec);
        return;
    }
    connected = true;
    start_write();
}

void HttpRequestExecutor::start_write()
{
    with_stream([this](auto& stream) {
        http::async_write(stream, request,
            [this](const boost::system::error_code& ec, std::size_t) { on_write(ec); });
    });
}

void HttpRequestExecutor::on_write(const boost::system::error_code& ec)
{
    if (ec) {
        fail(ec);
        return;
    }

    parser.emplace();
    parser->body_limit((std::numeric_limits<std::uint64_t>::max)());
    with_stream([this](auto& stream) {
        http::async_read_header(stream, buffer, *parser,
            [this](const boost::system::error_code& rec, std::size_t) { on_read_header(rec); });
    });
}

void HttpRequestExecutor::on_read_header(const boost::system::error_code& ec)
{
    if (ec) {
        fail(ec);
        return;
    }

    // Latency ends once the status line and headers are parsed
    header_elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time);
    status_code = static_cast<int>(parser->get().result_int());

    // Drain the body so the connection can carry the next request
    with_stream([this](auto& stream) {
        http::async_read(stream, buffer, *parser,
            [this](const boost::system::error_code& rec, std::size_t) { on_read_body(rec); });
    });
}

void HttpRequestExecutor::on_read_body(const boost::system::error_code& ec)
{
    if (ec) {
        fail(ec);
        return;
    }
    if (!parser->keep_alive()) {
        close_connection();
    }
    finish(TransportStatus::Completed);
}

void HttpRequestExecutor::on_deadline(const boost::system::error_code& ec,
                                      unsigned long long attempt)
{
    if (ec == boost::asio::error::operation_aborted || attempt != attempt_id || !pending) {
        return;
    }
    // Aborts the pending operation; its handler then reports the timeout.
    timed_out = true;
    close_connection();
}

void HttpRequestExecutor::fail(const boost::system::error_code& /*ec*/)
{
    if (timed_out) {
        finish(TransportStatus::TimedOut);
        return;
    }

    // The server may have dropped an idle keep-alive connection; retry once
    // on a fresh one when nothing of the response has arrived yet.
    if (reused_connection && !retried && status_code == 0) {
        retried = true;
        reused_connection = false;
        start_connect();
        return;
    }

    close_connection();
    finish(TransportStatus::ConnectionError);
}

void HttpRequestExecutor::finish(TransportStatus transport)
{
    deadline->cancel();

    RawResult raw;
    raw.transport = transport;
    raw.status_code = status_code;
    if (transport == TransportStatus::Completed) {
        raw.elapsed = header_elapsed;
    } else {
        raw.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_time);
    }

    OutcomeHandler handler = std::move(pending);
    pending = nullptr;
    handler(classify_outcome(raw));
}

void HttpRequestExecutor::close_connection()
{
    connected = false;
    if (resolver) resolver->cancel();
    if (plain_stream) plain_stream->close();
    if (tls_stream) boost::beast::get_lowest_layer(*tls_stream).close();
}
