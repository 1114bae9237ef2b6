#pragma once

/**
 * @file http_server.hpp
 * @brief Event-driven HTTP/1.1 server on Boost.Beast
 *
 * One io_context shared by a small pool of threads. Each accepted
 * connection is an HttpConnection that reads a request, hands it to the
 * handler on the io thread that completed the read, writes the response
 * and loops while the client keeps the connection alive.
 *
 * Handlers may block (a merge runs inside the request that completes an
 * upload); the pool size bounds how many can block at once.
 *
 * Usage:
 * ```cpp
 * HttpServer server(options, [&router](const HttpRequest& req) {
 *     return router.handle_request(req);
 * });
 * server.start();
 * server.wait();
 * ```
 */

#include "fmp/core/result.hpp"
#include "fmp/network/http_types.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace fmp::network {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

struct HttpServerOptions {
    std::string address = "0.0.0.0";
    std::uint16_t port = 8080;              ///< 0 binds an ephemeral port
    std::size_t threads = 4;
    std::uint64_t max_body_bytes = 128ull * 1024 * 1024;
    std::chrono::seconds idle_timeout{60};
};

class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, const HttpRequestHandler& handler, const HttpServerOptions& options);

    void start();

private:
    using BeastBody = beast::http::vector_body<std::uint8_t>;

    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void do_write(HttpResponse response, unsigned version, bool keep_alive);
    void on_write(bool keep_alive, beast::error_code ec, std::size_t bytes);
    void do_close();

    HttpRequest to_request(const beast::http::request<BeastBody>& message) const;

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    const HttpRequestHandler& handler_;
    const HttpServerOptions& options_;
    std::optional<beast::http::request_parser<BeastBody>> parser_;
    std::shared_ptr<beast::http::response<BeastBody>> response_;
};

class HttpServer {
public:
    HttpServer(HttpServerOptions options, HttpRequestHandler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind, listen and spawn the io threads
    Result<void> start();

    /// Stop accepting, cancel I/O and join the threads
    void stop();

    /// Block until the io threads exit
    void wait();

    bool running() const noexcept { return running_.load(); }

    /// Actual listening port, useful after binding port 0
    std::uint16_t port() const noexcept { return bound_port_; }

    asio::io_context& context() noexcept { return io_context_; }

private:
    void do_accept();

    HttpServerOptions options_;
    HttpRequestHandler handler_;
    asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    std::uint16_t bound_port_ = 0;
};

} // namespace fmp::network
