#include "fmp/network/http_server.hpp"

#include <spdlog/spdlog.h>

namespace fmp::network {

namespace http = beast::http;

// ════════════════════════════════════════════════════════════
// HttpConnection
// ════════════════════════════════════════════════════════════

HttpConnection::HttpConnection(tcp::socket socket,
                               const HttpRequestHandler& handler,
                               const HttpServerOptions& options)
    : stream_(std::move(socket)), handler_(handler), options_(options) {}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    parser_.emplace();
    parser_->body_limit(options_.max_body_bytes);
    stream_.expires_after(options_.idle_timeout);

    http::async_read(stream_, buffer_, *parser_,
                     beast::bind_front_handler(&HttpConnection::on_read, shared_from_this()));
}

HttpRequest HttpConnection::to_request(const http::request<BeastBody>& message) const {
    HttpRequest request;
    request.method = HttpMethodUtils::from_string(std::string(message.method_string()));
    split_target(std::string(message.target()), request.path, request.query);
    for (const auto& field : message) {
        request.headers[std::string(field.name_string())] = std::string(field.value());
    }
    request.body = message.body();
    return request;
}

void HttpConnection::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        return do_close();
    }
    if (ec == http::error::body_limit) {
        auto response = HttpResponse(HttpStatus::PAYLOAD_TOO_LARGE);
        response.set_header("Content-Type", "application/json");
        response.set_body(R"({"error":"invalid_request","message":"Request body too large","retry":"none"})");
        return do_write(std::move(response), 11, false);
    }
    if (ec) {
        if (ec != beast::error::timeout && ec != asio::error::operation_aborted) {
            spdlog::debug("[HttpServer] read failed: {}", ec.message());
        }
        return;
    }

    const auto& message = parser_->get();
    const unsigned version = message.version();
    const bool keep_alive = message.keep_alive();
    HttpRequest request = to_request(message);

    HttpResponse response;
    try {
        response = handler_(request);
    } catch (const std::exception& e) {
        spdlog::error("[HttpServer] handler threw on {} {}: {}", HttpMethodUtils::to_string(request.method),
                      request.path, e.what());
        response = HttpResponse(HttpStatus::INTERNAL_SERVER_ERROR);
        response.set_header("Content-Type", "application/json");
        response.set_body(R"({"error":"internal_error","message":"Internal Server Error","retry":"none"})");
    }
    do_write(std::move(response), version, keep_alive);
}

void HttpConnection::do_write(HttpResponse response, unsigned version, bool keep_alive) {
    response_ = std::make_shared<http::response<BeastBody>>(
        static_cast<http::status>(response.status_code), version);
    response_->set(http::field::server, "fmp");
    for (const auto& [name, value] : response.headers) {
        response_->set(name, value);
    }
    response_->body() = std::move(response.body);
    response_->keep_alive(keep_alive);
    response_->prepare_payload();

    stream_.expires_after(options_.idle_timeout);
    http::async_write(stream_, *response_,
                      beast::bind_front_handler(&HttpConnection::on_write, shared_from_this(), keep_alive));
}

void HttpConnection::on_write(bool keep_alive, beast::error_code ec, std::size_t) {
    if (ec) {
        spdlog::debug("[HttpServer] write failed: {}", ec.message());
        return;
    }
    response_.reset();
    if (!keep_alive) {
        return do_close();
    }
    do_read();
}

void HttpConnection::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

// ════════════════════════════════════════════════════════════
// HttpServer
// ════════════════════════════════════════════════════════════

HttpServer::HttpServer(HttpServerOptions options, HttpRequestHandler handler)
    : options_(std::move(options)),
      handler_(std::move(handler)),
      io_context_(static_cast<int>(options_.threads == 0 ? 1 : options_.threads)),
      acceptor_(io_context_) {}

HttpServer::~HttpServer() {
    stop();
}

Result<void> HttpServer::start() {
    beast::error_code ec;
    const auto address = asio::ip::make_address(options_.address, ec);
    if (ec) {
        return Err<void>(make_error(ErrorCode::InvalidRequest, "Bad listen address " + options_.address));
    }
    const tcp::endpoint endpoint(address, options_.port);

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        return Err<void>(make_error(ErrorCode::BackendIOError,
                                    "Cannot listen on " + options_.address + ":" + std::to_string(options_.port) +
                                        ": " + ec.message()));
    }
    bound_port_ = acceptor_.local_endpoint().port();

    running_ = true;
    do_accept();

    const std::size_t count = options_.threads == 0 ? 1 : options_.threads;
    threads_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        threads_.emplace_back([this]() { io_context_.run(); });
    }

    spdlog::info("[HttpServer] listening on {}:{} with {} threads", options_.address, bound_port_, count);
    return Ok();
}

void HttpServer::do_accept() {
    acceptor_.async_accept(asio::make_strand(io_context_), [this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                spdlog::warn("[HttpServer] accept failed: {}", ec.message());
            }
        } else {
            std::make_shared<HttpConnection>(std::move(socket), handler_, options_)->start();
        }
        if (running_) {
            do_accept();
        }
    });
}

void HttpServer::stop() {
    if (running_.exchange(false)) {
        beast::error_code ec;
        acceptor_.close(ec);
        io_context_.stop();
        spdlog::info("[HttpServer] stopping");
    }
    wait();
}

void HttpServer::wait() {
    for (auto& thread : threads_) {
        if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) {
            thread.join();
        }
    }
    threads_.clear();
}

} // namespace fmp::network
