#include "gateway/http_server.hpp"

#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>

namespace asset_agent::gateway {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

// Lives on the network thread; only reply() may be called from a worker.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(tcp::socket socket, HttpServer& server, const std::chrono::milliseconds io_timeout)
      : stream_(std::move(socket)), server_(server), io_timeout_(io_timeout) {
    parser_.header_limit(static_cast<std::uint32_t>(kMaxHeadBytes));
    parser_.body_limit(kMaxBodyBytes);
  }

  void start() {
    stream_.expires_after(io_timeout_);
    http::async_read(stream_, buffer_, parser_,
                     [self = shared_from_this()](const beast::error_code& ec, std::size_t) { self->on_read(ec); });
  }

  void reply(HttpResponse response) {
    asio::post(stream_.get_executor(), [self = shared_from_this(), response = std::move(response)]() mutable {
      self->write(std::move(response));
    });
  }

 private:
  void on_read(const beast::error_code& ec) {
    if (ec == http::error::end_of_stream || ec == beast::error::timeout || ec == asio::error::operation_aborted) {
      return;
    }
    if (ec == http::error::body_limit) {
      write(error_response(http::status::payload_too_large, "request body too large"));
      return;
    }
    if (ec == http::error::header_limit) {
      write(error_response(http::status::bad_request, "request head too large"));
      return;
    }
    if (ec) {
      write(error_response(http::status::bad_request, "malformed request: " + ec.message()));
      return;
    }
    server_.dispatch(shared_from_this(), parser_.release());
  }

  void write(HttpResponse response) {
    response_ = std::move(response);
    response_.keep_alive(false);
    response_.prepare_payload();
    stream_.expires_after(io_timeout_);
    http::async_write(stream_, response_,
                      [self = shared_from_this()](const beast::error_code& ec, std::size_t) { self->on_write(ec); });
  }

  void on_write(const beast::error_code& ec) {
    if (ec) {
      std::cerr << "[http] failed to write response: " << ec.message() << '\n';
      return;
    }
    beast::error_code closed;
    stream_.socket().shutdown(tcp::socket::shutdown_send, closed);
    if (closed && closed != asio::error::not_connected) {
      std::cerr << "[http] shutdown failed: " << closed.message() << '\n';
    }
  }

  beast::tcp_stream stream_;
  HttpServer& server_;
  std::chrono::milliseconds io_timeout_;
  beast::flat_buffer buffer_{};
  http::request_parser<http::string_body> parser_{};
  HttpResponse response_{};
};

HttpServer::HttpServer(HttpServerOptions options, HttpHandler handler)
    : options_(std::move(options)),
      handler_(std::move(handler)),
      acceptor_(io_),
      jobs_(options_.workers == 0 ? 1 : options_.workers * 4) {
  if (options_.workers == 0) {
    options_.workers = 1;
  }
}

HttpServer::~HttpServer() { join(); }

void HttpServer::open() {
  beast::error_code ec;
  tcp::resolver resolver(io_);
  const std::string port = std::to_string(options_.port);
  const auto endpoints = resolver.resolve(options_.host, port, tcp::resolver::passive, ec);
  if (ec) {
    throw std::runtime_error("http: cannot resolve " + options_.host + ": " + ec.message());
  }

  std::string last_error = "no usable address";
  for (const auto& entry : endpoints) {
    const tcp::endpoint endpoint = entry.endpoint();
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
      acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
      acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
      acceptor_.listen(options_.backlog, ec);
    }
    if (!ec) {
      break;
    }
    last_error = ec.message();
    beast::error_code close_error;
    acceptor_.close(close_error);
    if (close_error) {
      last_error += " (close: " + close_error.message() + ")";
    }
  }

  if (!acceptor_.is_open()) {
    throw std::runtime_error("http: cannot listen on " + options_.host + ':' + port + ": " + last_error);
  }

  bound_port_ = acceptor_.local_endpoint(ec).port();
  if (ec) {
    throw std::runtime_error("http: cannot read bound address: " + ec.message());
  }
  std::cerr << "[http] listening on " << options_.host << ':' << bound_port_ << '\n';
}

void HttpServer::start(std::stop_token stop) {
  if (!acceptor_.is_open()) {
    open();
  }
  for (std::size_t i = 0; i < options_.workers; ++i) {
    workers_.emplace_back([this, stop] { worker_loop(stop); });
  }
  accept_next();
  on_stop_.emplace(stop, [this] { asio::post(io_, [this] { shutdown(); }); });
  network_ = std::thread([this] {
    io_.run();
    std::cerr << "[http] listener stopped\n";
  });
}

void HttpServer::join() {
  if (network_.joinable()) {
    network_.join();
  }
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  on_stop_.reset();
}

std::uint16_t HttpServer::port() const noexcept { return bound_port_; }

void HttpServer::accept_next() {
  acceptor_.async_accept([this](const beast::error_code& ec, tcp::socket socket) {
    if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
      return;
    }
    if (ec) {
      std::cerr << "[http] accept failed: " << ec.message() << '\n';
    } else {
      std::make_shared<HttpSession>(std::move(socket), *this, options_.io_timeout)->start();
    }
    accept_next();
  });
}

void HttpServer::dispatch(const std::shared_ptr<HttpSession>& session, HttpRequest request) {
  if (jobs_.try_push(Job{session, std::move(request)}) != core::MailboxStatus::accepted) {
    session->reply(error_response(http::status::service_unavailable, "server busy"));
  }
}

// Runs on the network thread. Connections still open are dropped with the io_context.
void HttpServer::shutdown() {
  beast::error_code ec;
  acceptor_.close(ec);
  if (ec) {
    std::cerr << "[http] closing listener failed: " << ec.message() << '\n';
  }
  jobs_.close();
  io_.stop();
}

void HttpServer::worker_loop(const std::stop_token stop) {
  while (auto job = jobs_.pop(stop)) {
    job->session->reply(respond(job->request));
  }
}

HttpResponse HttpServer::respond(const HttpRequest& request) const {
  try {
    return handler_(request);
  } catch (const std::exception& ex) {
    std::cerr << "[http] handler failed on " << request.target() << ": " << ex.what() << '\n';
    return error_response(http::status::internal_server_error, "internal error");
  }
}

}  // namespace asset_agent::gateway
