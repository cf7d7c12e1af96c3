#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "core/mailbox.hpp"
#include "gateway/http.hpp"

namespace asset_agent::gateway {

using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

struct HttpServerOptions {
  std::string host{"0.0.0.0"};
  // 0 binds an ephemeral port; port() reports the one chosen.
  std::uint16_t port{20150};
  std::size_t workers{4};
  int backlog{16};
  std::chrono::milliseconds io_timeout{5000};
};

class HttpSession;

// One request per connection. A single network thread accepts and does all socket I/O.
// Parsed requests reach a fixed pool of handler workers through a bounded mailbox; a full
// mailbox answers 503 from the network thread. A handler exception answers 500.
class HttpServer {
 public:
  HttpServer(HttpServerOptions options, HttpHandler handler);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds and listens. Throws std::runtime_error when the address cannot be used.
  void open();
  void start(std::stop_token stop);
  void join();

  [[nodiscard]] std::uint16_t port() const noexcept;

 private:
  friend class HttpSession;

  struct Job {
    std::shared_ptr<HttpSession> session;
    HttpRequest request;
  };

  void accept_next();
  void dispatch(const std::shared_ptr<HttpSession>& session, HttpRequest request);
  void shutdown();
  void worker_loop(std::stop_token stop);
  HttpResponse respond(const HttpRequest& request) const;

  HttpServerOptions options_;
  HttpHandler handler_;
  boost::asio::io_context io_{};
  boost::asio::ip::tcp::acceptor acceptor_;
  std::uint16_t bound_port_{0};
  core::Mailbox<Job> jobs_;
  std::optional<std::stop_callback<std::function<void()>>> on_stop_{};
  std::thread network_{};
  std::vector<std::thread> workers_{};
};

}  // namespace asset_agent::gateway
