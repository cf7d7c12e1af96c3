#include "gateway/http_client.hpp"

#include <stdexcept>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>

#include "model/signal_form.hpp"

namespace asset_agent::gateway {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

HttpServiceClient::HttpServiceClient(std::string url, const std::chrono::milliseconds timeout)
    : url_(std::move(url)), timeout_(timeout) {
  if (!parse_http_url(url_, target_)) {
    throw std::runtime_error("invalid service url: " + url_);
  }
}

bool HttpServiceClient::get_state(model::Signal& signal, std::string& error, const std::stop_token& stop) {
  std::string body;
  if (!exchange(http::verb::get, {}, body, error, stop)) {
    return false;
  }
  try {
    signal = model::decode_signal(body);
  } catch (const std::exception& ex) {
    error = std::string("undecodable reply: ") + ex.what();
    return false;
  }
  return true;
}

bool HttpServiceClient::set_state(const model::Signal& signal, std::string& error, const std::stop_token& stop) {
  std::string body;
  return exchange(http::verb::put, model::encode_signal(signal), body, error, stop);
}

const std::string& HttpServiceClient::describe() const noexcept { return url_; }

// One request per connection on a private io_context. The whole exchange, name resolution
// included, is bounded by the timeout; a stop request ends it at once.
bool HttpServiceClient::exchange(const http::verb method, const std::string& body, std::string& response_body,
                                 std::string& error, const std::stop_token& stop) const {
  asio::io_context io;
  tcp::resolver resolver(io);
  beast::tcp_stream stream(io);

  HttpRequest request{method, target_.path, 11};
  request.set(http::field::host, target_.host + ':' + std::to_string(target_.port));
  request.set(http::field::accept, model::kSignalMediaType);
  request.keep_alive(false);
  if (method != http::verb::get) {
    request.set(http::field::content_type, model::kSignalMediaType);
    request.body() = body;
  }
  request.prepare_payload();

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(kMaxBodyBytes);

  const char* stage = "resolve";
  beast::error_code failure;
  bool done = false;
  const auto finish = [&](const beast::error_code& ec) {
    failure = ec;
    done = true;
  };

  const auto on_read = [&](const beast::error_code& ec, std::size_t) { finish(ec); };
  const auto on_write = [&](const beast::error_code& ec, std::size_t) {
    if (ec) {
      return finish(ec);
    }
    stage = "receive";
    http::async_read(stream, buffer, parser, on_read);
  };
  const auto on_connect = [&](const beast::error_code& ec, const tcp::endpoint&) {
    if (ec) {
      return finish(ec);
    }
    stage = "send";
    http::async_write(stream, request, on_write);
  };
  const auto on_resolve = [&](const beast::error_code& ec, const tcp::resolver::results_type& endpoints) {
    if (ec) {
      return finish(ec);
    }
    stage = "connect";
    stream.expires_after(timeout_);
    stream.async_connect(endpoints, on_connect);
  };

  resolver.async_resolve(target_.host, std::to_string(target_.port), on_resolve);
  {
    std::stop_callback on_stop(stop, [&io] { io.stop(); });
    io.run_for(timeout_);
  }

  if (stop.stop_requested()) {
    error = "cancelled";
    return false;
  }
  if (!done) {
    error = std::string(stage) + " timed out";
    return false;
  }
  if (failure) {
    error = std::string(stage) + " failed: " + failure.message();
    return false;
  }

  const HttpResponse& response = parser.get();
  if (response.result_int() < 200 || response.result_int() > 299) {
    error = "status " + std::to_string(response.result_int());
    return false;
  }
  response_body = response.body();
  return true;
}

}  // namespace asset_agent::gateway
