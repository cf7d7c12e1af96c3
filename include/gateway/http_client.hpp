#pragma once

#include <chrono>
#include <stop_token>
#include <string>

#include "gateway/http.hpp"
#include "gateway/service_client.hpp"

namespace asset_agent::gateway {

// Consumed service reached over plain HTTP at a URL taken verbatim from configuration.
class HttpServiceClient final : public ServiceClient {
 public:
  // Throws std::runtime_error when url is not an http:// URL.
  HttpServiceClient(std::string url, std::chrono::milliseconds timeout);

  bool get_state(model::Signal& signal, std::string& error, const std::stop_token& stop) override;
  bool set_state(const model::Signal& signal, std::string& error, const std::stop_token& stop) override;
  [[nodiscard]] const std::string& describe() const noexcept override;

 private:
  bool exchange(http::verb method, const std::string& body, std::string& response_body, std::string& error,
                const std::stop_token& stop) const;

  std::string url_;
  HttpUrl target_{};
  std::chrono::milliseconds timeout_;
};

}  // namespace asset_agent::gateway
