#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "assets/unit_asset.hpp"
#include "core/config.hpp"
#include "gateway/http_server.hpp"
#include "gateway/request_gateway.hpp"
#include "gateway/router.hpp"
#include "sinks/historian.hpp"
#include "sinks/stdout_debug.hpp"

namespace asset_agent::core {

// Composition root. Builds the registry from configuration, then owns every task spawned for it.
// The registry is never modified after construction.
class System {
 public:
  // Throws std::runtime_error when an asset cannot be built from its configuration.
  explicit System(SystemConfig config);
  ~System();

  System(const System&) = delete;
  System& operator=(const System&) = delete;

  // Throws std::runtime_error when the HTTP listener cannot be opened.
  void start();
  // Requests stop, waits up to the shutdown grace for tasks to finish, then joins them.
  void stop();

  [[nodiscard]] const std::string& name() const noexcept;
  [[nodiscard]] const assets::AssetRegistry& registry() const noexcept;
  [[nodiscard]] const gateway::Router& router() const noexcept;
  [[nodiscard]] std::uint16_t http_port() const noexcept;
  [[nodiscard]] std::stop_token stop_token() const noexcept;

 private:
  void join_all();

  SystemConfig config_;
  std::stop_source stop_source_{};
  std::unique_ptr<sinks::StdoutDebugSink> stdout_sink_{};
  std::unique_ptr<sinks::Historian> historian_{};
  assets::AssetRegistry registry_{};
  gateway::RequestGateway gateway_;
  gateway::Router router_;
  std::unique_ptr<gateway::HttpServer> server_{};
  bool started_{false};
  bool stopped_{false};
};

}  // namespace asset_agent::core
