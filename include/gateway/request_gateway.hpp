#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "core/state_owner.hpp"
#include "model/signal.hpp"

namespace asset_agent::gateway {

constexpr std::chrono::milliseconds kDefaultRequestTimeout{5000};

enum class GatewayStatus : std::uint8_t {
  ok = 0,
  timeout = 1,
  not_found = 2,
  unsupported = 3,
  failed = 4,
};

struct GatewayResult {
  GatewayStatus status{GatewayStatus::failed};
  model::Signal signal{};
  std::string message{};

  [[nodiscard]] bool ok() const noexcept { return status == GatewayStatus::ok; }
};

const char* to_string(GatewayStatus status) noexcept;

// Stateless translation of external read/write requests into owner mailbox trays.
// Each call waits at most the request timeout, covering both enqueueing and the reply.
class RequestGateway {
 public:
  explicit RequestGateway(std::chrono::milliseconds timeout = kDefaultRequestTimeout);

  GatewayResult read(core::StateOwner& owner, const std::string& service) const;
  GatewayResult write(core::StateOwner& owner, const std::string& service, const model::Signal& signal) const;

  [[nodiscard]] std::chrono::milliseconds timeout() const noexcept;

 private:
  GatewayResult exchange(core::StateOwner& owner, core::Action action, const std::string& service,
                         const model::Signal& payload) const;

  std::chrono::milliseconds timeout_;
};

}  // namespace asset_agent::gateway
