#include "gateway/request_gateway.hpp"

#include <future>
#include <iostream>

#include "core/errors.hpp"

namespace asset_agent::gateway {

const char* to_string(const GatewayStatus status) noexcept {
  switch (status) {
    case GatewayStatus::ok:
      return "ok";
    case GatewayStatus::timeout:
      return "timeout";
    case GatewayStatus::not_found:
      return "not found";
    case GatewayStatus::unsupported:
      return "unsupported";
    case GatewayStatus::failed:
      return "failed";
  }
  return "unknown";
}

RequestGateway::RequestGateway(const std::chrono::milliseconds timeout) : timeout_(timeout) {}

GatewayResult RequestGateway::read(core::StateOwner& owner, const std::string& service) const {
  return exchange(owner, core::Action::read, service, {});
}

GatewayResult RequestGateway::write(core::StateOwner& owner, const std::string& service,
                                    const model::Signal& signal) const {
  return exchange(owner, core::Action::write, service, signal);
}

std::chrono::milliseconds RequestGateway::timeout() const noexcept { return timeout_; }

GatewayResult RequestGateway::exchange(core::StateOwner& owner, const core::Action action,
                                       const std::string& service, const model::Signal& payload) const {
  const char* verb = action == core::Action::read ? "GET" : "PUT";
  const auto deadline = std::chrono::steady_clock::now() + timeout_;

  core::Tray tray{};
  tray.action = action;
  tray.service = service;
  tray.payload = payload;
  std::future<model::Signal> reply = tray.reply.get_future();

  const auto posted = owner.post(std::move(tray), deadline);
  if (posted == core::MailboxStatus::timed_out) {
    std::cerr << "[gateway] timeout queueing " << verb << ' ' << owner.name() << '/' << service << '\n';
    return {GatewayStatus::timeout, {}, "request timed out"};
  }
  if (posted != core::MailboxStatus::accepted) {
    return {GatewayStatus::failed, {}, "asset is shut down"};
  }

  if (reply.wait_until(deadline) != std::future_status::ready) {
    std::cerr << "[gateway] timeout on " << verb << ' ' << owner.name() << '/' << service << '\n';
    return {GatewayStatus::timeout, {}, "request timed out"};
  }

  try {
    return {GatewayStatus::ok, reply.get(), {}};
  } catch (const core::ServiceError& ex) {
    switch (ex.kind()) {
      case core::ServiceErrorKind::unknown_service:
        return {GatewayStatus::not_found, {}, ex.what()};
      case core::ServiceErrorKind::unsupported:
        return {GatewayStatus::unsupported, {}, ex.what()};
      case core::ServiceErrorKind::device:
        break;
    }
    std::cerr << "[gateway] " << verb << ' ' << owner.name() << '/' << service << " failed: " << ex.what() << '\n';
    return {GatewayStatus::failed, {}, ex.what()};
  } catch (const std::future_error&) {
    return {GatewayStatus::failed, {}, "asset is shut down"};
  } catch (const std::exception& ex) {
    std::cerr << "[gateway] " << verb << ' ' << owner.name() << '/' << service << " failed: " << ex.what() << '\n';
    return {GatewayStatus::failed, {}, ex.what()};
  }
}

}  // namespace asset_agent::gateway
