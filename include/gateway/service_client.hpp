#pragma once

#include <stop_token>
#include <string>

#include "model/signal.hpp"

namespace asset_agent::gateway {

// A consumed capability. Both calls are bounded by the request timeout, end early once stop
// is requested, and report failure through the return value with a reason in error.
class ServiceClient {
 public:
  virtual bool get_state(model::Signal& signal, std::string& error, const std::stop_token& stop) = 0;
  virtual bool set_state(const model::Signal& signal, std::string& error, const std::stop_token& stop) = 0;
  [[nodiscard]] virtual const std::string& describe() const noexcept = 0;
  virtual ~ServiceClient() = default;
};

}  // namespace asset_agent::gateway
