#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace asset_agent::core {

// Raised by device primitives (actuators, publishers) when a command could not be applied.
class DeviceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class ServiceErrorKind : std::uint8_t {
  unknown_service = 0,
  unsupported = 1,
  device = 2,
};

// Raised inside an owner's turn and carried back to the requester on the reply channel.
class ServiceError : public std::runtime_error {
 public:
  ServiceError(const ServiceErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

  [[nodiscard]] ServiceErrorKind kind() const noexcept { return kind_; }

 private:
  ServiceErrorKind kind_;
};

}  // namespace asset_agent::core
