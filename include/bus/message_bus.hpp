#pragma once

#include <string>

namespace asset_agent::bus {

class MessagePublisher {
 public:
  // Throws core::DeviceError when the message could not be handed to the bus.
  virtual void publish(const std::string& channel, const std::string& payload) = 0;
  virtual ~MessagePublisher() = default;
};

}  // namespace asset_agent::bus
