#pragma once

namespace asset_agent::sensors {

// Hardware or protocol read primitive. May block; returns false when the reading is unusable.
class SampleSource {
 public:
  virtual bool read(double& value) noexcept = 0;
  virtual ~SampleSource() = default;
};

}  // namespace asset_agent::sensors
