#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace asset_agent::sensors {

struct ProcessResult {
  int exit_code{-1};
  bool timed_out{false};
  std::string output{};
};

// Runs argv[0] (PATH lookup) with stdout captured and stderr inherited. The child is killed
// when it outlives timeout. Returns false when the process could not be spawned.
bool run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout,
                 ProcessResult& result) noexcept;

}  // namespace asset_agent::sensors
