#pragma once

#include <map>
#include <string>
#include <vector>

namespace asset_agent::model {

using Details = std::map<std::string, std::vector<std::string>>;

// A capability offered by an asset under /<system>/<asset>/<sub_path>.
struct ServiceDefinition {
  std::string definition{};
  std::string sub_path{};
  Details details{};
  std::string description{};
  bool writable{false};
};

// A remote capability an asset consumes. The url is the discovery result and is used verbatim.
struct ConsumedService {
  std::string definition{};
  std::string url{};
  Details details{};
};

Details merge_details(const Details& base, const Details& extra);

}  // namespace asset_agent::model
