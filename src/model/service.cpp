#include "model/service.hpp"

#include <algorithm>

namespace asset_agent::model {

Details merge_details(const Details& base, const Details& extra) {
  Details merged = base;
  for (const auto& [key, values] : extra) {
    auto& target = merged[key];
    for (const auto& value : values) {
      if (std::find(target.begin(), target.end(), value) == target.end()) {
        target.push_back(value);
      }
    }
  }
  return merged;
}

}  // namespace asset_agent::model
