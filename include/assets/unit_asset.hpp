#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "core/state_owner.hpp"
#include "model/service.hpp"

namespace asset_agent::assets {

struct AssetProfile {
  std::string name{};
  model::Details details{};
  std::vector<model::ServiceDefinition> services{};
  std::vector<model::ConsumedService> consumes{};
};

// A device or logical entity exposed under /<system>/<name>. Its live state is reachable
// only through owner(); the profile is fixed at construction.
class UnitAsset {
 public:
  UnitAsset(AssetProfile&& profile, std::unique_ptr<core::AssetState> state,
            std::size_t mailbox_capacity = core::kDefaultMailboxCapacity);
  virtual ~UnitAsset();

  UnitAsset(const UnitAsset&) = delete;
  UnitAsset& operator=(const UnitAsset&) = delete;

  [[nodiscard]] const std::string& name() const noexcept;
  [[nodiscard]] const model::Details& details() const noexcept;
  [[nodiscard]] const std::vector<model::ServiceDefinition>& services() const noexcept;
  [[nodiscard]] const std::vector<model::ConsumedService>& consumed_services() const noexcept;

  // Offered service at sub_path, or null.
  [[nodiscard]] const model::ServiceDefinition* find_service(const std::string& sub_path) const noexcept;

  core::StateOwner& owner() noexcept;

  // Starts the owner first, then the asset's own tasks.
  virtual void start(std::stop_token stop);
  // Joins the asset's tasks, then the owner.
  virtual void join();

 private:
  AssetProfile profile_;
  core::StateOwner owner_;
};

using AssetRegistry = std::map<std::string, std::unique_ptr<UnitAsset>>;

}  // namespace asset_agent::assets
