#include "assets/unit_asset.hpp"

#include <utility>

namespace asset_agent::assets {

UnitAsset::UnitAsset(AssetProfile&& profile, std::unique_ptr<core::AssetState> state, const std::size_t mailbox_capacity)
    : profile_(std::move(profile)), owner_(profile_.name, std::move(state), mailbox_capacity) {}

UnitAsset::~UnitAsset() = default;

const std::string& UnitAsset::name() const noexcept { return profile_.name; }

const model::Details& UnitAsset::details() const noexcept { return profile_.details; }

const std::vector<model::ServiceDefinition>& UnitAsset::services() const noexcept { return profile_.services; }

const std::vector<model::ConsumedService>& UnitAsset::consumed_services() const noexcept {
  return profile_.consumes;
}

const model::ServiceDefinition* UnitAsset::find_service(const std::string& sub_path) const noexcept {
  for (const auto& service : profile_.services) {
    if (service.sub_path == sub_path) {
      return &service;
    }
  }
  return nullptr;
}

core::StateOwner& UnitAsset::owner() noexcept { return owner_; }

void UnitAsset::start(std::stop_token stop) { owner_.start(std::move(stop)); }

void UnitAsset::join() { owner_.join(); }

}  // namespace asset_agent::assets
