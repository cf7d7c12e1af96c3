#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "assets/unit_asset.hpp"
#include "gateway/http.hpp"
#include "gateway/request_gateway.hpp"

namespace asset_agent::gateway {

// Maps /<system>/<asset>/<subpath> onto the registry and the request gateway.
class Router {
 public:
  Router(std::string system_name, const assets::AssetRegistry& registry, const RequestGateway& gateway);

  HttpResponse handle(const HttpRequest& request) const;

  [[nodiscard]] nlohmann::json describe_system() const;
  [[nodiscard]] static nlohmann::json describe_asset(const assets::UnitAsset& asset);

 private:
  HttpResponse serve_service(const HttpRequest& request, assets::UnitAsset& asset, const std::string& sub_path) const;

  std::string system_name_;
  const assets::AssetRegistry& registry_;
  const RequestGateway& gateway_;
};

http::status http_status(GatewayStatus status) noexcept;

}  // namespace asset_agent::gateway
