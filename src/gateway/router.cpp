#include "gateway/router.hpp"

#include <string>
#include <utility>
#include <vector>

#include "model/signal_form.hpp"

namespace asset_agent::gateway {
namespace {

std::vector<std::string> split_path(const std::string& target) {
  const std::string path = target.substr(0, target.find('?'));
  std::vector<std::string> segments;
  std::size_t begin = 0;
  while (begin < path.size()) {
    const auto end = path.find('/', begin);
    const std::string segment = path.substr(begin, end == std::string::npos ? std::string::npos : end - begin);
    if (!segment.empty()) {
      segments.push_back(segment);
    }
    if (end == std::string::npos) {
      break;
    }
    begin = end + 1;
  }
  return segments;
}

std::string text_of(const boost::beast::string_view text) { return std::string(text.data(), text.size()); }

}  // namespace

http::status http_status(const GatewayStatus status) noexcept {
  switch (status) {
    case GatewayStatus::ok:
      return http::status::ok;
    case GatewayStatus::timeout:
      return http::status::gateway_timeout;
    case GatewayStatus::not_found:
      return http::status::not_found;
    case GatewayStatus::unsupported:
      return http::status::method_not_allowed;
    case GatewayStatus::failed:
      return http::status::internal_server_error;
  }
  return http::status::internal_server_error;
}

Router::Router(std::string system_name, const assets::AssetRegistry& registry, const RequestGateway& gateway)
    : system_name_(std::move(system_name)), registry_(registry), gateway_(gateway) {}

HttpResponse Router::handle(const HttpRequest& request) const {
  const std::string target = text_of(request.target());
  const auto segments = split_path(target);
  const bool is_read = request.method() == http::verb::get;
  const bool is_write = request.method() == http::verb::put || request.method() == http::verb::post;
  if (!is_read && !is_write) {
    return error_response(http::status::method_not_allowed,
                          "method " + text_of(request.method_string()) + " not allowed");
  }

  if (segments.empty() || (segments.size() == 1 && segments[0] == system_name_)) {
    if (!is_read) {
      return error_response(http::status::method_not_allowed, "system description is read-only");
    }
    return json_response(describe_system());
  }

  if (segments[0] != system_name_ || segments.size() > 3) {
    return error_response(http::status::not_found, "no such resource " + target);
  }

  const auto it = registry_.find(segments[1]);
  if (it == registry_.end()) {
    return error_response(http::status::not_found, "no asset " + segments[1]);
  }
  assets::UnitAsset& asset = *it->second;

  if (segments.size() == 2) {
    if (!is_read) {
      return error_response(http::status::method_not_allowed, "asset description is read-only");
    }
    return json_response(describe_asset(asset));
  }
  return serve_service(request, asset, segments[2]);
}

HttpResponse Router::serve_service(const HttpRequest& request, assets::UnitAsset& asset,
                                   const std::string& sub_path) const {
  const model::ServiceDefinition* service = asset.find_service(sub_path);
  if (service == nullptr) {
    return error_response(http::status::not_found, "no service " + sub_path + " on " + asset.name());
  }

  GatewayResult result{};
  if (request.method() == http::verb::get) {
    result = gateway_.read(asset.owner(), sub_path);
  } else {
    if (!service->writable) {
      return error_response(http::status::method_not_allowed, sub_path + " is read-only");
    }
    if (media_type(text_of(request[http::field::content_type])) != model::kSignalMediaType) {
      return error_response(http::status::bad_request, "expected Content-Type " + std::string(model::kSignalMediaType));
    }
    model::Signal signal{};
    try {
      signal = model::decode_signal(request.body());
    } catch (const std::exception& ex) {
      return error_response(http::status::bad_request, ex.what());
    }
    result = gateway_.write(asset.owner(), sub_path, signal);
  }

  if (!result.ok()) {
    return error_response(http_status(result.status), result.message);
  }
  return make_response(http::status::ok, model::encode_signal(result.signal), model::kSignalMediaType);
}

nlohmann::json Router::describe_system() const {
  nlohmann::json assets = nlohmann::json::array();
  for (const auto& [name, asset] : registry_) {
    nlohmann::json services = nlohmann::json::array();
    for (const auto& service : asset->services()) {
      services.push_back("/" + system_name_ + "/" + name + "/" + service.sub_path);
    }
    assets.push_back({{"name", name}, {"services", services}});
  }
  return {{"system", system_name_}, {"assets", assets}};
}

nlohmann::json Router::describe_asset(const assets::UnitAsset& asset) {
  nlohmann::json services = nlohmann::json::array();
  for (const auto& service : asset.services()) {
    services.push_back({{"definition", service.definition},
                        {"subpath", service.sub_path},
                        {"details", service.details},
                        {"description", service.description},
                        {"writable", service.writable}});
  }
  nlohmann::json consumes = nlohmann::json::array();
  for (const auto& consumed : asset.consumed_services()) {
    consumes.push_back({{"definition", consumed.definition}, {"url", consumed.url}, {"details", consumed.details}});
  }
  return {{"name", asset.name()}, {"details", asset.details()}, {"services", services}, {"consumes", consumes}};
}

}  // namespace asset_agent::gateway
