#include "core/config.hpp"

#include <fstream>
#include <set>
#include <stdexcept>
#include <string>

namespace asset_agent::core {
namespace {

using nlohmann::json;

const std::set<std::string>& known_kinds() {
  static const std::set<std::string> kKinds = {"w1_thermometer", "io_channel", "servo", "topic", "leveler"};
  return kKinds;
}

const json* find_key(const json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

std::string read_string(const json& object, const char* key, const std::string& where, std::string fallback = {}) {
  const json* value = find_key(object, key);
  if (value == nullptr) {
    return fallback;
  }
  if (!value->is_string()) {
    throw std::runtime_error(where + key + " must be a string");
  }
  return value->get<std::string>();
}

long long read_integer(const json& object, const char* key, const std::string& where, const long long fallback) {
  const json* value = find_key(object, key);
  if (value == nullptr) {
    return fallback;
  }
  if (!value->is_number_integer()) {
    throw std::runtime_error(where + key + " must be an integer");
  }
  return value->get<long long>();
}

bool read_bool(const json& object, const char* key, const std::string& where, const bool fallback) {
  const json* value = find_key(object, key);
  if (value == nullptr) {
    return fallback;
  }
  if (!value->is_boolean()) {
    throw std::runtime_error(where + key + " must be true or false");
  }
  return value->get<bool>();
}

long long read_positive(const json& object, const char* key, const std::string& where, const long long fallback) {
  const long long value = read_integer(object, key, where, fallback);
  if (value <= 0) {
    throw std::runtime_error(where + key + " must be greater than 0");
  }
  return value;
}

model::Details read_details(const json& object, const std::string& where) {
  model::Details details;
  const json* value = find_key(object, "details");
  if (value == nullptr) {
    return details;
  }
  if (!value->is_object()) {
    throw std::runtime_error(where + "details must be an object of string lists");
  }
  for (const auto& [key, entries] : value->items()) {
    if (entries.is_string()) {
      details[key].push_back(entries.get<std::string>());
      continue;
    }
    if (!entries.is_array()) {
      throw std::runtime_error(where + "details." + key + " must be a list of strings");
    }
    for (const json& entry : entries) {
      if (!entry.is_string()) {
        throw std::runtime_error(where + "details." + key + " must be a list of strings");
      }
      details[key].push_back(entry.get<std::string>());
    }
  }
  return details;
}

void parse_http_address(const std::string& address, HttpConfig& http) {
  const auto split = address.rfind(':');
  if (split == std::string::npos) {
    throw std::runtime_error("http.address must be host:port");
  }
  http.host = address.substr(0, split);
  int port = 0;
  try {
    port = std::stoi(address.substr(split + 1));
  } catch (const std::exception&) {
    throw std::runtime_error("http.address port is not a number");
  }
  if (port <= 0 || port > 65535) {
    throw std::runtime_error("http.address port must be in range 1..65535");
  }
  http.port = static_cast<std::uint16_t>(port);
}

std::vector<model::ServiceDefinition> read_services(const json& object, const std::string& where) {
  std::vector<model::ServiceDefinition> services;
  const json* value = find_key(object, "services");
  if (value == nullptr) {
    return services;
  }
  if (!value->is_array()) {
    throw std::runtime_error(where + "services must be a list");
  }
  for (const json& entry : *value) {
    if (!entry.is_object()) {
      throw std::runtime_error(where + "services entries must be objects");
    }
    const std::string service_where = where + "services.";
    model::ServiceDefinition service{};
    service.definition = read_string(entry, "definition", service_where);
    service.sub_path = read_string(entry, "subpath", service_where, service.definition);
    service.description = read_string(entry, "description", service_where);
    service.details = read_details(entry, service_where);
    if (service.sub_path.empty()) {
      throw std::runtime_error(service_where + "subpath must not be empty");
    }
    services.push_back(std::move(service));
  }
  return services;
}

std::vector<model::ConsumedService> read_consumes(const json& object, const std::string& where) {
  std::vector<model::ConsumedService> consumes;
  const json* value = find_key(object, "consumes");
  if (value == nullptr) {
    return consumes;
  }
  if (!value->is_array()) {
    throw std::runtime_error(where + "consumes must be a list");
  }
  for (const json& entry : *value) {
    if (!entry.is_object()) {
      throw std::runtime_error(where + "consumes entries must be objects");
    }
    const std::string consumed_where = where + "consumes.";
    model::ConsumedService consumed{};
    consumed.definition = read_string(entry, "definition", consumed_where);
    consumed.url = read_string(entry, "url", consumed_where);
    consumed.details = read_details(entry, consumed_where);
    if (consumed.definition.empty()) {
      throw std::runtime_error(consumed_where + "definition is required");
    }
    consumes.push_back(std::move(consumed));
  }
  return consumes;
}

AssetConfig read_asset(const json& entry, const std::size_t index) {
  if (!entry.is_object()) {
    throw std::runtime_error("assets[" + std::to_string(index) + "] must be an object");
  }
  AssetConfig asset{};
  asset.name = read_string(entry, "name", "assets[" + std::to_string(index) + "].");
  if (asset.name.empty()) {
    throw std::runtime_error("assets[" + std::to_string(index) + "].name is required");
  }

  const std::string where = "assets." + asset.name + ".";
  asset.kind = read_string(entry, "kind", where);
  if (known_kinds().count(asset.kind) == 0) {
    throw std::runtime_error(where + "kind '" + asset.kind + "' is not supported");
  }
  asset.details = read_details(entry, where);
  asset.services = read_services(entry, where);
  asset.consumes = read_consumes(entry, where);

  if (const json* traits = find_key(entry, "traits")) {
    if (!traits->is_object()) {
      throw std::runtime_error(where + "traits must be an object");
    }
    asset.traits = *traits;
  }
  return asset;
}

}  // namespace

SystemConfig parse_system_config(const json& document) {
  if (!document.is_object()) {
    throw std::runtime_error("configuration must be a JSON object");
  }

  SystemConfig config{};
  config.system = read_string(document, "system", "");
  if (config.system.empty()) {
    throw std::runtime_error("system is required");
  }

  if (const json* http = find_key(document, "http")) {
    if (!http->is_object()) {
      throw std::runtime_error("http must be an object");
    }
    const std::string address = read_string(*http, "address", "http.");
    if (!address.empty()) {
      parse_http_address(address, config.http);
    }
    config.http.workers = static_cast<std::size_t>(read_positive(*http, "workers", "http.", 4));
  }

  config.request_timeout = std::chrono::milliseconds(read_positive(document, "request_timeout_ms", "", 5000));
  config.shutdown_grace = std::chrono::milliseconds(read_positive(document, "shutdown_grace_ms", "", 2000));
  const long long capacity = read_integer(document, "mailbox_capacity", "", 16);
  if (capacity <= 0) {
    throw std::runtime_error("mailbox_capacity must be greater than 0");
  }
  config.mailbox_capacity = static_cast<std::size_t>(capacity);
  config.stdout_debug = read_bool(document, "stdout_debug", "", false);

  if (const json* redis = find_key(document, "redis")) {
    if (!redis->is_object()) {
      throw std::runtime_error("redis must be an object");
    }
    config.redis.address = read_string(*redis, "address", "redis.");
    config.redis.password = read_string(*redis, "password", "redis.");
    config.redis.db = static_cast<int>(read_integer(*redis, "db", "redis.", 0));
    config.redis.key_prefix = read_string(*redis, "key_prefix", "redis.", "assets");
    config.redis.enabled = !config.redis.address.empty();
    if (config.redis.db < 0) {
      throw std::runtime_error("redis.db must be greater than or equal to 0");
    }
  }

  std::set<std::string> names;
  if (const json* assets = find_key(document, "assets")) {
    if (!assets->is_array()) {
      throw std::runtime_error("assets must be a list");
    }
    for (std::size_t i = 0; i < assets->size(); ++i) {
      AssetConfig asset = read_asset((*assets)[i], i);
      if (!names.insert(asset.name).second) {
        throw std::runtime_error("assets." + asset.name + " is defined more than once");
      }
      config.assets.push_back(std::move(asset));
    }
  }

  return config;
}

SystemConfig load_system_config(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  json document;
  try {
    document = json::parse(input);
  } catch (const json::parse_error& ex) {
    throw std::runtime_error("invalid JSON in " + path + ": " + ex.what());
  }
  return parse_system_config(document);
}

}  // namespace asset_agent::core
