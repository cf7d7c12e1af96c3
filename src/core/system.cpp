#include "core/system.hpp"

#include <future>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "assets/factory.hpp"
#include "bus/redis_connection.hpp"

namespace asset_agent::core {

System::System(SystemConfig config)
    : config_(std::move(config)),
      gateway_(config_.request_timeout),
      router_(config_.system, registry_, gateway_) {
  assets::AssetContext context{};
  context.mailbox_capacity = config_.mailbox_capacity;
  context.request_timeout = config_.request_timeout;

  if (config_.stdout_debug) {
    stdout_sink_ = std::make_unique<sinks::StdoutDebugSink>();
    context.sinks.push_back(stdout_sink_.get());
  }

  if (config_.redis.enabled) {
    bus::RedisEndpoint endpoint = bus::parse_redis_address(config_.redis.address);
    endpoint.password = config_.redis.password;
    endpoint.db = config_.redis.db;
    context.redis = endpoint;

    sinks::RedisTsOptions options{};
    options.endpoint = endpoint;
    options.key_prefix = config_.redis.key_prefix;
    historian_ = std::make_unique<sinks::Historian>(std::move(options));
    context.sinks.push_back(historian_.get());
    std::cerr << "[system] historian enabled at " << bus::describe(endpoint) << '\n';
  }

  for (const AssetConfig& asset_config : config_.assets) {
    std::unique_ptr<assets::UnitAsset> asset = assets::make_asset(asset_config, context);
    const std::string name = asset->name();
    if (!registry_.emplace(name, std::move(asset)).second) {
      throw std::runtime_error("assets." + asset_config.name + " resolves to duplicate asset name " + name);
    }
    std::cerr << "[system] " << config_.system << '/' << name << " (" << asset_config.kind << ")\n";
  }

  gateway::HttpServerOptions http{};
  http.host = config_.http.host;
  http.port = config_.http.port;
  http.workers = config_.http.workers;
  http.io_timeout = config_.request_timeout;
  server_ = std::make_unique<gateway::HttpServer>(
      std::move(http), [this](const gateway::HttpRequest& request) { return router_.handle(request); });
}

System::~System() { stop(); }

void System::start() {
  if (started_) {
    return;
  }
  server_->open();
  started_ = true;

  const std::stop_token stop = stop_source_.get_token();
  if (historian_ != nullptr) {
    historian_->start(stop);
  }
  for (auto& [name, asset] : registry_) {
    asset->start(stop);
  }
  server_->start(stop);
  std::cerr << "[system] " << config_.system << " started with " << registry_.size() << " assets on port "
            << server_->port() << '\n';
}

void System::stop() {
  if (stopped_) {
    return;
  }
  stopped_ = true;
  stop_source_.request_stop();
  if (!started_) {
    return;
  }

  auto joined = std::async(std::launch::async, [this] { join_all(); });
  if (joined.wait_for(config_.shutdown_grace) != std::future_status::ready) {
    std::cerr << "[system] shutdown grace of " << config_.shutdown_grace.count()
              << " ms exceeded; waiting for remaining tasks\n";
  }
  joined.get();
  std::cerr << "[system] " << config_.system << " stopped\n";
}

const std::string& System::name() const noexcept { return config_.system; }

const assets::AssetRegistry& System::registry() const noexcept { return registry_; }

const gateway::Router& System::router() const noexcept { return router_; }

std::uint16_t System::http_port() const noexcept { return server_->port(); }

std::stop_token System::stop_token() const noexcept { return stop_source_.get_token(); }

void System::join_all() {
  server_->join();
  for (auto& [name, asset] : registry_) {
    asset->join();
  }
  if (historian_ != nullptr) {
    historian_->join();
  }
}

}  // namespace asset_agent::core
