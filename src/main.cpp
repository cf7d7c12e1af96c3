#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include "core/config.hpp"
#include "core/system.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

std::string format_config_settings(const asset_agent::core::SystemConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[system] loaded config from " << config_path
         << " | system=" << config.system
         << " | http=" << config.http.host << ':' << config.http.port
         << " | workers=" << config.http.workers
         << " | request_timeout_ms=" << config.request_timeout.count()
         << " | mailbox_capacity=" << config.mailbox_capacity
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | assets=" << config.assets.size();
  return output.str();
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);
  std::signal(SIGPIPE, SIG_IGN);

  const std::string config_path = argc > 1 ? argv[1] : "systemconfig.json";

  std::unique_ptr<asset_agent::core::System> system;
  try {
    asset_agent::core::SystemConfig config = asset_agent::core::load_system_config(config_path);
    std::cerr << format_config_settings(config, config_path) << '\n';
    system = std::make_unique<asset_agent::core::System>(std::move(config));
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  try {
    system->start();
  } catch (const std::exception& ex) {
    std::cerr << "startup error: " << ex.what() << '\n';
    system->stop();
    return 1;
  }

  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  std::cerr << "[system] shutdown signal received; stopping\n";
  system->stop();

  return 0;
}
