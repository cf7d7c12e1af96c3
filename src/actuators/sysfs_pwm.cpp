#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <utility>

#include "actuators/pulse_driver.hpp"
#include "core/errors.hpp"

namespace asset_agent::actuators {
namespace {

bool write_attribute(const std::filesystem::path& path, const std::string& value) noexcept {
  try {
    std::ofstream file(path);
    if (!file.is_open()) {
      return false;
    }
    file << value;
    file.flush();
    return static_cast<bool>(file);
  } catch (const std::exception&) {
    return false;
  }
}

class SysfsPwmDriver final : public PulseDriver {
 public:
  explicit SysfsPwmDriver(SysfsPwmOptions options)
      : options_(std::move(options)),
        channel_path_(std::filesystem::path(options_.chip_path) / ("pwm" + std::to_string(options_.channel))) {}

  ~SysfsPwmDriver() override { release(); }

  void set_pulse_width(const std::chrono::microseconds width) override {
    if (!configured_) {
      configure();
    }
    const auto duty_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(width).count();
    if (!write_attribute(channel_path_ / "duty_cycle", std::to_string(duty_ns))) {
      throw core::DeviceError("cannot set duty cycle on " + channel_path_.string());
    }
    if (!enabled_) {
      if (!write_attribute(channel_path_ / "enable", "1")) {
        throw core::DeviceError("cannot enable " + channel_path_.string());
      }
      enabled_ = true;
    }
  }

  void release() noexcept override {
    if (!enabled_) {
      return;
    }
    if (!write_attribute(channel_path_ / "enable", "0")) {
      std::cerr << "[servo] failed to disable " << channel_path_.string() << '\n';
    }
    enabled_ = false;
  }

 private:
  void configure() {
    std::error_code ec;
    if (!std::filesystem::exists(channel_path_, ec)) {
      if (!write_attribute(std::filesystem::path(options_.chip_path) / "export", std::to_string(options_.channel))) {
        throw core::DeviceError("cannot export " + channel_path_.string());
      }
    }
    const auto period_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(options_.period).count();
    if (!write_attribute(channel_path_ / "period", std::to_string(period_ns))) {
      throw core::DeviceError("cannot set period on " + channel_path_.string());
    }
    configured_ = true;
  }

  SysfsPwmOptions options_;
  std::filesystem::path channel_path_;
  bool configured_{false};
  bool enabled_{false};
};

}  // namespace

std::unique_ptr<PulseDriver> make_sysfs_pwm_driver(SysfsPwmOptions options) {
  return std::make_unique<SysfsPwmDriver>(std::move(options));
}

}  // namespace asset_agent::actuators
