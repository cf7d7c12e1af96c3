#include "assets/factory.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

#include "actuators/io_channel_output.hpp"
#include "actuators/pulse_driver.hpp"
#include "assets/leveler.hpp"
#include "assets/sampled_asset.hpp"
#include "assets/servo.hpp"
#include "assets/topic_asset.hpp"
#include "bus/redis_topic.hpp"
#include "core/math.hpp"
#include "gateway/http_client.hpp"
#include "model/signal_form.hpp"
#include "sensors/io_channel.hpp"

namespace asset_agent::assets {
namespace {

using nlohmann::json;

model::ServiceDefinition service(const char* definition, const char* sub_path, const char* unit,
                                 const char* description, const bool writable) {
  model::ServiceDefinition result{};
  result.definition = definition;
  result.sub_path = sub_path;
  result.details = {{"Unit", {unit}}, {"Forms", {model::kSignalFormVersion}}};
  result.description = description;
  result.writable = writable;
  return result;
}

class TraitReader {
 public:
  TraitReader(const json& traits, std::string where) : traits_(traits), where_(std::move(where)) {}

  double number(const char* key, const double fallback) const {
    const auto it = traits_.find(key);
    if (it == traits_.end() || it->is_null()) {
      return fallback;
    }
    if (!it->is_number() || !std::isfinite(it->get<double>())) {
      throw std::runtime_error(where_ + key + " must be a finite number");
    }
    return it->get<double>();
  }

  double positive(const char* key, const double fallback) const {
    const double value = number(key, fallback);
    if (!(value > 0.0)) {
      throw std::runtime_error(where_ + key + " must be greater than 0");
    }
    return value;
  }

  std::string text(const char* key, const std::string& fallback) const {
    const auto it = traits_.find(key);
    if (it == traits_.end() || it->is_null()) {
      return fallback;
    }
    if (!it->is_string()) {
      throw std::runtime_error(where_ + key + " must be a string");
    }
    return it->get<std::string>();
  }

  std::vector<std::string> list(const char* key) const {
    std::vector<std::string> values;
    const auto it = traits_.find(key);
    if (it == traits_.end() || it->is_null()) {
      return values;
    }
    if (!it->is_array()) {
      throw std::runtime_error(where_ + key + " must be a list of strings");
    }
    for (const json& entry : *it) {
      if (!entry.is_string()) {
        throw std::runtime_error(where_ + key + " must be a list of strings");
      }
      values.push_back(entry.get<std::string>());
    }
    return values;
  }

  std::chrono::milliseconds seconds(const char* key, const double fallback) const {
    const double value = positive(key, fallback);
    if (value < 0.001 || value > 86400.0) {
      throw std::runtime_error(where_ + key + " must be between 0.001 and 86400 seconds");
    }
    return std::chrono::milliseconds(static_cast<long long>(std::llround(value * 1000.0)));
  }

 private:
  const json& traits_;
  std::string where_;
};

// Configured services replace the defaults but may only use sub-paths the kind serves.
std::vector<model::ServiceDefinition> resolve_services(const core::AssetConfig& config) {
  const auto defaults = default_services(config.kind);
  if (config.services.empty()) {
    return defaults;
  }

  std::vector<model::ServiceDefinition> resolved;
  for (const auto& configured : config.services) {
    const model::ServiceDefinition* known = nullptr;
    for (const auto& candidate : defaults) {
      if (candidate.sub_path == configured.sub_path) {
        known = &candidate;
      }
    }
    if (known == nullptr) {
      throw std::runtime_error("assets." + config.name + ".services: " + config.kind + " does not serve '" +
                               configured.sub_path + "'");
    }
    model::ServiceDefinition merged = configured;
    merged.writable = known->writable;
    merged.details = model::merge_details(known->details, configured.details);
    if (merged.definition.empty()) {
      merged.definition = known->definition;
    }
    if (merged.description.empty()) {
      merged.description = known->description;
    }
    resolved.push_back(std::move(merged));
  }
  return resolved;
}

const model::ConsumedService& require_consumed(const AssetProfile& profile, const std::string& definition) {
  for (const auto& consumed : profile.consumes) {
    if (consumed.definition == definition) {
      if (consumed.url.empty()) {
        throw std::runtime_error("assets." + profile.name + ".consumes." + definition + " needs a url");
      }
      return consumed;
    }
  }
  throw std::runtime_error("assets." + profile.name + " must consume a '" + definition + "' service");
}

AssetProfile base_profile(const core::AssetConfig& config) {
  AssetProfile profile{};
  profile.name = config.name;
  profile.details = config.details;
  profile.services = resolve_services(config);
  profile.consumes = config.consumes;
  return profile;
}

std::unique_ptr<UnitAsset> make_w1_thermometer(const core::AssetConfig& config, const AssetContext& context) {
  const TraitReader traits(config.traits, "assets." + config.name + ".traits.");
  AssetProfile profile = base_profile(config);

  core::SamplerOptions sampler{};
  sampler.service = profile.services.front().sub_path;
  sampler.unit = "Celsius";
  sampler.period = traits.seconds("samplingPeriod", 2.0);

  auto source = std::make_unique<sensors::W1Thermometer>(config.name,
                                                         traits.text("deviceRoot", context.w1_device_root));
  return std::make_unique<SampledAsset>(std::move(profile), std::move(sampler), std::move(source), nullptr, nullptr,
                                        context.mailbox_capacity, context.sinks);
}

std::unique_ptr<UnitAsset> make_io_channel(const core::AssetConfig& config, const AssetContext& context) {
  const TraitReader traits(config.traits, "assets." + config.name + ".traits.");
  AssetProfile profile = base_profile(config);

  sensors::IoChannelOptions io{};
  io.tool = traits.text("tool", sensors::kDefaultIoTool);
  io.address = traits.text("address", "");
  io.min_value = traits.number("minValue", 0.0);
  io.max_value = traits.number("maxValue", 10000.0);
  if (io.address.empty()) {
    throw std::runtime_error("assets." + config.name + ".traits.address is required");
  }
  if (!(io.max_value > io.min_value)) {
    throw std::runtime_error("assets." + config.name + ".traits.maxValue must be greater than minValue");
  }

  core::SamplerOptions sampler{};
  sampler.service = profile.services.front().sub_path;
  sampler.unit = "Percent";
  sampler.period = traits.seconds("samplingPeriod", 1.0);

  const double min = io.min_value;
  const double max = io.max_value;
  auto source = std::make_unique<sensors::IoChannelInput>(io);
  auto output = std::make_unique<actuators::IoChannelOutput>(io);
  return std::make_unique<SampledAsset>(
      std::move(profile), std::move(sampler), std::move(source),
      [min, max](const double raw) { return core::scale_to_percent(raw, min, max); }, std::move(output),
      context.mailbox_capacity, context.sinks);
}

std::unique_ptr<UnitAsset> make_servo(const core::AssetConfig& config, const AssetContext& context) {
  const TraitReader traits(config.traits, "assets." + config.name + ".traits.");
  AssetProfile profile = base_profile(config);

  actuators::SysfsPwmOptions pwm{};
  pwm.chip_path = traits.text("chip", pwm.chip_path);
  const double channel = traits.number("channel", 0.0);
  if (channel < 0.0) {
    throw std::runtime_error("assets." + config.name + ".traits.channel must be greater than or equal to 0");
  }
  pwm.channel = static_cast<unsigned>(channel);
  const int initial = servo_position(traits.number("position", kServoDefaultPosition));

  const std::string service = profile.services.front().sub_path;
  auto state = std::make_unique<ServoState>(service, actuators::make_sysfs_pwm_driver(std::move(pwm)), initial);
  return std::make_unique<UnitAsset>(std::move(profile), std::move(state), context.mailbox_capacity);
}

std::unique_ptr<UnitAsset> make_topic(const core::AssetConfig& config, const AssetContext& context) {
  const TraitReader traits(config.traits, "assets." + config.name + ".traits.");
  AssetProfile profile = base_profile(config);
  profile.name = topic_asset_name(config.name);

  const std::vector<std::string> pattern = traits.list("pattern");
  if (!pattern.empty()) {
    const std::string definition = apply_topic_pattern(config.name, pattern, profile.details);
    for (auto& offered : profile.services) {
      offered.definition = definition;
    }
  }

  bus::RedisEndpoint endpoint{};
  const std::string broker = traits.text("broker", "");
  if (!broker.empty()) {
    endpoint = bus::parse_redis_address(broker);
  } else if (context.redis.has_value()) {
    endpoint = *context.redis;
  } else {
    throw std::runtime_error("assets." + config.name + " needs traits.broker or redis.address");
  }

  TopicOptions options{};
  options.channel = config.name;
  options.service = profile.services.front().sub_path;
  options.unit = traits.text("unit", "");

  auto publisher = std::make_unique<bus::RedisPublisher>(endpoint);
  return std::make_unique<TopicAsset>(std::move(profile), std::move(options), std::move(publisher), endpoint,
                                      context.mailbox_capacity, context.sinks);
}

std::unique_ptr<UnitAsset> make_leveler(const core::AssetConfig& config, const AssetContext& context) {
  const TraitReader traits(config.traits, "assets." + config.name + ".traits.");
  AssetProfile profile = base_profile(config);

  LevelerTraits leveler{};
  leveler.set_point = traits.number("setPoint", 20.0);
  leveler.period = traits.seconds("samplingPeriod", 5.0);
  leveler.gains.kp = traits.number("kp", 5.0);
  leveler.gains.ki = traits.number("ki", 0.0);
  leveler.gains.lambda_s = traits.positive("lambda", 0.5);
  leveler.measurement = traits.text("measurement", "level");
  leveler.actuator = traits.text("actuator", "pumpSpeed");

  const model::Details percent = {{"Unit", {"Percent"}}, {"Forms", {model::kSignalFormVersion}}};
  for (auto& consumed : profile.consumes) {
    consumed.details = model::merge_details(model::merge_details(profile.details, percent), consumed.details);
  }

  const auto& upstream = require_consumed(profile, leveler.measurement);
  const auto& downstream = require_consumed(profile, leveler.actuator);
  auto upstream_client = std::make_unique<gateway::HttpServiceClient>(upstream.url, context.request_timeout);
  auto downstream_client = std::make_unique<gateway::HttpServiceClient>(downstream.url, context.request_timeout);

  return std::make_unique<LevelerAsset>(std::move(profile), std::move(leveler), std::move(upstream_client),
                                        std::move(downstream_client), context.request_timeout,
                                        context.mailbox_capacity);
}

}  // namespace

std::vector<model::ServiceDefinition> default_services(const std::string& kind) {
  if (kind == "w1_thermometer") {
    return {service("temperature", "temperature", "Celsius",
                    "provides the temperature (GET) of the 1-wire temperature sensor", false)};
  }
  if (kind == "io_channel") {
    return {service("level", "access", "Percent",
                    "reads the input (GET) or changes the output (PUT) of the channel", true)};
  }
  if (kind == "servo") {
    return {service("rotation", "rotation", "Percent",
                    "provides the servo position (GET) or turns it (PUT) in percent of its range", true)};
  }
  if (kind == "topic") {
    return {service("message", "access", "",
                    "reads the latest topic message (GET) or publishes to the topic (PUT)", true)};
  }
  if (kind == "leveler") {
    return {
        service("setPoint", "setpoint", "Percent", "provides the current level set point (GET) or sets it (PUT)",
                true),
        service("levelError", "levelerror", "Percent",
                "provides the current difference between the set point and the level (GET)", false),
        service("jitter", "jitter", "millisecond",
                "provides the execution time of the last control cycle (GET)", false),
    };
  }
  throw std::runtime_error("unknown asset kind: " + kind);
}

std::unique_ptr<UnitAsset> make_asset(const core::AssetConfig& config, const AssetContext& context) {
  if (config.kind == "w1_thermometer") {
    return make_w1_thermometer(config, context);
  }
  if (config.kind == "io_channel") {
    return make_io_channel(config, context);
  }
  if (config.kind == "servo") {
    return make_servo(config, context);
  }
  if (config.kind == "topic") {
    return make_topic(config, context);
  }
  if (config.kind == "leveler") {
    return make_leveler(config, context);
  }
  throw std::runtime_error("assets." + config.name + ".kind '" + config.kind + "' is not supported");
}

}  // namespace asset_agent::assets
