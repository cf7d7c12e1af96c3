#include <sys/stat.h>
#include <unistd.h>

#include <chrono>
#include <cmath>
#include <cstdarg>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/http.hpp>
#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

#include "assets/factory.hpp"
#include "assets/sampled_asset.hpp"
#include "assets/servo.hpp"
#include "assets/topic_asset.hpp"
#include "bus/redis_connection.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/system.hpp"
#include "gateway/http_client.hpp"
#include "gateway/http_server.hpp"
#include "gateway/router.hpp"
#include "model/signal_form.hpp"
#include "sinks/historian.hpp"
#include "sinks/redis_ts.hpp"

using asset_agent::assets::AssetContext;
using asset_agent::assets::AssetProfile;
using asset_agent::assets::AssetRegistry;
using asset_agent::assets::SampledState;
using asset_agent::assets::ServoState;
using asset_agent::assets::TopicAsset;
using asset_agent::assets::UnitAsset;
using asset_agent::core::AssetConfig;
using asset_agent::core::SystemConfig;
using asset_agent::gateway::GatewayStatus;
using asset_agent::gateway::HttpRequest;
using asset_agent::gateway::HttpResponse;
using asset_agent::gateway::HttpServer;
using asset_agent::gateway::HttpServerOptions;
using asset_agent::gateway::HttpServiceClient;
using asset_agent::gateway::RequestGateway;
using asset_agent::gateway::Router;
using asset_agent::model::Signal;
using asset_agent::sinks::Historian;
using asset_agent::sinks::RedisTsOptions;
using asset_agent::sinks::RedisTsSink;
using asset_agent::sinks::SignalRecord;
using nlohmann::json;
using tcp = boost::asio::ip::tcp;
namespace http = boost::beast::http;
using namespace std::chrono_literals;

namespace {

struct RedisMockState {
  std::vector<std::string> commands{};
  std::vector<std::string> last_argv{};
  std::vector<std::pair<std::string, std::string>> published{};
  int command_argv_calls{0};
  bool refuse_connect{false};
  bool reject_madd{false};
  bool reject_publish{false};
};

RedisMockState g_redis_mock{};
char g_error_text[] = "ERR TSDB: error";

redisContext* mock_context() {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  if (g_redis_mock.refuse_connect) {
    context->err = REDIS_ERR_IO;
    std::strncpy(context->errstr, "Connection refused", sizeof(context->errstr) - 1);
  } else {
    context->err = REDIS_OK;
  }
  return context;
}

}  // namespace

extern "C" {

redisContext* redisConnectWithTimeout(const char*, int, const struct timeval) { return mock_context(); }

redisContext* redisConnectUnixWithTimeout(const char*, const struct timeval) { return mock_context(); }

void redisFree(redisContext* c) { std::free(c); }

void* redisCommand(redisContext*, const char* format, ...) {
  va_list args;
  va_start(args, format);
  const std::string command(format);
  bool publish = false;
  if (command.rfind("TS.CREATE %s", 0) == 0) {
    g_redis_mock.commands.push_back(std::string("TS.CREATE ") + va_arg(args, const char*));
  } else if (command.rfind("PUBLISH %b %b", 0) == 0) {
    publish = true;
    const char* channel = va_arg(args, const char*);
    const std::size_t channel_len = va_arg(args, std::size_t);
    const char* payload = va_arg(args, const char*);
    const std::size_t payload_len = va_arg(args, std::size_t);
    g_redis_mock.published.emplace_back(std::string(channel, channel_len), std::string(payload, payload_len));
    g_redis_mock.commands.emplace_back("PUBLISH");
  } else {
    g_redis_mock.commands.push_back(command);
  }
  va_end(args);

  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  if (publish && g_redis_mock.reject_publish) {
    reply->type = REDIS_REPLY_ERROR;
    reply->str = g_error_text;
  } else {
    reply->type = REDIS_REPLY_STATUS;
  }
  return reply;
}

void* redisCommandArgv(redisContext*, int argc, const char** argv, const size_t*) {
  g_redis_mock.command_argv_calls += 1;
  g_redis_mock.last_argv.clear();
  for (int i = 0; i < argc; ++i) {
    g_redis_mock.last_argv.emplace_back(argv[i]);
  }
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  if (g_redis_mock.reject_madd) {
    reply->type = REDIS_REPLY_ERROR;
    reply->str = g_error_text;
  } else {
    reply->type = REDIS_REPLY_ARRAY;
  }
  return reply;
}

void freeReplyObject(void* reply) { std::free(reply); }

}  // extern "C"

namespace {

bool almost_equal(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

template <typename Fn>
bool throws_runtime_error(Fn&& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

std::string make_temp_dir() {
  char pattern[] = "/tmp/asset-agent-XXXXXX";
  const char* dir = mkdtemp(pattern);
  return dir == nullptr ? std::string{} : std::string(dir);
}

Signal percent(const double value) {
  Signal signal{};
  signal.value = value;
  signal.unit = "Percent";
  signal.timestamp = std::chrono::system_clock::now();
  return signal;
}

class FakePulseDriver final : public asset_agent::actuators::PulseDriver {
 public:
  explicit FakePulseDriver(bool* reject) : reject_(reject) {}

  void set_pulse_width(const std::chrono::microseconds /*width*/) override {
    if (*reject_) {
      throw asset_agent::core::DeviceError("pwm chip gone");
    }
  }
  void release() noexcept override {}

 private:
  bool* reject_;
};

class RecordingSink final : public asset_agent::sinks::SignalSink {
 public:
  void publish(const SignalRecord& record) override { records.push_back(record); }

  std::vector<SignalRecord> records{};
};

// Registry with a writable servo "valve" and a read-only thermometer "boiler".
AssetRegistry make_plant(bool* reject_pulses) {
  AssetRegistry registry;

  AssetProfile valve{};
  valve.name = "valve";
  valve.details = {{"Location", {"Kitchen"}}};
  valve.services = asset_agent::assets::default_services("servo");
  registry.emplace("valve", std::make_unique<UnitAsset>(
                                std::move(valve),
                                std::make_unique<ServoState>("rotation", std::make_unique<FakePulseDriver>(reject_pulses)),
                                4));

  AssetProfile boiler{};
  boiler.name = "boiler";
  boiler.services = asset_agent::assets::default_services("w1_thermometer");
  registry.emplace("boiler", std::make_unique<UnitAsset>(std::move(boiler),
                                                         std::make_unique<SampledState>("temperature", "Celsius"), 4));
  return registry;
}

HttpRequest request(const std::string& method, const std::string& target, const std::string& body = {},
                    const std::string& content_type = "application/json") {
  HttpRequest result{};
  result.method_string(method);
  result.target(target);
  result.version(11);
  if (!body.empty()) {
    result.set(http::field::content_type, content_type);
    result.body() = body;
    result.prepare_payload();
  }
  return result;
}

int test_config_parsing() {
  const json document = json::parse(R"({
    "system": "plant",
    "http": {"address": "127.0.0.1:8870", "workers": 2},
    "request_timeout_ms": 750,
    "redis": {"address": "unix:///run/redis.sock", "key_prefix": "site"},
    "assets": [
      {"name": "28-000005e2fdc3", "kind": "w1_thermometer",
       "details": {"Location": "Kitchen", "FunctionalLocation": ["Building1", "Floor2"]}},
      {"name": "sump", "kind": "io_channel",
       "services": [{"definition": "level", "subpath": "access", "details": {"Unit": "Percent"}}],
       "traits": {"address": "InputValue_1"}}
    ]
  })");
  const SystemConfig config = asset_agent::core::parse_system_config(document);
  if (config.system != "plant" || config.http.host != "127.0.0.1" || config.http.port != 8870 ||
      config.http.workers != 2 || config.request_timeout != 750ms) {
    return fail("test_config_parsing", "top-level settings mismatch");
  }
  if (!config.redis.enabled || config.redis.key_prefix != "site" || config.mailbox_capacity != 16) {
    return fail("test_config_parsing", "redis section or defaults mismatch");
  }
  if (config.assets.size() != 2 || config.assets[0].details.at("Location") != std::vector<std::string>{"Kitchen"} ||
      config.assets[0].details.at("FunctionalLocation").size() != 2) {
    return fail("test_config_parsing", "details should accept a string or a list");
  }
  if (config.assets[1].services.size() != 1 || config.assets[1].services[0].sub_path != "access" ||
      config.assets[1].traits.at("address") != "InputValue_1") {
    return fail("test_config_parsing", "services and traits should be kept");
  }

  const char* invalid[] = {
      R"({"assets": []})",
      R"({"system": "plant", "assets": [{"name": "x", "kind": "camera"}]})",
      R"({"system": "plant", "assets": [{"name": "x", "kind": "servo"}, {"name": "x", "kind": "servo"}]})",
      R"({"system": "plant", "request_timeout_ms": 0})",
      R"({"system": "plant", "http": {"address": "localhost:99999"}})",
      R"({"system": "plant", "assets": [{"name": "x", "kind": "servo", "details": {"Location": [1]}}]})",
      R"({"system": "plant", "redis": {"address": "localhost:6379", "db": -1}})",
  };
  for (const char* text : invalid) {
    if (!throws_runtime_error([text] { (void)asset_agent::core::parse_system_config(json::parse(text)); })) {
      return fail("test_config_parsing", "invalid configuration should be rejected");
    }
  }

  const auto path = std::filesystem::temp_directory_path() / "asset_agent_system_config.json";
  {
    std::ofstream out(path);
    out << R"({"system": "lab"})";
  }
  const SystemConfig loaded = asset_agent::core::load_system_config(path.string());
  std::filesystem::remove(path);
  if (loaded.system != "lab" || loaded.redis.enabled || loaded.http.port != 20150) {
    return fail("test_config_parsing", "minimal file should load with defaults");
  }
  if (!throws_runtime_error([] { (void)asset_agent::core::load_system_config("/nonexistent/systemconfig.json"); })) {
    return fail("test_config_parsing", "missing file should be reported");
  }
  return 0;
}

int test_redis_address_parsing() {
  using asset_agent::bus::parse_redis_address;

  const auto tcp = parse_redis_address("redis.local:6380");
  if (tcp.host != "redis.local" || tcp.port != 6380 || !tcp.unix_socket.empty()) {
    return fail("test_redis_address_parsing", "host:port should parse");
  }
  if (parse_redis_address("unix:///run/redis.sock").unix_socket != "/run/redis.sock" ||
      parse_redis_address("/tmp/redis.sock").unix_socket != "/tmp/redis.sock") {
    return fail("test_redis_address_parsing", "unix socket forms should parse");
  }
  if (asset_agent::bus::describe(tcp) != "redis.local:6380") {
    return fail("test_redis_address_parsing", "endpoint description mismatch");
  }
  if (!throws_runtime_error([] { (void)parse_redis_address("localhost:0"); }) ||
      !throws_runtime_error([] { (void)parse_redis_address("localhost:port"); })) {
    return fail("test_redis_address_parsing", "bad ports should be rejected");
  }
  return 0;
}

int test_factory_builds_assets() {
  AssetContext context{};
  context.mailbox_capacity = 4;

  AssetConfig thermometer{};
  thermometer.name = "28-000005e2fdc3";
  thermometer.kind = "w1_thermometer";
  auto built = asset_agent::assets::make_asset(thermometer, context);
  const auto* temperature = built->find_service("temperature");
  if (temperature == nullptr || temperature->writable || temperature->details.at("Unit").front() != "Celsius") {
    return fail("test_factory_builds_assets", "thermometer should offer a read-only temperature in Celsius");
  }

  AssetConfig hurried = thermometer;
  hurried.traits = {{"samplingPeriod", 0.0001}};
  try {
    (void)asset_agent::assets::make_asset(hurried, context);
    return fail("test_factory_builds_assets", "sampling period below a millisecond should be rejected");
  } catch (const std::runtime_error& ex) {
    if (std::string(ex.what()).find("samplingPeriod") == std::string::npos) {
      return fail("test_factory_builds_assets", "period error should name the trait");
    }
  }

  AssetConfig sump{};
  sump.name = "sump";
  sump.kind = "io_channel";
  if (!throws_runtime_error([&] { (void)asset_agent::assets::make_asset(sump, context); })) {
    return fail("test_factory_builds_assets", "io channel without an address should be rejected");
  }
  sump.traits = {{"address", "InputValue_1"}};
  sump.services.push_back({"level", "bogus", {}, {}, false});
  if (!throws_runtime_error([&] { (void)asset_agent::assets::make_asset(sump, context); })) {
    return fail("test_factory_builds_assets", "sub-path the kind does not serve should be rejected");
  }
  sump.services[0].sub_path = "access";
  sump.services[0].details = {{"Location", {"Basement"}}};
  auto channel = asset_agent::assets::make_asset(sump, context);
  const auto* access = channel->find_service("access");
  if (access == nullptr || !access->writable || access->details.at("Unit").front() != "Percent" ||
      access->details.at("Location").front() != "Basement") {
    return fail("test_factory_builds_assets", "configured service should merge into the kind's defaults");
  }

  AssetConfig leveler{};
  leveler.name = "tank";
  leveler.kind = "leveler";
  leveler.consumes.push_back({"level", "http://127.0.0.1:20150/plant/sump/access", {}});
  if (!throws_runtime_error([&] { (void)asset_agent::assets::make_asset(leveler, context); })) {
    return fail("test_factory_builds_assets", "leveler without an actuator should be rejected");
  }
  leveler.consumes.push_back({"pumpSpeed", "ftp://127.0.0.1/pump", {}});
  if (!throws_runtime_error([&] { (void)asset_agent::assets::make_asset(leveler, context); })) {
    return fail("test_factory_builds_assets", "non-http consumed url should be rejected");
  }
  leveler.consumes[1].url = "http://127.0.0.1:20150/plant/pump/access";
  auto tank = asset_agent::assets::make_asset(leveler, context);
  if (tank->services().size() != 3 || tank->find_service("setpoint") == nullptr ||
      !tank->find_service("setpoint")->writable || tank->find_service("jitter")->writable ||
      tank->consumed_services().front().details.at("Unit").front() != "Percent") {
    return fail("test_factory_builds_assets", "leveler should offer set point, level error and jitter");
  }

  AssetConfig topic{};
  topic.name = "MyHouse/Kitchen/temperature";
  topic.kind = "topic";
  topic.traits = {{"pattern", json::array({"House", "Room"})}};
  if (!throws_runtime_error([&] { (void)asset_agent::assets::make_asset(topic, context); })) {
    return fail("test_factory_builds_assets", "topic without a bus should be rejected");
  }
  context.redis = asset_agent::bus::RedisEndpoint{};
  auto subscribed = asset_agent::assets::make_asset(topic, context);
  const auto* message = subscribed->find_service("access");
  if (subscribed->name() != "MyHouse_Kitchen_temperature" || message == nullptr ||
      message->definition != "temperature" || subscribed->details().at("House").front() != "MyHouse" ||
      subscribed->details().at("Room").front() != "Kitchen") {
    return fail("test_factory_builds_assets", "topic pattern should name the asset and fill its details");
  }
  return 0;
}

int test_router_statuses() {
  bool reject_pulses = false;
  AssetRegistry registry = make_plant(&reject_pulses);
  const RequestGateway gateway(1000ms);
  const Router router("plant", registry, gateway);
  std::stop_source stop;
  for (auto& [name, asset] : registry) {
    asset->start(stop.get_token());
  }

  const auto system = router.handle(request("GET", "/plant"));
  const auto described = json::parse(system.body());
  if (system.result_int() != 200 || described.at("assets").size() != 2 ||
      described.at("assets")[1].at("services")[0] != "/plant/valve/rotation") {
    return fail("test_router_statuses", "system description should list assets and service paths");
  }
  const auto asset = json::parse(router.handle(request("GET", "/plant/valve")).body());
  if (asset.at("name") != "valve" || asset.at("details").at("Location")[0] != "Kitchen" ||
      asset.at("services")[0].at("writable") != true) {
    return fail("test_router_statuses", "asset description mismatch");
  }

  const auto read = router.handle(request("GET", "/plant/valve/rotation"));
  if (read.result_int() != 200 || !almost_equal(asset_agent::model::decode_signal(read.body()).value, 50.0)) {
    return fail("test_router_statuses", "GET should return the servo position");
  }
  const auto written =
      router.handle(request("PUT", "/plant/valve/rotation", asset_agent::model::encode_signal(percent(30.0))));
  if (written.result_int() != 200 ||
      !almost_equal(asset_agent::model::decode_signal(router.handle(request("GET", "/plant/valve/rotation")).body()).value,
                    30.0)) {
    return fail("test_router_statuses", "PUT should move the servo");
  }

  struct Expectation {
    HttpRequest incoming;
    int status;
  };
  const std::vector<Expectation> expectations = {
      {request("PUT", "/plant/valve/rotation", "30", "text/plain"), 400},
      {request("PUT", "/plant/valve/rotation", R"({"unit":"Percent"})"), 400},
      {request("PUT", "/plant/boiler/temperature", asset_agent::model::encode_signal(percent(1.0))), 405},
      {request("DELETE", "/plant/valve/rotation"), 405},
      {request("PUT", "/plant", "{}"), 405},
      {request("GET", "/plant/pump"), 404},
      {request("GET", "/plant/valve/angle"), 404},
      {request("GET", "/factory/valve/rotation"), 404},
      {request("GET", "/plant/valve/rotation/extra"), 404},
  };
  for (const auto& expectation : expectations) {
    const auto response = router.handle(expectation.incoming);
    if (response.result_int() != expectation.status || json::parse(response.body()).count("error") == 0) {
      std::cerr << expectation.incoming.method_string() << ' ' << expectation.incoming.target() << " -> "
                << response.result_int() << '\n';
      return fail("test_router_statuses", "unexpected status for a rejected request");
    }
  }

  reject_pulses = true;
  if (router.handle(request("PUT", "/plant/valve/rotation", asset_agent::model::encode_signal(percent(80.0)))).result_int() !=
      500) {
    return fail("test_router_statuses", "device failure should map to 500");
  }

  stop.request_stop();
  for (auto& [name, unit] : registry) {
    unit->join();
  }

  // Owners never started: requests run out of time.
  AssetRegistry stalled = make_plant(&reject_pulses);
  const RequestGateway impatient(50ms);
  const Router slow("plant", stalled, impatient);
  if (slow.handle(request("GET", "/plant/boiler/temperature")).result_int() != 504) {
    return fail("test_router_statuses", "unanswered request should map to 504");
  }

  if (asset_agent::gateway::http_status(GatewayStatus::not_found) != http::status::not_found ||
      asset_agent::gateway::http_status(GatewayStatus::unsupported) != http::status::method_not_allowed ||
      asset_agent::gateway::http_status(GatewayStatus::timeout) != http::status::gateway_timeout) {
    return fail("test_router_statuses", "gateway status mapping mismatch");
  }

  // Raw bytes in the target are echoed back in the error body; the reply must still be valid JSON.
  for (const char* garbled : {"/\xff\xfe", "/plant/\xc3\x28"}) {
    const auto response = slow.handle(HttpRequest{http::verb::get, garbled, 11});
    if (response.result_int() != 404 || !json::accept(response.body())) {
      return fail("test_router_statuses", "invalid UTF-8 in the target should still yield a JSON 404");
    }
  }
  return 0;
}

int test_http_loopback() {
  bool reject_pulses = false;
  AssetRegistry registry = make_plant(&reject_pulses);
  const RequestGateway gateway(1000ms);
  const Router router("plant", registry, gateway);

  HttpServerOptions options{};
  options.host = "127.0.0.1";
  options.port = 0;
  options.workers = 2;
  options.io_timeout = 2000ms;
  HttpServer server(options, [&router](const HttpRequest& incoming) { return router.handle(incoming); });
  server.open();
  if (server.port() == 0) {
    return fail("test_http_loopback", "ephemeral port should be reported");
  }

  std::stop_source stop;
  for (auto& [name, asset] : registry) {
    asset->start(stop.get_token());
  }
  server.start(stop.get_token());

  const std::string base = "http://127.0.0.1:" + std::to_string(server.port()) + "/plant/";
  HttpServiceClient valve(base + "valve/rotation", 2000ms);
  std::string error;
  if (!valve.set_state(percent(64.0), error, std::stop_token{})) {
    std::cerr << error << '\n';
    return fail("test_http_loopback", "PUT over HTTP should succeed");
  }
  Signal state{};
  if (!valve.get_state(state, error, std::stop_token{}) || !almost_equal(state.value, 64.0) || state.unit != "Percent") {
    return fail("test_http_loopback", "GET over HTTP should return the written position");
  }

  HttpServiceClient boiler(base + "boiler/temperature", 2000ms);
  if (boiler.set_state(percent(1.0), error, std::stop_token{}) || error.find("405") == std::string::npos) {
    return fail("test_http_loopback", "write to a read-only service should fail with its status");
  }
  HttpServiceClient missing(base + "pump/access", 2000ms);
  if (missing.get_state(state, error, std::stop_token{})) {
    return fail("test_http_loopback", "unknown asset should fail");
  }

  stop.request_stop();
  server.join();
  for (auto& [name, asset] : registry) {
    asset->join();
  }

  if (valve.get_state(state, error, std::stop_token{})) {
    return fail("test_http_loopback", "closed listener should fail the request");
  }
  if (!throws_runtime_error([] { HttpServiceClient("mqtt://broker/topic", 100ms); })) {
    return fail("test_http_loopback", "client should only accept http urls");
  }
  return 0;
}

// Writes bytes on a fresh connection and returns everything the peer sends before closing.
std::string raw_exchange(const std::uint16_t port, const std::string& bytes) {
  boost::asio::io_context io;
  tcp::socket socket(io);
  socket.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
  boost::asio::write(socket, boost::asio::buffer(bytes));
  std::string reply;
  boost::system::error_code ec;
  boost::asio::read(socket, boost::asio::dynamic_buffer(reply), ec);
  if (ec && ec != boost::asio::error::eof) {
    std::cerr << "raw exchange ended with " << ec.message() << '\n';
  }
  return reply;
}

std::string reply_body(const std::string& reply) {
  const auto split = reply.find("\r\n\r\n");
  return split == std::string::npos ? std::string{} : reply.substr(split + 4);
}

int test_http_server_survives_bad_input() {
  HttpServerOptions options{};
  options.host = "127.0.0.1";
  options.port = 0;
  options.workers = 2;
  options.io_timeout = 2000ms;
  HttpServer server(options, [](const HttpRequest& incoming) -> HttpResponse {
    const std::string target(incoming.target().data(), incoming.target().size());
    if (target == "/explode") {
      throw std::runtime_error("handler exploded");
    }
    return asset_agent::gateway::json_response(json{{"target", target}});
  });
  std::stop_source stop;
  server.start(stop.get_token());

  const std::string garbled = raw_exchange(server.port(), "GET /\xff\xfe HTTP/1.1\r\nHost: local\r\n\r\n");
  if (garbled.rfind("HTTP/1.1 200", 0) != 0 || !json::accept(reply_body(garbled))) {
    return fail("test_http_server_survives_bad_input", "invalid UTF-8 echoed into a reply should still be valid JSON");
  }

  // More failures than workers: each one must leave its worker alive.
  for (int round = 0; round < 4; ++round) {
    const std::string failed = raw_exchange(server.port(), "GET /explode HTTP/1.1\r\nHost: local\r\n\r\n");
    if (failed.rfind("HTTP/1.1 500", 0) != 0 || json::parse(reply_body(failed)).count("error") == 0) {
      return fail("test_http_server_survives_bad_input", "throwing handler should answer 500");
    }
  }

  const std::string malformed = raw_exchange(server.port(), "NOT HTTP AT ALL\r\n\r\n");
  if (malformed.rfind("HTTP/1.1 400", 0) != 0) {
    return fail("test_http_server_survives_bad_input", "malformed request should answer 400");
  }

  const std::string healthy = raw_exchange(server.port(), "GET /still-here HTTP/1.1\r\nHost: local\r\n\r\n");
  if (healthy.rfind("HTTP/1.1 200", 0) != 0 || json::parse(reply_body(healthy)).at("target") != "/still-here") {
    return fail("test_http_server_survives_bad_input", "server should keep serving after bad input");
  }

  stop.request_stop();
  server.join();
  return 0;
}

int test_http_client_observes_stop() {
  // Accepts connections in the kernel backlog and never answers them.
  boost::asio::io_context io;
  tcp::acceptor silent(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
  const std::string url = "http://127.0.0.1:" + std::to_string(silent.local_endpoint().port()) + "/plant/pump/access";

  HttpServiceClient patient(url, 5000ms);
  std::stop_source stop;
  std::thread stopper([&stop] {
    std::this_thread::sleep_for(100ms);
    stop.request_stop();
  });
  Signal state{};
  std::string error;
  const auto began = std::chrono::steady_clock::now();
  const bool answered = patient.get_state(state, error, stop.get_token());
  const auto waited = std::chrono::steady_clock::now() - began;
  stopper.join();
  if (answered || error != "cancelled" || waited > 2s) {
    return fail("test_http_client_observes_stop", "stop should end a request to a silent service");
  }

  std::stop_source already;
  already.request_stop();
  if (patient.set_state(percent(10.0), error, already.get_token()) || error != "cancelled") {
    return fail("test_http_client_observes_stop", "request after stop should not be attempted");
  }

  HttpServiceClient hasty(url, 200ms);
  if (hasty.get_state(state, error, std::stop_token{}) || error.find("timed out") == std::string::npos) {
    std::cerr << error << '\n';
    return fail("test_http_client_observes_stop", "silent service should time out");
  }
  return 0;
}

SignalRecord record(const std::string& asset, const std::string& service, const double value) {
  SignalRecord result{};
  result.asset = asset;
  result.service = service;
  result.signal.value = value;
  result.signal.unit = "Celsius";
  result.signal.timestamp = asset_agent::model::parse_rfc3339("2024-05-01T12:00:00.250Z");
  return result;
}

int test_redis_ts_sink_writes() {
  g_redis_mock = {};
  RedisTsOptions options{};
  options.key_prefix = "plant";
  RedisTsSink sink(options);

  if (!sink.publish({record("boiler", "temperature", 42.5), record("valve", "rotation", NAN),
                     record("sump", "access", 10.0)})) {
    return fail("test_redis_ts_sink_writes", "publish should succeed with mock redis");
  }
  const std::vector<std::string> expected = {"TS.MADD",         "plant:boiler:temperature", "1714564800250",
                                             "42.500000",       "plant:sump:access",        "1714564800250",
                                             "10.000000"};
  if (g_redis_mock.command_argv_calls != 1 || g_redis_mock.last_argv != expected) {
    return fail("test_redis_ts_sink_writes", "TS.MADD should carry finite samples only");
  }
  if (g_redis_mock.commands != std::vector<std::string>{"TS.CREATE plant:boiler:temperature",
                                                        "TS.CREATE plant:sump:access"}) {
    return fail("test_redis_ts_sink_writes", "series should be created before the first write");
  }

  if (!sink.publish({record("boiler", "temperature", 43.0)}) || g_redis_mock.commands.size() != 2) {
    return fail("test_redis_ts_sink_writes", "existing series should not be created again");
  }

  g_redis_mock = {};
  g_redis_mock.refuse_connect = true;
  RedisTsSink offline(options);
  if (offline.check_connectivity() || offline.publish({record("boiler", "temperature", 1.0)})) {
    return fail("test_redis_ts_sink_writes", "unreachable server should fail the write");
  }
  g_redis_mock = {};
  return 0;
}

int test_historian_queue_and_batches() {
  g_redis_mock = {};
  Historian historian(RedisTsOptions{}, 4);
  for (int i = 0; i < 6; ++i) {
    historian.publish(record("boiler", "temperature", 20.0 + i));
  }
  if (historian.dropped() != 2) {
    return fail("test_historian_queue_and_batches", "records beyond the queue should be dropped");
  }

  std::stop_source stop;
  if (!historian.flush_once(stop.get_token()) || historian.written() != 4) {
    return fail("test_historian_queue_and_batches", "queued records should be written in one batch");
  }
  if (g_redis_mock.command_argv_calls != 1 || g_redis_mock.last_argv.size() != 13 ||
      g_redis_mock.last_argv[3] != "20.000000" || g_redis_mock.last_argv[12] != "23.000000") {
    return fail("test_historian_queue_and_batches", "batch should keep arrival order");
  }

  g_redis_mock.reject_madd = true;
  historian.publish(record("boiler", "temperature", 30.0));
  if (historian.flush_once(stop.get_token()) || historian.written() != 4) {
    return fail("test_historian_queue_and_batches", "rejected batch should be reported and not counted");
  }

  g_redis_mock.reject_madd = false;
  historian.publish(record("boiler", "temperature", 31.0));
  if (!historian.flush_once(stop.get_token()) || historian.written() != 5) {
    return fail("test_historian_queue_and_batches", "historian should recover once redis accepts writes");
  }
  g_redis_mock = {};
  return 0;
}

int test_topic_asset_messages() {
  g_redis_mock = {};
  RecordingSink sink;
  AssetContext context{};
  context.mailbox_capacity = 4;
  context.redis = asset_agent::bus::RedisEndpoint{};
  context.sinks.push_back(&sink);

  AssetConfig config{};
  config.name = "MyHouse/Kitchen/temperature";
  config.kind = "topic";
  config.traits = {{"unit", "Celsius"}};
  auto built = asset_agent::assets::make_asset(config, context);
  auto* topic = dynamic_cast<TopicAsset*>(built.get());
  if (topic == nullptr) {
    return fail("test_topic_asset_messages", "topic kind should build a topic asset");
  }

  std::stop_source stop;
  topic->owner().start(stop.get_token());
  const RequestGateway gateway(1000ms);

  if (!topic->deliver("21.5", stop.get_token())) {
    return fail("test_topic_asset_messages", "bare number should be accepted");
  }
  const auto latest = gateway.read(topic->owner(), "access");
  if (!latest.ok() || !almost_equal(latest.signal.value, 21.5) || latest.signal.unit != "Celsius") {
    return fail("test_topic_asset_messages", "delivered value should be readable with the topic unit");
  }
  if (topic->deliver("open", stop.get_token())) {
    return fail("test_topic_asset_messages", "undecodable payload should be dropped");
  }
  if (sink.records.size() != 1 || sink.records[0].asset != "MyHouse_Kitchen_temperature" ||
      sink.records[0].service != "access") {
    return fail("test_topic_asset_messages", "accepted messages should reach the sinks");
  }

  if (!gateway.write(topic->owner(), "access", percent(55.0)).ok() || g_redis_mock.published.size() != 1 ||
      g_redis_mock.published[0].first != "MyHouse/Kitchen/temperature" ||
      !almost_equal(asset_agent::model::decode_signal(g_redis_mock.published[0].second).value, 55.0)) {
    return fail("test_topic_asset_messages", "write should publish the signal form to the channel");
  }

  g_redis_mock.reject_publish = true;
  if (gateway.write(topic->owner(), "access", percent(56.0)).status != GatewayStatus::failed) {
    return fail("test_topic_asset_messages", "rejected publish should fail the write");
  }
  g_redis_mock = {};

  stop.request_stop();
  topic->join();
  return 0;
}

int test_system_serves_sampled_asset() {
  const std::string root = make_temp_dir();
  const std::string sensor = "28-000005e2fdc3";
  if (root.empty() || mkdir((root + "/" + sensor).c_str(), 0755) != 0) {
    return fail("test_system_serves_sampled_asset", "failed creating fake device tree");
  }
  {
    std::ofstream out(root + "/" + sensor + "/w1_slave");
    out << "50 05 : crc=1d YES\n50 05 t=21312\n";
  }

  SystemConfig config{};
  config.system = "plant";
  config.http.host = "127.0.0.1";
  config.http.port = 0;
  config.http.workers = 2;
  config.request_timeout = 1000ms;
  AssetConfig thermometer{};
  thermometer.name = sensor;
  thermometer.kind = "w1_thermometer";
  thermometer.traits = {{"deviceRoot", root}, {"samplingPeriod", 0.05}};
  config.assets.push_back(thermometer);

  asset_agent::core::System system(config);
  system.start();
  if (system.http_port() == 0 || system.registry().size() != 1) {
    return fail("test_system_serves_sampled_asset", "system should serve its registry");
  }

  HttpServiceClient client(
      "http://127.0.0.1:" + std::to_string(system.http_port()) + "/plant/" + sensor + "/temperature", 1000ms);
  bool sampled = false;
  for (int attempt = 0; attempt < 40 && !sampled; ++attempt) {
    Signal signal{};
    std::string error;
    sampled = client.get_state(signal, error, std::stop_token{}) && almost_equal(signal.value, 21.312) && signal.unit == "Celsius";
    if (!sampled) {
      std::this_thread::sleep_for(50ms);
    }
  }
  system.stop();
  if (!sampled) {
    return fail("test_system_serves_sampled_asset", "sampled temperature should be served over HTTP");
  }

  // "a/b" resolves to the same asset name as "a_b".
  SystemConfig clash{};
  clash.system = "plant";
  AssetConfig topic{};
  topic.name = "a/b";
  topic.kind = "topic";
  topic.traits = {{"broker", "127.0.0.1:6379"}};
  AssetConfig twin = thermometer;
  twin.name = "a_b";
  clash.assets = {topic, twin};
  if (!throws_runtime_error([&clash] { asset_agent::core::System duplicate(clash); })) {
    return fail("test_system_serves_sampled_asset", "clashing asset names should be rejected");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_config_parsing(); rc != 0) return rc;
  if (int rc = test_redis_address_parsing(); rc != 0) return rc;
  if (int rc = test_factory_builds_assets(); rc != 0) return rc;
  if (int rc = test_router_statuses(); rc != 0) return rc;
  if (int rc = test_http_loopback(); rc != 0) return rc;
  if (int rc = test_http_server_survives_bad_input(); rc != 0) return rc;
  if (int rc = test_http_client_observes_stop(); rc != 0) return rc;
  if (int rc = test_redis_ts_sink_writes(); rc != 0) return rc;
  if (int rc = test_historian_queue_and_batches(); rc != 0) return rc;
  if (int rc = test_topic_asset_messages(); rc != 0) return rc;
  if (int rc = test_system_serves_sampled_asset(); rc != 0) return rc;

  std::cout << "[PASS] system unit tests\n";
  return 0;
}
