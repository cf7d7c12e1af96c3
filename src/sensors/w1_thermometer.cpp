#include "sensors/w1_thermometer.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>

namespace asset_agent::sensors {

namespace {
constexpr std::size_t kMaxW1Bytes = 256;
}

W1Thermometer::W1Thermometer(const std::string& sensor_id, const std::string& device_root)
    : path_(device_root + "/" + sensor_id + "/w1_slave") {}

bool W1Thermometer::read(double& celsius) noexcept {
  auto file_closer = [](std::FILE* file) {
    if (file != nullptr) {
      std::fclose(file);
    }
  };
  using file_ptr = std::unique_ptr<std::FILE, decltype(file_closer)>;

  // The driver performs a fresh conversion on every open.
  file_ptr file(std::fopen(path_.c_str(), "r"), file_closer);
  if (file == nullptr) {
    return false;
  }

  char buffer[kMaxW1Bytes]{};
  const std::size_t bytes_read = std::fread(buffer, 1, sizeof(buffer) - 1, file.get());
  if (bytes_read == 0) {
    return false;
  }

  try {
    return parse_w1_slave(std::string(buffer, bytes_read), celsius);
  } catch (const std::bad_alloc&) {
    return false;
  }
}

const std::string& W1Thermometer::path() const noexcept { return path_; }

bool W1Thermometer::parse_w1_slave(const std::string& contents, double& celsius) noexcept {
  const std::size_t first_newline = contents.find('\n');
  if (first_newline == std::string::npos) {
    return false;
  }

  std::string crc_line = contents.substr(0, first_newline);
  while (!crc_line.empty() && (crc_line.back() == '\r' || crc_line.back() == ' ')) {
    crc_line.pop_back();
  }
  if (crc_line.size() >= 2 && crc_line.compare(crc_line.size() - 2, 2, "NO") == 0) {
    return false;
  }

  const std::size_t marker = contents.find("t=", first_newline + 1);
  if (marker == std::string::npos) {
    return false;
  }

  const char* begin = contents.c_str() + marker + 2;
  char* end = nullptr;
  const long long milli_c = std::strtoll(begin, &end, 10);
  if (end == begin) {
    return false;
  }

  celsius = static_cast<double>(milli_c) / 1000.0;
  return std::isfinite(celsius);
}

}  // namespace asset_agent::sensors
