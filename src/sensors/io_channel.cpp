#include "sensors/io_channel.hpp"

#include <cctype>
#include <charconv>
#include <utility>

#include "sensors/process.hpp"

namespace asset_agent::sensors {

IoChannelInput::IoChannelInput(IoChannelOptions options) : options_(std::move(options)) {}

bool IoChannelInput::read(double& raw) noexcept {
  ProcessResult result{};
  try {
    if (!run_process({options_.tool, "-1", "-q", "-r", options_.address}, options_.timeout, result)) {
      return false;
    }
  } catch (const std::bad_alloc&) {
    return false;
  }
  if (result.timed_out || result.exit_code != 0) {
    return false;
  }

  const std::string& text = result.output;
  std::size_t begin = 0;
  while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  std::size_t end = text.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }

  long long counts = 0;
  const auto parsed = std::from_chars(text.data() + begin, text.data() + end, counts);
  if (parsed.ec != std::errc{} || parsed.ptr != text.data() + end || begin == end) {
    return false;
  }
  raw = static_cast<double>(counts);
  return true;
}

const IoChannelOptions& IoChannelInput::options() const noexcept { return options_; }

}  // namespace asset_agent::sensors
