#include "model/signal_form.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace asset_agent::model {
namespace {

bool read_digits(const std::string& text, std::size_t& pos, const std::size_t count, int& value) {
  if (pos + count > text.size()) {
    return false;
  }
  value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const char c = text[pos + i];
    if (c < '0' || c > '9') {
      return false;
    }
    value = (value * 10) + (c - '0');
  }
  pos += count;
  return true;
}

bool expect(const std::string& text, std::size_t& pos, const char expected) {
  if (pos >= text.size() || text[pos] != expected) {
    return false;
  }
  ++pos;
  return true;
}

[[noreturn]] void bad_timestamp(const std::string& text) {
  throw std::invalid_argument("malformed RFC3339 timestamp: " + text);
}

}  // namespace

nlohmann::json to_form(const Signal& signal) {
  return nlohmann::json{
      {"value", std::isfinite(signal.value) ? signal.value : 0.0},
      {"unit", signal.unit},
      {"timestamp", format_rfc3339(signal.timestamp)},
      {"version", kSignalFormVersion},
  };
}

Signal from_form(const nlohmann::json& form) {
  if (!form.is_object()) {
    throw std::invalid_argument("signal form must be an object");
  }

  const auto value = form.find("value");
  if (value == form.end() || !value->is_number()) {
    throw std::invalid_argument("signal form requires a numeric value");
  }

  Signal signal{};
  signal.value = value->get<double>();
  if (!std::isfinite(signal.value)) {
    throw std::invalid_argument("signal value must be finite");
  }

  const auto unit = form.find("unit");
  if (unit != form.end() && !unit->is_null()) {
    if (!unit->is_string()) {
      throw std::invalid_argument("signal unit must be a string");
    }
    signal.unit = unit->get<std::string>();
  }

  const auto timestamp = form.find("timestamp");
  if (timestamp != form.end() && !timestamp->is_null()) {
    if (!timestamp->is_string()) {
      throw std::invalid_argument("signal timestamp must be a string");
    }
    signal.timestamp = parse_rfc3339(timestamp->get<std::string>());
  } else {
    signal.timestamp = std::chrono::system_clock::now();
  }

  return signal;
}

std::string encode_signal(const Signal& signal) { return to_form(signal).dump(); }

Signal decode_signal(const std::string_view body) {
  nlohmann::json form;
  try {
    form = nlohmann::json::parse(body.begin(), body.end());
  } catch (const nlohmann::json::parse_error& ex) {
    throw std::invalid_argument(std::string("signal form is not valid JSON: ") + ex.what());
  }
  return from_form(form);
}

bool decode_payload(const std::string_view payload, const std::string& default_unit, Signal& signal) noexcept {
  try {
    const auto document = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
    if (document.is_discarded()) {
      return false;
    }

    if (document.is_object()) {
      signal = from_form(document);
      if (signal.unit.empty()) {
        signal.unit = default_unit;
      }
      return true;
    }

    if (document.is_number()) {
      const double value = document.get<double>();
      if (!std::isfinite(value)) {
        return false;
      }
      signal.value = value;
      signal.unit = default_unit;
      signal.timestamp = std::chrono::system_clock::now();
      return true;
    }
  } catch (const std::exception&) {
    return false;
  }
  return false;
}

std::string format_rfc3339(const std::chrono::system_clock::time_point timestamp) {
  const auto since_epoch = timestamp.time_since_epoch();
  const auto seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds).count();

  const std::time_t whole = static_cast<std::time_t>(seconds.count());
  std::tm utc{};
  gmtime_r(&whole, &utc);

  char buffer[40]{};
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
  std::string text(buffer);

  if (nanos > 0) {
    char fraction[16]{};
    std::snprintf(fraction, sizeof(fraction), ".%09lld", static_cast<long long>(nanos));
    std::string digits(fraction);
    while (digits.back() == '0') {
      digits.pop_back();
    }
    text += digits;
  }

  text.push_back('Z');
  return text;
}

std::chrono::system_clock::time_point parse_rfc3339(const std::string& text) {
  std::size_t pos = 0;
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;

  if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') || !read_digits(text, pos, 2, month) ||
      !expect(text, pos, '-') || !read_digits(text, pos, 2, day)) {
    bad_timestamp(text);
  }
  if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't')) {
    bad_timestamp(text);
  }
  ++pos;
  if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') || !read_digits(text, pos, 2, minute) ||
      !expect(text, pos, ':') || !read_digits(text, pos, 2, second)) {
    bad_timestamp(text);
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    bad_timestamp(text);
  }

  std::int64_t nanos = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    std::size_t digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 9) {
        nanos = (nanos * 10) + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      bad_timestamp(text);
    }
    for (std::size_t i = digits; i < 9; ++i) {
      nanos *= 10;
    }
  }

  std::int64_t offset_seconds = 0;
  if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
    ++pos;
  } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    const bool negative = text[pos] == '-';
    ++pos;
    int offset_hours = 0;
    int offset_minutes = 0;
    if (!read_digits(text, pos, 2, offset_hours) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, offset_minutes) || offset_hours > 23 || offset_minutes > 59) {
      bad_timestamp(text);
    }
    offset_seconds = (static_cast<std::int64_t>(offset_hours) * 3600) + (offset_minutes * 60);
    if (negative) {
      offset_seconds = -offset_seconds;
    }
  } else {
    bad_timestamp(text);
  }

  if (pos != text.size()) {
    bad_timestamp(text);
  }

  std::tm utc{};
  utc.tm_year = year - 1900;
  utc.tm_mon = month - 1;
  utc.tm_mday = day;
  utc.tm_hour = hour;
  utc.tm_min = minute;
  utc.tm_sec = second;
  const std::time_t whole = timegm(&utc);

  return std::chrono::system_clock::time_point{} + std::chrono::seconds(whole - offset_seconds) +
         std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds(nanos));
}

}  // namespace asset_agent::model
