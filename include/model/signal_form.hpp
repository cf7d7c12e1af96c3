#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "model/signal.hpp"

namespace asset_agent::model {

constexpr const char* kSignalFormVersion = "SignalA_v1.0";
constexpr const char* kSignalMediaType = "application/json";

nlohmann::json to_form(const Signal& signal);

// Throws std::invalid_argument when the form has no finite numeric value or a malformed timestamp.
Signal from_form(const nlohmann::json& form);

std::string encode_signal(const Signal& signal);
Signal decode_signal(std::string_view body);

// Accepts a signal form or a bare number; a bare number takes default_unit and the current time.
bool decode_payload(std::string_view payload, const std::string& default_unit, Signal& signal) noexcept;

std::string format_rfc3339(std::chrono::system_clock::time_point timestamp);
std::chrono::system_clock::time_point parse_rfc3339(const std::string& text);

}  // namespace asset_agent::model
