#include "gateway/http.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string_view>
#include <utility>

namespace asset_agent::gateway {

std::string media_type(const std::string& content_type) {
  std::string type = content_type.substr(0, content_type.find(';'));
  const auto not_space = [](const unsigned char c) { return std::isspace(c) == 0; };
  type.erase(type.begin(), std::find_if(type.begin(), type.end(), not_space));
  type.erase(std::find_if(type.rbegin(), type.rend(), not_space).base(), type.end());
  std::transform(type.begin(), type.end(), type.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return type;
}

bool parse_http_url(const std::string& url, HttpUrl& parsed) {
  constexpr std::string_view kScheme = "http://";
  if (url.rfind(kScheme, 0) != 0) {
    return false;
  }

  const std::string rest = url.substr(kScheme.size());
  const auto slash = rest.find('/');
  const std::string authority = rest.substr(0, slash);
  parsed.path = slash == std::string::npos ? "/" : rest.substr(slash);
  if (authority.empty()) {
    return false;
  }

  const auto colon = authority.rfind(':');
  if (colon == std::string::npos) {
    parsed.host = authority;
    parsed.port = 80;
    return true;
  }

  parsed.host = authority.substr(0, colon);
  int port = 0;
  const std::string port_text = authority.substr(colon + 1);
  const auto result = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
  if (result.ec != std::errc{} || result.ptr != port_text.data() + port_text.size() || port <= 0 || port > 65535 ||
      parsed.host.empty()) {
    return false;
  }
  parsed.port = static_cast<std::uint16_t>(port);
  return true;
}

HttpResponse make_response(const http::status status, std::string body, const char* content_type) {
  HttpResponse response{status, 11};
  response.set(http::field::content_type, content_type);
  response.keep_alive(false);
  response.body() = std::move(body);
  response.prepare_payload();
  return response;
}

HttpResponse json_response(const nlohmann::json& body, const http::status status) {
  return make_response(status, body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

HttpResponse error_response(const http::status status, const std::string& message) {
  return json_response(nlohmann::json{{"error", message}}, status);
}

}  // namespace asset_agent::gateway
