#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace asset_agent::gateway {

namespace http = boost::beast::http;

constexpr std::size_t kMaxHeadBytes = 16 * 1024;
constexpr std::size_t kMaxBodyBytes = 64 * 1024;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

struct HttpUrl {
  std::string host{};
  std::uint16_t port{80};
  std::string path{"/"};
};

// Lower-cased media type without parameters ("Application/JSON; charset=utf-8" -> "application/json").
std::string media_type(const std::string& content_type);

bool parse_http_url(const std::string& url, HttpUrl& parsed);

HttpResponse make_response(http::status status, std::string body, const char* content_type = "application/json");

// Invalid UTF-8 in strings taken from the request is replaced, never rejected.
HttpResponse json_response(const nlohmann::json& body, http::status status = http::status::ok);
HttpResponse error_response(http::status status, const std::string& message);

}  // namespace asset_agent::gateway
