#include "cors.hpp"

#include <algorithm>

namespace nove::http {

namespace {

constexpr const char* kAllowedMethods = "GET, POST, DELETE";
constexpr const char* kMaxAgeSeconds  = "600";

bool IsAllowedMethod(std::string_view method) {
  return method == "GET" || method == "POST" || method == "DELETE";
}

} // namespace

CorsPolicy::CorsPolicy(std::vector<std::string> allowed_origins) : allowed_origins_(std::move(allowed_origins)) {
}

bool CorsPolicy::MatchOrigin(std::string_view pattern, std::string_view origin) {
  if (pattern == "*") return true;

  const auto star = pattern.find('*');
  if (star == std::string_view::npos) return pattern == origin;

  const auto prefix = pattern.substr(0, star);
  const auto suffix = pattern.substr(star + 1);
  if (origin.size() <= prefix.size() + suffix.size()) return false;
  if (origin.substr(0, prefix.size()) != prefix) return false;
  if (origin.substr(origin.size() - suffix.size()) != suffix) return false;

  const auto middle = origin.substr(prefix.size(), origin.size() - prefix.size() - suffix.size());
  return middle.find_first_of("/:") == std::string_view::npos;
}

bool CorsPolicy::IsOriginAllowed(std::string_view origin) const {
  if (origin.empty()) return false;
  return std::any_of(allowed_origins_.begin(), allowed_origins_.end(),
                     [&](const std::string& pattern) { return MatchOrigin(pattern, origin); });
}

bool CorsPolicy::IsPreflight(const Request& request) {
  return request.method() == beast_http::verb::options && request.find(beast_http::field::origin) != request.end() &&
         request.find(beast_http::field::access_control_request_method) != request.end();
}

Response CorsPolicy::Preflight(const Request& request) const {
  const auto origin = request[beast_http::field::origin];
  const auto method = request[beast_http::field::access_control_request_method];

  Response response{beast_http::status::ok, request.version()};
  response.set(beast_http::field::vary, "Origin");
  response.set(beast_http::field::content_type, "text/plain; charset=utf-8");

  const bool origin_ok = IsOriginAllowed(std::string_view(origin.data(), origin.size()));
  const bool method_ok = IsAllowedMethod(std::string_view(method.data(), method.size()));
  if (!origin_ok || !method_ok) {
    response.result(beast_http::status::bad_request);
    response.body() = !origin_ok ? "Disallowed CORS origin" : "Disallowed CORS method";
    response.prepare_payload();
    return response;
  }

  response.set(beast_http::field::access_control_allow_origin, origin);
  response.set(beast_http::field::access_control_allow_methods, kAllowedMethods);
  const auto requested_headers = request[beast_http::field::access_control_request_headers];
  if (!requested_headers.empty()) {
    response.set(beast_http::field::access_control_allow_headers, requested_headers);
  }
  response.set(beast_http::field::access_control_max_age, kMaxAgeSeconds);
  response.body() = "OK";
  response.prepare_payload();
  return response;
}

void CorsPolicy::Apply(const Request& request, Response& response) const {
  const auto origin = request[beast_http::field::origin];
  if (origin.empty()) return;

  response.set(beast_http::field::vary, "Origin");
  if (IsOriginAllowed(std::string_view(origin.data(), origin.size()))) {
    response.set(beast_http::field::access_control_allow_origin, origin);
  }
}

} // namespace nove::http
