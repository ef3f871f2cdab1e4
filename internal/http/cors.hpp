#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "router.hpp"

namespace nove::http {

/*
  Origin allowlist for browser callers.

  Entries are exact origins, "*" (any origin), or a pattern with one
  '*' standing for a single host label run, e.g. https://*.netlify.app.
  Allowed methods are GET, POST and DELETE; any request header is
  accepted.
*/
class CorsPolicy {
 public:
  explicit CorsPolicy(std::vector<std::string> allowed_origins);

  bool IsOriginAllowed(std::string_view origin) const;

  // True for OPTIONS requests carrying Access-Control-Request-Method.
  static bool IsPreflight(const Request& request);

  // 200 with the CORS headers, or 400 when the origin or method is refused.
  Response Preflight(const Request& request) const;

  // Adds Access-Control-Allow-Origin to a normal response when the origin is allowed.
  void Apply(const Request& request, Response& response) const;

  static bool MatchOrigin(std::string_view pattern, std::string_view origin);

 private:
  std::vector<std::string> allowed_origins_;
};

} // namespace nove::http
