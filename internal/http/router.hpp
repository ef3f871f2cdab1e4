#pragma once

#include <boost/beast/http.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace nove::http {

namespace beast_http = boost::beast::http;

using Request  = beast_http::request<beast_http::string_body>;
using Response = beast_http::response<beast_http::string_body>;

// Values of the {name} segments of the matched pattern, percent-decoded.
using PathParams = std::unordered_map<std::string, std::string>;

using Handler = std::function<Response(const Request&, const PathParams&)>;

struct Route {
  beast_http::verb         method;
  std::string              pattern; // e.g. /api/license/{key}/activations
  std::string              name;    // stable label for logs and metrics
  bool                     admin = false;
  Handler                  handler;
  std::vector<std::string> segments;
};

/*
  Method + path dispatch table.

  Patterns are matched segment by segment in registration order; a
  {name} segment matches any single non-empty segment. The query
  string is ignored.
*/
class Router {
 public:
  enum class MatchKind {
    kFound,
    kNotFound,
    kMethodNotAllowed,
  };

  struct Match {
    MatchKind                      kind  = MatchKind::kNotFound;
    const Route*                   route = nullptr;
    PathParams                     params;
    std::vector<beast_http::verb> allowed; // set for kMethodNotAllowed
  };

  void Add(beast_http::verb method, std::string pattern, std::string name, Handler handler, bool admin = false);

  Match Resolve(beast_http::verb method, std::string_view target) const;

 private:
  std::vector<Route> routes_;
};

// Path component of a request target, without the query string.
std::string_view PathOf(std::string_view target);

// %XX decoding; '+' is left alone and invalid escapes are kept verbatim.
std::string PercentDecode(std::string_view text);

std::vector<std::string> SplitPath(std::string_view path);

} // namespace nove::http
