#include "router.hpp"

#include <utility>

namespace nove::http {

namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool IsParam(const std::string& segment) {
  return segment.size() > 2 && segment.front() == '{' && segment.back() == '}';
}

bool MatchSegments(const Route& route, const std::vector<std::string>& path, PathParams* params) {
  if (route.segments.size() != path.size()) return false;

  PathParams captured;
  for (std::size_t i = 0; i < path.size(); ++i) {
    const auto& expected = route.segments[i];
    if (IsParam(expected)) {
      if (path[i].empty()) return false;
      captured[expected.substr(1, expected.size() - 2)] = PercentDecode(path[i]);
    } else if (expected != path[i]) {
      return false;
    }
  }
  if (params) *params = std::move(captured);
  return true;
}

} // namespace

std::string_view PathOf(std::string_view target) {
  const auto query = target.find_first_of("?#");
  return query == std::string_view::npos ? target : target.substr(0, query);
}

std::string PercentDecode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size()) {
      const int hi = HexValue(text[i + 1]);
      const int lo = HexValue(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(text[i]);
  }
  return out;
}

std::vector<std::string> SplitPath(std::string_view path) {
  std::vector<std::string> segments;
  if (!path.empty() && path.front() == '/') path.remove_prefix(1);
  if (!path.empty() && path.back() == '/') path.remove_suffix(1);
  if (path.empty()) return segments;

  std::size_t start = 0;
  while (true) {
    const auto slash = path.find('/', start);
    segments.emplace_back(path.substr(start, slash == std::string_view::npos ? std::string_view::npos : slash - start));
    if (slash == std::string_view::npos) break;
    start = slash + 1;
  }
  return segments;
}

void Router::Add(beast_http::verb method, std::string pattern, std::string name, Handler handler, bool admin) {
  Route route;
  route.method   = method;
  route.segments = SplitPath(pattern);
  route.pattern  = std::move(pattern);
  route.name     = std::move(name);
  route.admin    = admin;
  route.handler  = std::move(handler);
  routes_.push_back(std::move(route));
}

Router::Match Router::Resolve(beast_http::verb method, std::string_view target) const {
  const auto path = SplitPath(PathOf(target));

  Match match;
  for (const auto& route : routes_) {
    if (route.method == method) {
      if (MatchSegments(route, path, &match.params)) {
        match.kind  = MatchKind::kFound;
        match.route = &route;
        match.allowed.clear();
        return match;
      }
    } else if (MatchSegments(route, path, nullptr)) {
      match.kind = MatchKind::kMethodNotAllowed;
      match.allowed.push_back(route.method);
    }
  }
  return match;
}

} // namespace nove::http
