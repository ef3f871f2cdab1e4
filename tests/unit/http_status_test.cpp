#include <cassert>

#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/http/http_error.hpp"
#include "internal/http/router.hpp"
#include "internal/util/errors.hpp"

namespace {

using nove::http::beast_http::status;
using nove::http::ToErrorResponse;
using nove::http::ToHttpStatus;

void TestStatusMapping() {
  assert(ToHttpStatus(nove::util::ValidationError("bad")) == status::bad_request);
  assert(ToHttpStatus(nove::util::Unauthorized("no")) == status::unauthorized);
  assert(ToHttpStatus(nove::util::Forbidden(nove::util::ForbiddenReason::kRevoked, "revoked")) == status::forbidden);
  assert(ToHttpStatus(nove::util::NotFound("missing")) == status::not_found);
  assert(ToHttpStatus(nove::util::Conflict("again")) == status::conflict);
  assert(ToHttpStatus(nove::util::DuplicateTrial("dup")) == status::conflict);
  assert(ToHttpStatus(std::runtime_error("db down")) == status::internal_server_error);
  assert(ToHttpStatus(std::logic_error("bug")) == status::internal_server_error);
}

void TestForbiddenCarriesDetails() {
  auto expired = ToErrorResponse(nove::util::Forbidden(nove::util::ForbiddenReason::kExpired, "expired!", "2025-03-31"));
  assert(expired.detail() == "expired!");
  assert(expired.reason() == "expired");
  assert(expired.valid_until() == "2025-03-31");
  assert(expired.server_limit() == 0);

  auto limited = ToErrorResponse(nove::util::Forbidden(nove::util::ForbiddenReason::kLimitReached, "full", {}, 3));
  assert(limited.reason() == "limit_reached");
  assert(limited.server_limit() == 3);
  assert(nove::http::ErrorJson(limited) == R"({"detail":"full","reason":"limit_reached","server_limit":3})");

  auto revoked = ToErrorResponse(nove::util::Forbidden(nove::util::ForbiddenReason::kRevoked, "gone"));
  assert(revoked.reason() == "revoked");
}

void TestDuplicateTrialReason() {
  auto error = ToErrorResponse(nove::util::DuplicateTrial("dup"));
  assert(error.detail() == "dup");
  assert(error.reason() == "duplicate_trial");
}

void TestInternalErrorsAreNotExposed() {
  auto error = ToErrorResponse(std::runtime_error("password=hunter2 connection refused"));
  assert(error.detail() == "Internal Server Error");
  assert(error.reason().empty());
  assert(nove::http::ErrorJson(error) == R"({"detail":"Internal Server Error"})");
}

void TestPlainErrorJson() {
  auto error = ToErrorResponse(nove::util::NotFound("missing"));
  assert(nove::http::ErrorJson(error) == R"({"detail":"missing"})");
}

void TestErrorResponseFor() {
  nove::http::Request request{nove::http::beast_http::verb::get, "/x", 11};
  auto                response = nove::http::ErrorResponseFor(request, status::not_found, ToErrorResponse(nove::util::NotFound("missing")));
  assert(response.result() == status::not_found);
  assert(response[nove::http::beast_http::field::content_type] == "application/json");
  assert(response.body() == R"({"detail":"missing"})");
}

void TestPathHelpers() {
  assert(nove::http::PathOf("/api/licenses?limit=1") == "/api/licenses");
  assert(nove::http::PercentDecode("host%201") == "host 1");
  assert(nove::http::PercentDecode("bad%zzescape%") == "bad%zzescape%");
  auto segments = nove::http::SplitPath("/api/license/KEY/");
  assert(segments.size() == 3);
  assert(segments[2] == "KEY");
  assert(nove::http::SplitPath("/").empty());
}

} // namespace

int main() {
  TestStatusMapping();
  TestForbiddenCarriesDetails();
  TestDuplicateTrialReason();
  TestInternalErrorsAreNotExposed();
  TestPlainErrorJson();
  TestErrorResponseFor();
  TestPathHelpers();

  std::cout << "nove_unit_http_status: pass\n";
  return 0;
}
