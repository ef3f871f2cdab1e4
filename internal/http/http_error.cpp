#include "http_error.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace nove::http {

beast_http::status ToHttpStatus(const std::exception& e) {
  using namespace nove::util;

  if (dynamic_cast<const ValidationError*>(&e)) {
    return beast_http::status::bad_request;
  }
  if (dynamic_cast<const Unauthorized*>(&e)) {
    return beast_http::status::unauthorized;
  }
  if (dynamic_cast<const Forbidden*>(&e)) {
    return beast_http::status::forbidden;
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return beast_http::status::not_found;
  }
  if (dynamic_cast<const Conflict*>(&e) || dynamic_cast<const DuplicateTrial*>(&e)) {
    return beast_http::status::conflict;
  }
  return beast_http::status::internal_server_error;
}

nove::v1::ErrorResponse ToErrorResponse(const std::exception& e) {
  nove::v1::ErrorResponse error;

  if (ToHttpStatus(e) == beast_http::status::internal_server_error) {
    error.set_detail("Internal Server Error");
    return error;
  }

  error.set_detail(e.what());
  if (const auto* forbidden = dynamic_cast<const util::Forbidden*>(&e)) {
    error.set_reason(std::string(util::ToString(forbidden->reason())));
    error.set_valid_until(forbidden->valid_until());
    error.set_server_limit(forbidden->server_limit());
  } else if (dynamic_cast<const util::DuplicateTrial*>(&e)) {
    error.set_reason("duplicate_trial");
  }
  return error;
}

std::string ErrorJson(const nove::v1::ErrorResponse& error) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(error, &json, options).ok()) {
    return R"({"detail":"Internal Server Error"})";
  }
  return json;
}

Response ErrorResponseFor(const Request& request, beast_http::status status, const nove::v1::ErrorResponse& error) {
  Response response{status, request.version()};
  response.set(beast_http::field::content_type, "application/json");
  response.keep_alive(request.keep_alive());
  response.body() = ErrorJson(error);
  response.prepare_payload();
  return response;
}

} // namespace nove::http
