#pragma once

#include <exception>

#include "nove/v1.hpp"
#include "router.hpp"

namespace nove::http {

/*
  Converts internal exceptions into HTTP status codes and JSON bodies.

    util::ValidationError         400
    util::Unauthorized            401
    util::Forbidden               403 (reason, valid_until, server_limit)
    util::NotFound                404
    util::Conflict, DuplicateTrial 409
    anything else                 500 (message not exposed)
*/

beast_http::status ToHttpStatus(const std::exception& e);

nove::v1::ErrorResponse ToErrorResponse(const std::exception& e);

// Compact JSON; unset optional fields are omitted.
std::string ErrorJson(const nove::v1::ErrorResponse& error);

Response ErrorResponseFor(const Request& request, beast_http::status status, const nove::v1::ErrorResponse& error);

} // namespace nove::http
