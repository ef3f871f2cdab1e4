#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace nove::util {

/*
  Central error types.

  These get translated later to HTTP status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateTrial : public std::runtime_error {
 public:
  explicit DuplicateTrial(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unauthorized : public std::runtime_error {
 public:
  explicit Unauthorized(const std::string& msg) : std::runtime_error(msg) {
  }
};

enum class ForbiddenReason {
  kRevoked,
  kExpired,
  kLimitReached,
};

/*
  Activation refused by the license state machine.

  valid_until is filled for kExpired, server_limit for kLimitReached.
*/
class Forbidden : public std::runtime_error {
 public:
  Forbidden(ForbiddenReason reason, const std::string& msg, std::string valid_until = {}, std::uint32_t server_limit = 0)
      : std::runtime_error(msg), reason_(reason), valid_until_(std::move(valid_until)), server_limit_(server_limit) {
  }

  ForbiddenReason reason() const {
    return reason_;
  }
  const std::string& valid_until() const {
    return valid_until_;
  }
  std::uint32_t server_limit() const {
    return server_limit_;
  }

 private:
  ForbiddenReason reason_;
  std::string     valid_until_;
  std::uint32_t   server_limit_;
};

inline std::string_view ToString(ForbiddenReason reason) {
  switch (reason) {
    case ForbiddenReason::kRevoked:
      return "revoked";
    case ForbiddenReason::kExpired:
      return "expired";
    case ForbiddenReason::kLimitReached:
      return "limit_reached";
  }
  return "forbidden";
}

} // namespace nove::util
