#pragma once

#include <string_view>
#include <type_traits>

#include "internal/observability/spans.hpp"

namespace nove::service {

// Runs fn inside a span named after the operation; exceptions are recorded and rethrown.
template <typename Fn>
auto ObserveCall(std::string_view operation, Fn&& fn) {
  observability::SpanScope span(operation);
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    throw;
  }
}

} // namespace nove::service
