#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace workstream::service {

// Runs one service call with timing and failure logging. Exceptions propagate.
template <typename Fn>
auto ObserveCall(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      WORKSTREAM_LOG_DEBUG("call finished", {observability::StringField("route", route), observability::IntField("elapsed_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      WORKSTREAM_LOG_DEBUG("call finished", {observability::StringField("route", route), observability::IntField("elapsed_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    // caller mistakes are logged quieter than failures
    if (dynamic_cast<const util::ClientError*>(&ex) != nullptr) {
      WORKSTREAM_LOG_WARN("call rejected", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    } else {
      WORKSTREAM_LOG_ERROR("call failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                           observability::IntField("elapsed_ms", elapsed_ms())});
    }
    throw;
  }
}

} // namespace workstream::service
