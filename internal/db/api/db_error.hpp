#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace workstream::db {

// Raises the util exception matching a failed ledger write; a locked
// database surfaces as ResourceExhausted so callers may retry.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context;
  if (!result.message.empty()) message += ": " + result.message;

  switch (result.code) {
    case ErrorCode::kDuplicate:
      throw util::AlreadyExists(message);
    case ErrorCode::kNotFound:
      throw util::NotFound(message);
    case ErrorCode::kBusy:
      throw util::ResourceExhausted(message);
    default:
      throw std::runtime_error(message + " (" + std::string(ErrorCodeName(result.code)) + ")");
  }
}

} // namespace workstream::db
