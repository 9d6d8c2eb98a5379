#pragma once

#include <string>
#include <string_view>

namespace workstream::db {

/*
  Outcome of a ledger write.

  Repositories fold backend status codes into ErrorCode so the ledger and
  scanner can tell a duplicate commit apart from a real storage failure.
*/
enum class ErrorCode {
  kOk = 0,
  kNotFound,
  kDuplicate, // primary key or unique index already holds the row
  kBusy,      // database locked past the busy timeout
  kConstraint,
  kStorage,   // I/O failure or corrupt file
  kInternal
};

inline std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kNotFound:
      return "not_found";
    case ErrorCode::kDuplicate:
      return "duplicate";
    case ErrorCode::kBusy:
      return "busy";
    case ErrorCode::kConstraint:
      return "constraint";
    case ErrorCode::kStorage:
      return "storage";
    case ErrorCode::kInternal:
      return "internal";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::kOk;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  bool Duplicate() const {
    return code == ErrorCode::kDuplicate;
  }

  explicit operator bool() const {
    return code == ErrorCode::kOk;
  }
};

} // namespace workstream::db
