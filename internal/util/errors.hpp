#pragma once

#include <stdexcept>
#include <string>

namespace workstream::util {

/*
  Exceptions raised by the ledger and services.

  ClientError covers requests that name a missing stream, collide with an
  existing one or carry bad input; http/http_error maps each type to a
  status code.
*/
class ClientError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class NotFound : public ClientError {
 public:
  using ClientError::ClientError;
};

// Stream id already in the ledger.
class AlreadyExists : public ClientError {
 public:
  using ClientError::ClientError;
};

// Out-of-range or unrecognized input; carries the offending field name.
class InvalidArgument : public ClientError {
 public:
  InvalidArgument(std::string field, const std::string& msg) : ClientError(msg), field_(std::move(field)) {
  }

  const std::string& field() const {
    return field_;
  }

 private:
  std::string field_;
};

// Operation not allowed from the stream's current status.
class InvalidState : public ClientError {
 public:
  using ClientError::ClientError;
};

// No free port, or the ledger stayed locked past its busy timeout.
class ResourceExhausted : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

} // namespace workstream::util
