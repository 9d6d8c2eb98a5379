#include "http_error.hpp"

#include "internal/util/errors.hpp"

namespace workstream::http {

unsigned ToHttpStatus(const std::exception& e) {
  using namespace workstream::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return 404;
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return 409;
  }
  // InvalidArgument, InvalidState
  if (dynamic_cast<const ClientError*>(&e)) {
    return 400;
  }
  if (dynamic_cast<const ResourceExhausted*>(&e)) {
    return 503;
  }

  return 500;
}

workstream::v1::ErrorResponse ToErrorBody(const std::exception& e) {
  workstream::v1::ErrorResponse body;
  if (ToHttpStatus(e) >= 500) {
    body.set_error("Internal server error");
    body.set_details(e.what());
  } else {
    body.set_error(e.what());
  }
  return body;
}

} // namespace workstream::http
