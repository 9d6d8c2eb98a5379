#pragma once

#include <exception>
#include <string>

#include "workstream/v1.hpp"

namespace workstream::http {

/*
  Converts internal exceptions into HTTP status codes and error bodies.
*/

unsigned ToHttpStatus(const std::exception& e);

// 4xx: {"error": what}. 5xx: {"error": "Internal server error", "details": what}.
workstream::v1::ErrorResponse ToErrorBody(const std::exception& e);

} // namespace workstream::http
