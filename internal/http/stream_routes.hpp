#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "internal/service/admin_service.hpp"
#include "internal/service/stream_service.hpp"

namespace workstream::http {

struct RouteResponse {
  unsigned    status = 200;
  std::string body; // JSON
};

// Percent-decoded query parameters of a request target.
std::map<std::string, std::string> ParseQuery(const std::string& target);

std::string UrlDecode(const std::string& text);

/*
  Maps /api/... requests onto the stream and admin services.

  Transport-agnostic: the runtime server hands over method, target and
  body and writes back whatever comes out. Bodies are protobuf JSON with
  lowerCamelCase names. Service exceptions become error bodies here.
*/
class StreamRoutes {
 public:
  StreamRoutes(std::shared_ptr<service::StreamService> streams, std::shared_ptr<service::AdminService> admin);

  RouteResponse Handle(const std::string& method, const std::string& target, const std::string& body);

  void SetHealthPath(std::string path) {
    health_path_ = std::move(path);
  }

 private:
  RouteResponse Dispatch(const std::string& method, const std::string& path, const std::string& target, const std::string& body);

  std::shared_ptr<service::StreamService> streams_;
  std::shared_ptr<service::AdminService>  admin_;
  std::string                             health_path_ = "/api/health";
};

} // namespace workstream::http
