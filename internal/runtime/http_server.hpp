#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "internal/http/stream_routes.hpp"

namespace workstream::runtime {

// Listener could not be set up on the requested address.
class BindError : public std::runtime_error {
 public:
  explicit BindError(const std::string& msg) : std::runtime_error(msg) {
  }
};

struct HttpServerOptions {
  // Covers reading the request and, separately, writing the response.
  std::chrono::milliseconds request_timeout{10000};
  int                       threads = 4;
};

/*
  HTTP/1.1 front of the service layer.

  Connections are async sessions on one io_context run by a fixed pool of
  threads; each serves a single request with Connection: close. A client
  that does not finish its request before request_timeout is disconnected.
  Stop() closes the acceptor and waits briefly for in-flight requests.
*/
class HttpServer {
 public:
  HttpServer(std::string host, uint16_t port, std::shared_ptr<http::StreamRoutes> routes,
             HttpServerOptions options = HttpServerOptions());
  ~HttpServer();

  HttpServer(const HttpServer&)            = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Throws BindError when the port cannot be bound.
  void Start();
  void Stop();

  // Bound port; differs from the requested one only when that was 0.
  uint16_t Port() const {
    return bound_port_;
  }

 private:
  struct SessionTracker;
  class Session;

  void DoAccept();

  std::string                          host_;
  uint16_t                             port_;
  uint16_t                             bound_port_ = 0;
  std::shared_ptr<http::StreamRoutes>  routes_;
  HttpServerOptions                    options_;
  std::shared_ptr<SessionTracker>      sessions_;
  boost::asio::io_context              ioc_;
  boost::asio::ip::tcp::acceptor       acceptor_;
  std::vector<std::thread>             threads_;
  std::atomic<bool>                    stopping_{false};
};

} // namespace workstream::runtime
