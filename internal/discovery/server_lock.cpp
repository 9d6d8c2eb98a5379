#include "server_lock.hpp"

#include <google/protobuf/util/json_util.h>
#include <signal.h>
#include <unistd.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace workstream::discovery {

namespace fs    = std::filesystem;
namespace beast = boost::beast;
namespace http  = boost::beast::http;
using tcp       = boost::asio::ip::tcp;

std::string LockFilePath(const std::string& cache_root, const std::string& project_name) {
  return (fs::path(cache_root) / "projects" / project_name / ".api-server.lock").string();
}

std::optional<workstream::v1::ServerLock> ReadLockFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) return std::nullopt;

  std::stringstream buffer;
  buffer << in.rdbuf();

  workstream::v1::ServerLock lock;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(buffer.str(), &lock, options);
  if (!status.ok()) {
    WORKSTREAM_LOG_WARN("ignoring unreadable lock file", {observability::StringField("path", path),
                                                          observability::StringField("error", std::string(status.message()))});
    return std::nullopt;
  }
  if (lock.pid() <= 0 || lock.port() == 0 || lock.port() > 65535) {
    return std::nullopt;
  }
  return lock;
}

void WriteLockFile(const std::string& path, const workstream::v1::ServerLock& lock) {
  const fs::path target(path);
  fs::create_directories(target.parent_path());

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(lock, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize lock file: " + std::string(status.message()));
  }

  const fs::path tmp = target.string() + ".tmp." + std::to_string(::getpid());
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open lock file for writing: " + tmp.string());
    out << json;
    out.flush();
    if (!out) throw std::runtime_error("Failed to write lock file: " + tmp.string());
  }

  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw std::runtime_error("Failed to install lock file " + path + ": " + ec.message());
  }
}

bool RemoveLockFile(const std::string& path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    WORKSTREAM_LOG_WARN("failed to remove lock file", {observability::StringField("path", path), observability::StringField("error", ec.message())});
    return false;
  }
  return true;
}

bool IsProcessAlive(int pid) {
  if (pid <= 0) return false;
  if (::kill(static_cast<pid_t>(pid), 0) == 0) return true;
  return errno == EPERM;
}

bool ProbeHealth(const std::string& host, uint16_t port, const std::string& path, std::chrono::milliseconds timeout) {
  boost::asio::io_context ioc;
  beast::tcp_stream       stream(ioc);
  beast::error_code       ec;

  tcp::resolver resolver(ioc);
  auto          endpoints = resolver.resolve(host, std::to_string(port), ec);
  if (ec) return false;

  http::request<http::empty_body> req{http::verb::get, path, 11};
  req.set(http::field::host, host);
  req.set(http::field::user_agent, "workstream-discovery");

  beast::flat_buffer                buffer;
  http::response<http::string_body> res;
  bool                              healthy = false;

  stream.expires_after(timeout);
  stream.async_connect(endpoints, [&](beast::error_code connect_ec, const tcp::endpoint&) {
    if (connect_ec) return;
    http::async_write(stream, req, [&](beast::error_code write_ec, std::size_t) {
      if (write_ec) return;
      http::async_read(stream, buffer, res, [&](beast::error_code read_ec, std::size_t) {
        healthy = !read_ec && res.result() == http::status::ok;
      });
    });
  });

  ioc.run();

  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  return healthy;
}

bool IsPortAvailable(const std::string& host, uint16_t port) {
  boost::asio::io_context ioc;
  beast::error_code       ec;

  auto address = boost::asio::ip::make_address(host, ec);
  if (ec) return false;

  tcp::acceptor acceptor(ioc);
  const tcp::endpoint ep{address, port};
  acceptor.open(ep.protocol(), ec);
  if (ec) return false;
  acceptor.set_option(boost::asio::socket_base::reuse_address(true), ec);
  acceptor.bind(ep, ec);
  if (ec) return false;
  acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
  const bool available = !ec;
  acceptor.close(ec);
  return available;
}

uint16_t FindAvailablePort(const std::string& host, uint16_t start, int attempts) {
  for (int i = 0; i < attempts; ++i) {
    const int candidate = static_cast<int>(start) + i;
    if (candidate > 65535) break;
    if (IsPortAvailable(host, static_cast<uint16_t>(candidate))) {
      return static_cast<uint16_t>(candidate);
    }
  }
  throw util::ResourceExhausted("No available ports found in range " + std::to_string(start) + "-" +
                                std::to_string(static_cast<int>(start) + attempts - 1));
}

// ------------------------------------------------------------
// ServerLockGuard
// ------------------------------------------------------------

ServerLockGuard::ServerLockGuard(std::string path, workstream::v1::ServerLock lock) : path_(std::move(path)), lock_(std::move(lock)) {
  WriteLockFile(path_, lock_);
  WORKSTREAM_LOG_INFO("server lock acquired", {observability::StringField("path", path_), observability::IntField("port", lock_.port())});
}

ServerLockGuard::~ServerLockGuard() {
  Release();
}

void ServerLockGuard::Release() {
  if (released_) return;
  released_ = true;

  auto current = ReadLockFile(path_);
  if (current && current->pid() != lock_.pid()) {
    WORKSTREAM_LOG_WARN("lock file owned by another process, leaving it", {observability::IntField("owner_pid", current->pid())});
    return;
  }
  if (RemoveLockFile(path_)) {
    WORKSTREAM_LOG_INFO("server lock released", {observability::StringField("path", path_)});
  }
}

} // namespace workstream::discovery
