#include "http_server.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <condition_variable>
#include <mutex>

#include "internal/observability/logging.hpp"

namespace workstream::runtime {

namespace beast      = boost::beast;
namespace beast_http = boost::beast::http;
using tcp            = boost::asio::ip::tcp;

namespace {

constexpr auto kDrainTimeout = std::chrono::seconds(5);

} // namespace

struct HttpServer::SessionTracker {
  std::mutex              mu;
  std::condition_variable cv;
  int                     active = 0;

  void Enter() {
    std::lock_guard<std::mutex> lock(mu);
    ++active;
  }

  void Leave() {
    {
      std::lock_guard<std::mutex> lock(mu);
      --active;
    }
    cv.notify_all();
  }

  bool Drain(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu);
    return cv.wait_for(lock, timeout, [this] { return active == 0; });
  }
};

// ------------------------------------------------------------------
// One request per connection; the deadline is re-armed before the write
// ------------------------------------------------------------------

class HttpServer::Session : public std::enable_shared_from_this<HttpServer::Session> {
 public:
  Session(tcp::socket socket, std::shared_ptr<http::StreamRoutes> routes, std::shared_ptr<SessionTracker> tracker,
          std::chrono::milliseconds timeout)
      : stream_(std::move(socket)), routes_(std::move(routes)), tracker_(std::move(tracker)), timeout_(timeout) {
    tracker_->Enter();
  }

  ~Session() {
    tracker_->Leave();
  }

  void Run() {
    stream_.expires_after(timeout_);
    beast_http::async_read(stream_, buffer_, req_,
                           [self = shared_from_this()](beast::error_code ec, std::size_t) { self->OnRead(ec); });
  }

 private:
  void OnRead(beast::error_code ec) {
    if (ec == beast::error::timeout) {
      WORKSTREAM_LOG_DEBUG("http request timed out", {observability::IntField("timeout_ms", timeout_.count())});
      return;
    }
    if (ec) {
      WORKSTREAM_LOG_DEBUG("http read error", {observability::StringField("error", ec.message())});
      return;
    }

    res_.version(req_.version());
    res_.set(beast_http::field::server, "workstream");
    res_.set(beast_http::field::access_control_allow_origin, "*");

    if (req_.method() == beast_http::verb::options) {
      res_.result(beast_http::status::no_content);
      res_.set(beast_http::field::access_control_allow_methods, "GET, POST, PATCH, OPTIONS");
      res_.set(beast_http::field::access_control_allow_headers, "Content-Type");
    } else {
      try {
        auto result = routes_->Handle(std::string(req_.method_string()), std::string(req_.target()), req_.body());
        res_.result(static_cast<beast_http::status>(result.status));
        res_.set(beast_http::field::content_type, "application/json");
        res_.body() = std::move(result.body);
      } catch (const std::exception& e) {
        WORKSTREAM_LOG_ERROR("http session failed", {observability::StringField("error", e.what())});
        res_.result(beast_http::status::internal_server_error);
        res_.set(beast_http::field::content_type, "application/json");
        res_.body() = R"({"error":"Internal server error"})";
      }
    }

    res_.keep_alive(false);
    res_.prepare_payload();

    stream_.expires_after(timeout_);
    beast_http::async_write(stream_, res_, [self = shared_from_this()](beast::error_code write_ec, std::size_t) {
      self->OnWrite(write_ec);
    });
  }

  void OnWrite(beast::error_code ec) {
    if (ec) {
      WORKSTREAM_LOG_DEBUG("http write error", {observability::StringField("error", ec.message())});
    }
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream                             stream_;
  beast::flat_buffer                            buffer_;
  beast_http::request<beast_http::string_body>  req_;
  beast_http::response<beast_http::string_body> res_;
  std::shared_ptr<http::StreamRoutes>           routes_;
  std::shared_ptr<SessionTracker>               tracker_;
  std::chrono::milliseconds                     timeout_;
};

// ------------------------------------------------------------------

HttpServer::HttpServer(std::string host, uint16_t port, std::shared_ptr<http::StreamRoutes> routes, HttpServerOptions options)
    : host_(std::move(host)),
      port_(port),
      routes_(std::move(routes)),
      options_(options),
      sessions_(std::make_shared<SessionTracker>()),
      acceptor_(boost::asio::make_strand(ioc_)) {
  if (options_.threads < 1) options_.threads = 1;
}

HttpServer::~HttpServer() {
  Stop();
}

void HttpServer::Start() {
  beast::error_code   ec;
  const auto          address = boost::asio::ip::make_address(host_, ec);
  if (ec) throw BindError("invalid bind address " + host_ + ": " + ec.message());
  const tcp::endpoint ep{address, port_};

  acceptor_.open(ep.protocol(), ec);
  if (ec) throw BindError("acceptor open failed: " + ec.message());
  acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
  acceptor_.bind(ep, ec);
  if (ec) {
    acceptor_.close(ec);
    throw BindError("bind " + host_ + ":" + std::to_string(port_) + " failed: " + ec.message());
  }
  acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec) {
    acceptor_.close(ec);
    throw BindError("listen failed: " + ec.message());
  }
  bound_port_ = acceptor_.local_endpoint().port();

  DoAccept();
  for (int i = 0; i < options_.threads; ++i) {
    threads_.emplace_back([this] { ioc_.run(); });
  }

  WORKSTREAM_LOG_INFO("http server listening", {observability::StringField("host", host_), observability::IntField("port", bound_port_),
                                                observability::IntField("threads", options_.threads)});
}

void HttpServer::DoAccept() {
  // each connection gets its own strand so its handlers never run concurrently
  acceptor_.async_accept(boost::asio::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
    if (ec) {
      if (stopping_.load() || !acceptor_.is_open()) return;
      WORKSTREAM_LOG_WARN("accept error", {observability::StringField("error", ec.message())});
      DoAccept();
      return;
    }

    std::make_shared<Session>(std::move(socket), routes_, sessions_, options_.request_timeout)->Run();
    DoAccept();
  });
}

void HttpServer::Stop() {
  if (stopping_.exchange(true)) return;

  boost::asio::post(acceptor_.get_executor(), [this] {
    beast::error_code ec;
    acceptor_.close(ec);
  });

  if (!sessions_->Drain(kDrainTimeout)) {
    WORKSTREAM_LOG_WARN("http sessions still running at shutdown");
  }
  ioc_.stop();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();

  WORKSTREAM_LOG_INFO("http server stopped");
}

} // namespace workstream::runtime
