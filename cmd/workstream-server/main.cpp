#include <unistd.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/discovery/server_discovery.hpp"
#include "internal/discovery/server_lock.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/http_server.hpp"
#include "internal/util/time.hpp"

using workstream::config::ConfigLoader;
using workstream::discovery::DiscoveryOptions;
using workstream::discovery::ServerDiscovery;
using workstream::discovery::ServerLockGuard;
using workstream::runtime::BindError;
using workstream::runtime::HttpServer;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cerr << "Usage: workstream-server <config.yaml>\n"
            << "       workstream-server --config <config.yaml>\n"
            << "       workstream-server --project-root <dir>\n";
}

int main(int argc, char** argv) {
  std::string config_path;
  std::string project_root;
  if (argc == 2 && std::string(argv[1]).rfind("--", 0) != 0) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else if (argc == 3 && std::string(argv[1]) == "--project-root") {
    project_root = argv[2];
  } else {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? ConfigLoader::ForProjectRoot(project_root) : ConfigLoader::LoadFromYaml(config_path);

    workstream::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Discover an existing server or a free port
    // ------------------------------------------------------------
    ServerDiscovery discovery(DiscoveryOptions::FromConfig(config));

    auto first = discovery.Discover();
    if (first.existing) {
      std::cout << "workstream server already running for " << config.project().name() << " on port " << first.port << " (pid "
                << first.lock->pid() << ")" << std::endl;
      workstream::observability::ShutdownLogging();
      return 0;
    }

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = workstream::factory::Build(config);

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    // ------------------------------------------------------------
    // Bind, re-running discovery when another process wins the port
    // ------------------------------------------------------------
    std::unique_ptr<HttpServer> server;
    auto                        result   = first;
    const int                   attempts = static_cast<int>(config.server().bind_retries());

    workstream::runtime::HttpServerOptions server_options;
    server_options.request_timeout = std::chrono::milliseconds(config.server().request_timeout_ms());

    for (int attempt = 1;; ++attempt) {
      server = std::make_unique<HttpServer>(config.server().bind_host(), result.port, app.routes, server_options);
      try {
        server->Start();
        break;
      } catch (const BindError& e) {
        WORKSTREAM_LOG_WARN("bind failed, rediscovering", {workstream::observability::IntField("port", result.port),
                                                           workstream::observability::IntField("attempt", attempt),
                                                           workstream::observability::StringField("error", e.what())});
        server.reset();
        if (attempt >= attempts) throw;
      }

      result = discovery.Discover();
      if (result.existing) {
        std::cout << "workstream server already running for " << config.project().name() << " on port " << result.port
                  << std::endl;
        workstream::observability::ShutdownLogging();
        return 0;
      }
    }

    {
      workstream::v1::ServerLock lock;
      lock.set_pid(static_cast<int32_t>(::getpid()));
      lock.set_port(server->Port());
      lock.set_project_root(config.project().root());
      lock.set_project_name(config.project().name());
      lock.set_started_at(workstream::util::ToIso8601(workstream::util::Now()));
      lock.set_process_version(WORKSTREAM_VERSION);

      ServerLockGuard guard(discovery.LockPath(), lock);

      if (app.scan_worker) app.scan_worker->Start();

      WORKSTREAM_LOG_INFO("workstream server started", {workstream::observability::StringField("project", config.project().name()),
                                                        workstream::observability::IntField("port", server->Port())});
      std::cout << "workstream server for " << config.project().name() << " listening on http://" << config.server().bind_host() << ":"
                << server->Port() << std::endl;

      while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

      WORKSTREAM_LOG_INFO("Shutting down workstream server");

      if (app.scan_worker) app.scan_worker->Stop();
      server->Stop();
    }

    workstream::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    WORKSTREAM_LOG_ERROR("Fatal error", {workstream::observability::StringField("error", e.what())});
    std::cerr << "workstream-server: " << e.what() << std::endl;
    workstream::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
