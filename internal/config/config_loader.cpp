#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace workstream::config {

namespace fs = std::filesystem;
using workstream::runtime::config::RuntimeConfig;

namespace {

google::protobuf::Value ScalarToValue(const YAML::Node& node) {
  google::protobuf::Value value;
  const std::string&      text = node.Scalar();

  // quoted scalars stay strings ("7 days ago", "0", ...)
  if (node.Tag() == "!") {
    value.set_string_value(text);
  } else if (text == "true" || text == "false") {
    value.set_bool_value(text == "true");
  } else {
    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (!text.empty() && end != nullptr && *end == '\0') {
      value.set_number_value(number);
    } else {
      value.set_string_value(text);
    }
  }
  return value;
}

google::protobuf::Value ToValue(const YAML::Node& node) {
  google::protobuf::Value value;
  if (node.IsScalar()) {
    return ScalarToValue(node);
  }
  if (node.IsSequence()) {
    auto* items = value.mutable_list_value();
    for (const auto& item : node) {
      *items->add_values() = ToValue(item);
    }
    return value;
  }
  if (node.IsMap()) {
    auto& fields = *value.mutable_struct_value()->mutable_fields();
    for (const auto& entry : node) {
      fields[entry.first.Scalar()] = ToValue(entry.second);
    }
    return value;
  }
  if (node.IsNull()) {
    value.set_null_value(google::protobuf::NULL_VALUE);
    return value;
  }
  throw std::runtime_error("unsupported YAML node");
}

// The YAML document re-encoded as JSON so protobuf's JSON parser can map
// it onto RuntimeConfig. An empty file yields "{}".
std::string YamlFileToJson(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }
  if (root.IsNull()) return "{}";
  if (!root.IsMap()) throw std::runtime_error("Invalid configuration: " + path + " must contain a mapping");

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToValue(root), &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to convert " + path + " to JSON: " + std::string(status.message()));
  }
  return json;
}

std::string DefaultCacheRoot() {
  const char* home = std::getenv("HOME");
  if (home && *home) {
    return (fs::path(home) / ".cache" / "workstream").string();
  }
  return (fs::temp_directory_path() / "workstream-cache").string();
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(YamlFileToJson(path), &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  Resolve(config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::ForProjectRoot(const std::string& project_root) {
  RuntimeConfig config;
  config.mutable_project()->set_root(project_root);
  Resolve(config);
  Validate(config);
  return config;
}

void ConfigLoader::Resolve(RuntimeConfig& config) {
  auto* project = config.mutable_project();
  if (!project->root().empty()) {
    std::error_code ec;
    auto            absolute = fs::weakly_canonical(fs::absolute(project->root()), ec);
    if (!ec) {
      project->set_root(absolute.string());
    }
  }
  if (project->name().empty() && !project->root().empty()) {
    project->set_name(fs::path(project->root()).filename().string());
  }
  if (project->worktree_root().empty() && !project->root().empty()) {
    project->set_worktree_root((fs::path(project->root()).parent_path() / (project->name() + "-worktrees")).string());
  }
  if (project->base_branch().empty()) project->set_base_branch("main");

  auto* server = config.mutable_server();
  if (server->bind_host().empty()) server->set_bind_host("127.0.0.1");
  if (server->default_port() == 0) server->set_default_port(3001);
  if (server->port_scan_attempts() == 0) server->set_port_scan_attempts(10);
  if (server->health_path().empty()) server->set_health_path("/api/health");
  if (server->health_timeout_ms() == 0) server->set_health_timeout_ms(2000);
  if (server->bind_retries() == 0) server->set_bind_retries(3);
  if (server->request_timeout_ms() == 0) server->set_request_timeout_ms(10000);

  auto* lock = config.mutable_lock();
  if (lock->cache_root().empty()) lock->set_cache_root(DefaultCacheRoot());

  auto* sqlite = config.mutable_database()->mutable_sqlite();
  if (sqlite->path().empty() && !project->name().empty()) {
    sqlite->set_path((fs::path(lock->cache_root()) / "projects" / project->name() / "streams.db").string());
  }
  if (!sqlite->has_wal_mode()) sqlite->set_wal_mode(true);
  if (sqlite->busy_timeout_ms() == 0) sqlite->set_busy_timeout_ms(5000);

  // an explicit 0 disables the background scan
  auto* scan = config.mutable_scan();
  if (!scan->has_interval_sec()) scan->set_interval_sec(60);
  if (scan->branch_commit_limit() == 0) scan->set_branch_commit_limit(50);
  if (scan->main_commit_limit() == 0) scan->set_main_commit_limit(20);
  if (scan->main_since().empty()) scan->set_main_since("7 days ago");

  auto* retirement = config.mutable_retirement();
  if (retirement->history_dir().empty()) retirement->set_history_dir(".project/history");
  if (retirement->plan_dir().empty()) retirement->set_plan_dir(".project/plan/streams");
  if (retirement->remote().empty()) retirement->set_remote("origin");
  if (retirement->summary_max_attempts() == 0) retirement->set_summary_max_attempts(3);

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
  if (logging->console().empty()) logging->set_console("stdout");
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.project().root().empty()) {
    throw util::InvalidArgument("project.root", "Invalid configuration: project.root is required");
  }
  if (config.server().port() > 65535) {
    throw util::InvalidArgument("server.port", "Invalid configuration: server.port must be <= 65535");
  }
  if (config.server().default_port() > 65535) {
    throw util::InvalidArgument("server.default_port", "Invalid configuration: server.default_port must be <= 65535");
  }
  if (config.server().health_path().empty() || config.server().health_path().front() != '/') {
    throw util::InvalidArgument("server.health_path", "Invalid configuration: server.health_path must start with '/'");
  }
  const auto& console = config.logging().console();
  if (!console.empty() && console != "stdout" && console != "stderr") {
    throw util::InvalidArgument("logging.console", "Invalid configuration: logging.console must be stdout or stderr");
  }
  const auto& name = config.project().name();
  if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
    throw util::InvalidArgument("project.name", "Invalid configuration: project.name must be a plain directory name");
  }
}

} // namespace workstream::config
