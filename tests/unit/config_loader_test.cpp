#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

std::filesystem::path BaseDir() {
  const auto base_dir = std::filesystem::temp_directory_path() / "workstream_config_loader_tests";
  std::filesystem::create_directories(base_dir);
  return base_dir;
}

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto    file_path = BaseDir() / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestDefaultsAreDerivedFromProjectRoot() {
  const auto root = BaseDir() / "acme";
  std::filesystem::create_directories(root);

  const auto yaml_path = WriteYaml("defaults", "project:\n  root: \"" + root.string() + "\"\nlock:\n  cache_root: /tmp/ws-cache\n");

  const auto canonical = std::filesystem::weakly_canonical(root);

  auto config = workstream::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.project().root() == canonical.string());
  assert(config.project().name() == "acme");
  assert(config.project().worktree_root() == (canonical.parent_path() / "acme-worktrees").string());
  assert(config.project().base_branch() == "main");
  assert(config.server().bind_host() == "127.0.0.1");
  assert(config.server().default_port() == 3001);
  assert(config.server().port_scan_attempts() == 10);
  assert(config.server().health_path() == "/api/health");
  assert(config.server().health_timeout_ms() == 2000);
  assert(config.server().request_timeout_ms() == 10000);
  assert(config.database().sqlite().path() == "/tmp/ws-cache/projects/acme/streams.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.database().sqlite().busy_timeout_ms() == 5000);
  assert(config.logging().level() == "info");
  assert(config.logging().console() == "stdout");
  assert(config.scan().interval_sec() == 60);
  assert(config.scan().branch_commit_limit() == 50);
  assert(config.scan().main_since() == "7 days ago");
  assert(config.retirement().history_dir() == ".project/history");
  assert(config.retirement().remote() == "origin");
  assert(config.retirement().summary_max_attempts() == 3);
}

void TestExplicitValuesArePreserved() {
  const auto yaml_path = WriteYaml("explicit",
                                   R"(project:
  root: /srv/repo
  name: dashboard
  worktree_root: /srv/wt
  base_branch: trunk
server:
  port: 4100
  health_path: /healthz
database:
  sqlite:
    path: "/tmp/ws/\"quoted\".db"
    wal_mode: false
scan:
  interval_sec: 0
  main_since: "2 weeks ago"
)");

  auto config = workstream::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.project().name() == "dashboard");
  assert(config.project().worktree_root() == "/srv/wt");
  assert(config.project().base_branch() == "trunk");
  assert(config.server().port() == 4100);
  assert(config.server().health_path() == "/healthz");
  assert(config.database().sqlite().path() == "/tmp/ws/\"quoted\".db");
  assert(!config.database().sqlite().wal_mode());
  assert(config.scan().has_interval_sec() && config.scan().interval_sec() == 0);
  assert(config.scan().main_since() == "2 weeks ago");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(project:
  root: /srv/repo
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)workstream::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingProjectRootIsRejected() {
  const auto yaml_path = WriteYaml("missing_root", "server:\n  default_port: 3001\n");

  bool threw = false;
  try {
    (void)workstream::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const workstream::util::InvalidArgument& e) {
    threw = e.field() == "project.root";
  }
  assert(threw);
}

void TestHealthPathMustBeAbsolute() {
  const auto yaml_path = WriteYaml("relative_health", "project:\n  root: /srv/repo\nserver:\n  health_path: api/health\n");

  bool threw = false;
  try {
    (void)workstream::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const workstream::util::InvalidArgument& e) {
    threw = e.field() == "server.health_path";
  }
  assert(threw);
}

void TestEmptyFileNeedsProjectRoot() {
  const auto yaml_path = WriteYaml("empty", "");

  bool threw = false;
  try {
    (void)workstream::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const workstream::util::InvalidArgument& e) {
    threw = e.field() == "project.root";
  }
  assert(threw);
}

void TestLoggingConsoleIsChecked() {
  const auto yaml_path = WriteYaml("bad_console", "project:\n  root: /srv/repo\nlogging:\n  console: syslog\n");

  bool threw = false;
  try {
    (void)workstream::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const workstream::util::InvalidArgument& e) {
    threw = e.field() == "logging.console";
  }
  assert(threw);
}

void TestForProjectRootResolvesEverything() {
  auto config = workstream::config::ConfigLoader::ForProjectRoot("/srv/projects/portal");
  assert(config.project().root() == "/srv/projects/portal");
  assert(config.project().name() == "portal");
  assert(config.project().worktree_root() == "/srv/projects/portal-worktrees");
  assert(!config.lock().cache_root().empty());
  assert(!config.database().sqlite().path().empty());
}

} // namespace

int main() {
  TestDefaultsAreDerivedFromProjectRoot();
  TestExplicitValuesArePreserved();
  TestUnknownFieldsAreRejected();
  TestMissingProjectRootIsRejected();
  TestHealthPathMustBeAbsolute();
  TestEmptyFileNeedsProjectRoot();
  TestLoggingConsoleIsChecked();
  TestForProjectRootResolvesEverything();

  std::cout << "workstream_unit_config_loader: pass\n";
  return 0;
}
