#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/stream_mapping.hpp"
#include "internal/discovery/server_discovery.hpp"
#include "internal/factory.hpp"
#include "internal/jobs/summary_job_queue.hpp"
#include "internal/observability/logging.hpp"
#include "internal/reconcile/reconciliation_engine.hpp"
#include "internal/util/errors.hpp"
#include "workstream/v1.hpp"

using namespace workstream::v1;
using workstream::config::ConfigLoader;

static void Usage() {
  std::cout << "Usage:\n"
            << "  workstreamctl [--config <file> | --project-root <dir>] <command> [args]\n"
            << "\n"
            << "Commands:\n"
            << "  list [--status s] [--category c] [--priority p]\n"
            << "  show <id>\n"
            << "  add <id> <title> <branch> [--number n] [--category c] [--priority p] [--worktree path] [--blocked-by id]\n"
            << "  update <id> [--status s] [--progress n] [--phase n] [--blocked-by id]\n"
            << "  complete <id>\n"
            << "  history <id>\n"
            << "  commits [--stream id] [--limit n]\n"
            << "  scan [<id>]\n"
            << "  reconcile [--apply] [--auto-archive-stale]\n"
            << "  retire <id> [--summary text] [--keep-worktree] [--keep-plan-files]\n"
            << "  stats\n"
            << "  discover\n"
            << "  jobs [--status pending|running|done|failed]\n";
}

namespace {

const std::set<std::string> kSwitches = {"--apply", "--auto-archive-stale", "--keep-worktree", "--keep-plan-files"};

struct Args {
  std::vector<std::string>           positional;
  std::map<std::string, std::string> options;
  std::set<std::string>              switches;

  std::optional<std::string> Option(const std::string& name) const {
    auto it = options.find(name);
    if (it == options.end()) return std::nullopt;
    return it->second;
  }

  bool Has(const std::string& name) const {
    return switches.count(name) > 0;
  }
};

// Returns false on a dangling option.
bool ParseArgs(int argc, char** argv, int start, Args& args) {
  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];
    if (kSwitches.count(arg)) {
      args.switches.insert(arg);
    } else if (arg.rfind("--", 0) == 0) {
      if (i + 1 >= argc) {
        std::cerr << "missing value for " << arg << "\n";
        return false;
      }
      args.options[arg] = argv[++i];
    } else {
      args.positional.push_back(arg);
    }
  }
  return true;
}

int ParseInt(const std::string& text, const std::string& what) {
  char*      end   = nullptr;
  const long value = std::strtol(text.c_str(), &end, 10);
  if (text.empty() || *end != '\0') {
    throw workstream::util::InvalidArgument(what, "invalid " + what + ": " + text);
  }
  return static_cast<int>(value);
}

void Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("cannot render response: " + std::string(status.message()));
  }
  std::cout << json;
}

} // namespace

int main(int argc, char** argv) {
  int         next = 1;
  std::string config_path;
  std::string project_root = ".";
  while (next + 1 < argc) {
    const std::string flag = argv[next];
    if (flag == "--config") {
      config_path = argv[next + 1];
    } else if (flag == "--project-root") {
      project_root = argv[next + 1];
    } else {
      break;
    }
    next += 2;
  }

  if (next >= argc) {
    Usage();
    return 1;
  }

  const std::string cmd = argv[next];
  Args              args;
  if (!ParseArgs(argc, argv, next + 1, args)) return 1;

  try {
    auto config = config_path.empty() ? ConfigLoader::ForProjectRoot(project_root) : ConfigLoader::LoadFromYaml(config_path);
    // command output owns stdout
    config.mutable_logging()->set_console("stderr");
    if (config_path.empty()) config.mutable_logging()->set_level("warn");
    workstream::observability::InitializeLogging(config);

    // ------------------------------------------------------------

    if (cmd == "discover") {
      workstream::discovery::ServerDiscovery discovery(workstream::discovery::DiscoveryOptions::FromConfig(config));
      auto                                   result = discovery.Discover();
      if (result.existing) {
        std::cout << "running port=" << result.port << " pid=" << result.lock->pid() << " started=" << result.lock->started_at() << "\n";
      } else {
        std::cout << "none next_port=" << result.port << "\n";
      }
      return 0;
    }

    auto  app     = workstream::factory::Build(config);
    auto& streams = *app.stream_service;
    auto& admin   = *app.admin_service;

    // ------------------------------------------------------------

    if (cmd == "list") {
      ListStreamsRequest req;
      req.set_status(args.Option("--status").value_or(""));
      req.set_category(args.Option("--category").value_or(""));
      req.set_priority(args.Option("--priority").value_or(""));

      auto resp = streams.ListStreams(req);
      for (const auto& s : resp.streams()) {
        std::cout << s.id() << "\t" << s.status() << "\t" << s.progress() << "%\t" << s.branch() << "\t" << s.title();
        if (s.has_recent_activity()) std::cout << "\t(" << s.recent_activity().relative_time() << ")";
        std::cout << "\n";
      }
      std::cout << resp.count() << " stream(s)\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "show") {
      if (args.positional.size() != 1) {
        Usage();
        return 1;
      }
      Print(streams.GetStream(args.positional[0]));
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "add") {
      if (args.positional.size() != 3) {
        Usage();
        return 1;
      }

      AddStreamRequest req;
      req.set_id(args.positional[0]);
      req.set_title(args.positional[1]);
      req.set_branch(args.positional[2]);
      req.set_stream_number(args.Option("--number").value_or(""));
      req.set_category(args.Option("--category").value_or(""));
      req.set_priority(args.Option("--priority").value_or(""));
      req.set_worktree_path(args.Option("--worktree").value_or(""));
      req.set_blocked_by(args.Option("--blocked-by").value_or(""));

      Print(streams.AddStream(req));
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "update" || cmd == "complete") {
      if (args.positional.size() != 1) {
        Usage();
        return 1;
      }

      UpdateStreamRequest req;
      if (cmd == "complete") {
        req.set_status("completed");
      } else {
        if (auto v = args.Option("--status")) req.set_status(*v);
        if (auto v = args.Option("--progress")) req.set_progress(ParseInt(*v, "progress"));
        if (auto v = args.Option("--phase")) req.set_current_phase(ParseInt(*v, "phase"));
        if (auto v = args.Option("--blocked-by")) req.set_blocked_by(*v);
      }

      Print(streams.UpdateStream(args.positional[0], req));
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "history") {
      if (args.positional.size() != 1) {
        Usage();
        return 1;
      }
      for (const auto& e : streams.History(args.positional[0]).events()) {
        std::cout << e.timestamp() << "\t" << e.event_type() << "\t" << e.old_value() << " -> " << e.new_value() << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "commits") {
      ListCommitsRequest req;
      req.set_stream_id(args.Option("--stream").value_or(""));
      if (auto v = args.Option("--limit")) req.set_limit(ParseInt(*v, "limit"));

      for (const auto& c : streams.ListCommits(req).commits()) {
        std::cout << c.commit_hash().substr(0, 8) << "\t" << c.stream_id() << "\t" << c.timestamp() << "\t" << c.author() << "\t"
                  << c.message() << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "scan") {
      ScanRequest req;
      if (!args.positional.empty()) req.set_stream_id(args.positional[0]);

      auto resp = admin.ScanCommits(req);
      std::cout << "scanned=" << resp.scanned() << " added=" << resp.commits_added() << " already_present=" << resp.already_present()
                << " errors=" << resp.errors() << "\n";
      return resp.errors() == 0 ? 0 : 2;
    }

    // ------------------------------------------------------------

    if (cmd == "reconcile") {
      ReconcileRequest req;
      req.set_dry_run(!args.Has("--apply"));
      req.set_auto_archive_stale(args.Has("--auto-archive-stale"));

      auto report = admin.Reconcile(req);
      std::cout << workstream::reconcile::FormatReconciliationReport(report);
      return report.errors().empty() ? 0 : 2;
    }

    // ------------------------------------------------------------

    if (cmd == "retire") {
      if (args.positional.size() != 1) {
        Usage();
        return 1;
      }

      ArchiveStreamRequest req;
      if (auto v = args.Option("--summary")) req.set_summary(*v);
      req.set_delete_worktree(!args.Has("--keep-worktree"));
      req.set_cleanup_plan_files(!args.Has("--keep-plan-files"));

      auto resp = streams.ArchiveStream(args.positional[0], req);
      Print(resp);
      return resp.success() ? 0 : 2;
    }

    // ------------------------------------------------------------

    if (cmd == "stats") {
      Print(admin.Stats());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "jobs") {
      std::optional<workstream::model::SummaryJobStatus> status;
      if (auto v = args.Option("--status")) {
        status = workstream::model::ParseSummaryJobStatus(*v);
        if (!status) {
          std::cerr << "unsupported job status: " << *v << "\n";
          return 1;
        }
      }

      for (const auto& job : app.context.jobs->ListByStatus(status)) {
        auto proto = workstream::core::ToProto(job);
        std::cout << proto.id() << "\t" << proto.status() << "\t" << proto.stream_id() << "\tattempts=" << proto.attempts() << "/"
                  << proto.max_attempts() << "\t" << proto.archive_path() << "\n";
      }
      return 0;
    }

    std::cerr << "unknown command: " << cmd << "\n";
    Usage();
    return 1;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    workstream::observability::ShutdownLogging();
    return 2;
  }
}
