#include "git_introspection.hpp"

#include <filesystem>

#include "internal/observability/logging.hpp"

namespace workstream::git {

namespace fs = std::filesystem;

GitIntrospection::GitIntrospection(std::shared_ptr<util::CommandRunner> runner, std::string project_root)
    : runner_(std::move(runner)), project_root_(std::move(project_root)) {
}

std::string GitIntrospection::RunGit(const std::vector<std::string>& args, const std::string& cwd) {
  std::error_code ec;
  if (!fs::is_directory(cwd, ec)) {
    WORKSTREAM_LOG_DEBUG("git skipped, directory missing", {observability::StringField("cwd", cwd)});
    return {};
  }

  std::vector<std::string> argv{"git"};
  argv.insert(argv.end(), args.begin(), args.end());

  auto result = runner_->Run(argv, cwd);
  if (!result.Ok()) {
    WORKSTREAM_LOG_DEBUG("git command failed", {observability::StringField("command", util::JoinCommand(argv)),
                                                observability::IntField("exit_code", result.exit_code),
                                                observability::StringField("stderr", result.err)});
    return {};
  }
  return result.out;
}

std::map<std::string, WorktreeInfo> GitIntrospection::ListWorktrees(const std::string& base) {
  return ParseWorktreeList(RunGit({"worktree", "list", "--porcelain"}, project_root_), base);
}

std::set<std::string> GitIntrospection::ListMergedBranches(const std::string& base) {
  return ParseMergedBranches(RunGit({"branch", "--merged", base}, project_root_), base);
}

std::vector<GitCommit> GitIntrospection::LogBranchCommits(const std::string& worktree_path, const std::string& exclude_from, int limit) {
  return ParseLogWithNumstat(
      RunGit({"log", exclude_from + "..HEAD", kCommitFormat, "--numstat", "-n", std::to_string(limit)}, worktree_path));
}

std::vector<GitCommit> GitIntrospection::LogMainCommits(const std::string& base, const std::string& since, int limit) {
  return ParseLogWithNumstat(
      RunGit({"log", base, "--since=" + since, kCommitFormat, "--numstat", "-n", std::to_string(limit)}, project_root_));
}

std::vector<LogEntry> GitIntrospection::RecentLog(int limit) {
  return ParseRecentLog(RunGit({"log", "-n", std::to_string(limit), kRecentLogFormat}, project_root_));
}

} // namespace workstream::git
