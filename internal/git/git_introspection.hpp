#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/git/git_parsers.hpp"
#include "internal/util/process.hpp"

namespace workstream::git {

/*
  Read-only git queries scoped to one repository.

  Every call shells out sequentially through the CommandRunner. Failures
  (not a repository, missing path, no commits yet, spawn errors) are
  logged and yield an empty result; nothing here throws for git trouble.
*/
class GitIntrospection {
 public:
  GitIntrospection(std::shared_ptr<util::CommandRunner> runner, std::string project_root);

  std::map<std::string, WorktreeInfo> ListWorktrees(const std::string& base = "main");

  std::set<std::string> ListMergedBranches(const std::string& base = "main");

  // Commits in <exclude_from>..HEAD of the worktree, newest first.
  std::vector<GitCommit> LogBranchCommits(const std::string& worktree_path, const std::string& exclude_from = "main", int limit = 50);

  // Recent commits on the base branch, run from the project root.
  std::vector<GitCommit> LogMainCommits(const std::string& base = "main", const std::string& since = "7 days ago", int limit = 20);

  std::vector<LogEntry> RecentLog(int limit = 20);

 private:
  // Empty string on any failure.
  std::string RunGit(const std::vector<std::string>& args, const std::string& cwd);

  std::shared_ptr<util::CommandRunner> runner_;
  std::string                          project_root_;
};

} // namespace workstream::git
