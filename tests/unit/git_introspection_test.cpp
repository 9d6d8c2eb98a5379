#include "internal/git/git_introspection.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "tests/support/fake_command_runner.hpp"

namespace {

namespace fs = std::filesystem;
using workstream::git::GitIntrospection;
using workstream::testing::FakeCommandRunner;

fs::path MakeDir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "workstream_git_introspection_tests" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void TestWorktreesComeFromProjectRoot() {
  const auto root   = MakeDir("worktrees");
  auto       runner = std::make_shared<FakeCommandRunner>();
  runner->ScriptOutput("git worktree list --porcelain",
                       "worktree " + root.string() + "\nHEAD abc\nbranch refs/heads/main\n\n"
                       "worktree /w/api\nHEAD def\nbranch refs/heads/api\n");

  GitIntrospection git(runner, root.string());
  auto             worktrees = git.ListWorktrees();
  assert(worktrees.size() == 2);
  assert(worktrees.count("api") == 1);

  auto calls = runner->Calls();
  assert(calls.size() == 1);
  assert(calls[0].cwd == root.string());
}

void TestMergedBranchesDropTheBase() {
  const auto root   = MakeDir("merged");
  auto       runner = std::make_shared<FakeCommandRunner>();
  runner->ScriptOutput("git branch --merged trunk", "* trunk\n  feature/a\n  feature/b\n");

  GitIntrospection git(runner, root.string());
  auto             merged = git.ListMergedBranches("trunk");
  assert(merged.size() == 2);
  assert(merged.count("trunk") == 0);
  assert(merged.count("feature/a") == 1);
}

void TestBranchLogRunsInsideWorktree() {
  const auto root     = MakeDir("branch_log_root");
  const auto worktree = MakeDir("branch_log_worktree");
  auto       runner   = std::make_shared<FakeCommandRunner>();

  const std::string command = std::string("git log main..HEAD ") + workstream::git::kCommitFormat + " --numstat -n 50";
  runner->ScriptOutput(command, "\x1e" "abc\x1f" "dev\x1f" "2026-01-01T00:00:00Z\x1f" "work\n1\t0\tsrc/a.cpp\n");

  GitIntrospection git(runner, root.string());
  auto             commits = git.LogBranchCommits(worktree.string());
  assert(commits.size() == 1);
  assert(commits[0].files_changed == 1);

  auto calls = runner->Calls();
  assert(calls.size() == 1);
  assert(calls[0].cwd == worktree.string());
}

void TestMainLogUsesWindowAndLimit() {
  const auto root   = MakeDir("main_log");
  auto       runner = std::make_shared<FakeCommandRunner>();

  const std::string command =
      std::string("git log main --since=7 days ago ") + workstream::git::kCommitFormat + " --numstat -n 20";
  runner->ScriptOutput(command, "\x1e" "m1\x1f" "dev\x1f" "2026-01-01T00:00:00Z\x1f" "release\n");

  GitIntrospection git(runner, root.string());
  auto             commits = git.LogMainCommits();
  assert(commits.size() == 1);
  assert(commits[0].hash == "m1");
}

void TestFailuresYieldEmptyResults() {
  const auto root   = MakeDir("failures");
  auto       runner = std::make_shared<FakeCommandRunner>();
  runner->ScriptFailure("git worktree list --porcelain", "fatal: not a git repository");

  GitIntrospection git(runner, root.string());
  assert(git.ListWorktrees().empty());
  assert(git.ListMergedBranches().empty());
  assert(git.RecentLog().empty());
}

void TestMissingDirectoryNeverSpawnsGit() {
  auto runner = std::make_shared<FakeCommandRunner>();

  GitIntrospection git(runner, "/nonexistent/workstream/project");
  assert(git.ListWorktrees().empty());
  assert(git.LogBranchCommits("/nonexistent/workstream/worktree").empty());
  assert(runner->Calls().empty());
}

void TestRecentLog() {
  const auto root   = MakeDir("recent_log");
  auto       runner = std::make_shared<FakeCommandRunner>();
  runner->ScriptOutput(std::string("git log -n 5 ") + workstream::git::kRecentLogFormat,
                       "aaa\x1f" "Merge auth-service\x1f" "HEAD -> main\n");

  GitIntrospection git(runner, root.string());
  auto             entries = git.RecentLog(5);
  assert(entries.size() == 1);
  assert(entries[0].refs == "HEAD -> main");
}

} // namespace

int main() {
  TestWorktreesComeFromProjectRoot();
  TestMergedBranchesDropTheBase();
  TestBranchLogRunsInsideWorktree();
  TestMainLogUsesWindowAndLimit();
  TestFailuresYieldEmptyResults();
  TestMissingDirectoryNeverSpawnsGit();
  TestRecentLog();

  std::cout << "workstream_unit_git_introspection: pass\n";
  return 0;
}
