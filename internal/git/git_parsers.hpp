#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace workstream::git {

struct WorktreeInfo {
  std::string id; // basename of path, "main" for the base branch checkout
  std::string path;
  std::string branch;
  std::string commit_hash;
  bool        is_main = false;
};

struct GitCommit {
  std::string hash;
  std::string author;
  std::string timestamp; // as printed by %aI
  std::string subject;
  int         files_changed = 0;
};

struct LogEntry {
  std::string hash;
  std::string subject;
  std::string refs; // %D decorations
};

// Header line layout emitted for every commit: RS hash US author US date US subject
inline constexpr char kRecordSep = '\x1e';
inline constexpr char kUnitSep   = '\x1f';
inline constexpr const char* kCommitFormat = "--pretty=format:%x1e%H%x1f%an%x1f%aI%x1f%s";
inline constexpr const char* kRecentLogFormat = "--pretty=format:%H%x1f%s%x1f%D";

/*
  Parsers for git's machine-readable output. Pure functions, no I/O.
  Anything unrecognized is skipped rather than reported.
*/

// True for the base branch itself; "main" and "master" also match each
// other when the base is one of them.
bool IsBaseBranch(const std::string& branch, const std::string& base);

// `git worktree list --porcelain`. The worktree on the base branch is keyed
// "main"; detached and bare entries are dropped.
std::map<std::string, WorktreeInfo> ParseWorktreeList(const std::string& porcelain, const std::string& base = "main");

// `git branch --merged <base>`. Strips the current/worktree markers and
// never reports the base branch.
std::set<std::string> ParseMergedBranches(const std::string& output, const std::string& base = "main");

// `git log <kCommitFormat> --numstat`. Binary files ("-\t-\t") count as one.
std::vector<GitCommit> ParseLogWithNumstat(const std::string& output);

// `git log <kRecentLogFormat>`.
std::vector<LogEntry> ParseRecentLog(const std::string& output);

bool IsNumstatLine(const std::string& line);

} // namespace workstream::git
