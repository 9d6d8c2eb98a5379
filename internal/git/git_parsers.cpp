#include "git_parsers.hpp"

#include <filesystem>
#include <regex>
#include <sstream>

namespace workstream::git {

namespace {

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream       in(text);
  std::string              line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(line);
  }
  return lines;
}

std::vector<std::string> SplitFields(const std::string& text, char sep) {
  std::vector<std::string> fields;
  std::size_t              start = 0;
  while (true) {
    auto pos = text.find(sep, start);
    if (pos == std::string::npos) {
      fields.push_back(text.substr(start));
      break;
    }
    fields.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return fields;
}

std::string Trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t");
  if (first == std::string::npos) return {};
  const auto last = s.find_last_not_of(" \t");
  return s.substr(first, last - first + 1);
}

bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

void FinishWorktree(WorktreeInfo& current, bool skip, const std::string& base, std::map<std::string, WorktreeInfo>& out) {
  if (!skip && !current.path.empty() && !current.branch.empty()) {
    current.is_main = IsBaseBranch(current.branch, base);
    current.id      = current.is_main ? "main" : std::filesystem::path(current.path).filename().string();
    if (!current.id.empty()) out[current.id] = current;
  }
  current = WorktreeInfo{};
}

} // namespace

bool IsBaseBranch(const std::string& branch, const std::string& base) {
  if (branch == base) return true;
  // main and master stand in for each other only when one of them is the base
  const auto is_default = [](const std::string& name) { return name == "main" || name == "master"; };
  return is_default(base) && is_default(branch);
}

std::map<std::string, WorktreeInfo> ParseWorktreeList(const std::string& porcelain, const std::string& base) {
  std::map<std::string, WorktreeInfo> out;
  WorktreeInfo                        current;
  bool                                skip = false;

  for (const auto& line : SplitLines(porcelain)) {
    if (line.empty()) {
      FinishWorktree(current, skip, base, out);
      skip = false;
      continue;
    }
    if (StartsWith(line, "worktree ")) {
      if (!current.path.empty()) {
        FinishWorktree(current, skip, base, out);
        skip = false;
      }
      current.path = line.substr(9);
    } else if (StartsWith(line, "HEAD ")) {
      current.commit_hash = line.substr(5);
    } else if (StartsWith(line, "branch ")) {
      auto ref = line.substr(7);
      if (StartsWith(ref, "refs/heads/")) ref = ref.substr(11);
      current.branch = ref;
    } else if (line == "bare" || line == "detached") {
      skip = true;
    }
  }
  FinishWorktree(current, skip, base, out);
  return out;
}

std::set<std::string> ParseMergedBranches(const std::string& output, const std::string& base) {
  std::set<std::string> merged;
  for (auto line : SplitLines(output)) {
    line = Trim(line);
    if (StartsWith(line, "* ") || StartsWith(line, "+ ")) line = Trim(line.substr(2));
    if (line.empty() || StartsWith(line, "(")) continue;
    if (IsBaseBranch(line, base)) continue;
    merged.insert(line);
  }
  return merged;
}

bool IsNumstatLine(const std::string& line) {
  static const std::regex kNumstat(R"(^(\d+\t\d+\t|-\t-\t).*)");
  return std::regex_match(line, kNumstat);
}

std::vector<GitCommit> ParseLogWithNumstat(const std::string& output) {
  std::vector<GitCommit> commits;

  for (const auto& line : SplitLines(output)) {
    if (!line.empty() && line.front() == kRecordSep) {
      auto fields = SplitFields(line.substr(1), kUnitSep);
      if (fields.size() < 4) continue;

      GitCommit commit;
      commit.hash      = fields[0];
      commit.author    = fields[1];
      commit.timestamp = fields[2];
      // subjects never contain US, but keep anything after the 4th field
      commit.subject = fields[3];
      for (std::size_t i = 4; i < fields.size(); ++i) {
        commit.subject += kUnitSep + fields[i];
      }
      if (commit.hash.empty()) continue;
      commits.push_back(std::move(commit));
      continue;
    }

    if (!commits.empty() && IsNumstatLine(line)) {
      ++commits.back().files_changed;
    }
  }
  return commits;
}

std::vector<LogEntry> ParseRecentLog(const std::string& output) {
  std::vector<LogEntry> entries;
  for (const auto& line : SplitLines(output)) {
    auto fields = SplitFields(line, kUnitSep);
    if (fields.size() < 2 || fields[0].empty()) continue;

    LogEntry entry;
    entry.hash    = fields[0];
    entry.subject = fields[1];
    if (fields.size() > 2) entry.refs = fields[2];
    entries.push_back(std::move(entry));
  }
  return entries;
}

} // namespace workstream::git
