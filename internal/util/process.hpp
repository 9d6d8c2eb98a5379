#pragma once

#include <string>
#include <vector>

namespace workstream::util {

struct CommandResult {
  int         exit_code = -1;
  std::string out;
  std::string err;

  bool Ok() const {
    return exit_code == 0;
  }
};

/*
  Blocking subprocess seam.

  Git and filesystem helpers go through this so tests can script the
  command layer. Run() never throws for a failing command: spawn errors
  come back as exit_code -1 with the reason in err.
*/
class CommandRunner {
 public:
  virtual ~CommandRunner() = default;

  virtual CommandResult Run(const std::vector<std::string>& argv, const std::string& cwd) = 0;
};

/*
  fork/execvp runner capturing stdout and stderr through pipes.
*/
class SubprocessRunner final : public CommandRunner {
 public:
  CommandResult Run(const std::vector<std::string>& argv, const std::string& cwd) override;
};

// "git -C x log" style rendering for log lines.
std::string JoinCommand(const std::vector<std::string>& argv);

} // namespace workstream::util
