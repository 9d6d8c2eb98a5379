#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/util/process.hpp"

namespace workstream::testing {

/*
  Scripted CommandRunner keyed by the joined argv ("git log -n 20 ...").
  Unscripted commands fail with exit code 1 unless SucceedByDefault() was
  called. Every call is recorded.
*/
class FakeCommandRunner final : public util::CommandRunner {
 public:
  struct Call {
    std::string command;
    std::string cwd;
  };

  void Script(const std::string& command, util::CommandResult result) {
    std::lock_guard<std::mutex> lock(mu_);
    scripted_[command] = std::move(result);
  }

  void ScriptOutput(const std::string& command, const std::string& out) {
    util::CommandResult result;
    result.exit_code = 0;
    result.out       = out;
    Script(command, std::move(result));
  }

  void ScriptFailure(const std::string& command, const std::string& err) {
    util::CommandResult result;
    result.exit_code = 1;
    result.err       = err;
    Script(command, std::move(result));
  }

  void SucceedByDefault() {
    std::lock_guard<std::mutex> lock(mu_);
    succeed_by_default_ = true;
  }

  util::CommandResult Run(const std::vector<std::string>& argv, const std::string& cwd) override {
    std::lock_guard<std::mutex> lock(mu_);
    const auto command = util::JoinCommand(argv);
    calls_.push_back(Call{command, cwd});

    auto it = scripted_.find(command);
    if (it != scripted_.end()) return it->second;

    util::CommandResult result;
    if (succeed_by_default_) {
      result.exit_code = 0;
      return result;
    }
    result.exit_code = 1;
    result.err       = "unscripted: " + command;
    return result;
  }

  std::vector<Call> Calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return calls_;
  }

  bool Ran(const std::string& command) const {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& call : calls_) {
      if (call.command == command) return true;
    }
    return false;
  }

 private:
  mutable std::mutex                         mu_;
  std::map<std::string, util::CommandResult> scripted_;
  std::vector<Call>                          calls_;
  bool                                       succeed_by_default_ = false;
};

} // namespace workstream::testing
