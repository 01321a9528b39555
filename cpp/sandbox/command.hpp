#ifndef SANDBOX_COMMAND_HPP
#define SANDBOX_COMMAND_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <kj/async.h>
#include <kj/time.h>

namespace sandbox {

// A single subprocess invocation.
struct Command {
  // args[0] is looked up in PATH.
  std::vector<std::string> args;
  // Written to the standard input of the process, which is then closed.
  std::string input;
  // Wall-clock limit; when it elapses the process group is killed.
  kj::Maybe<kj::Duration> wall_limit;
};

// Outcome of a command that was started successfully.
struct CommandResult {
  int32_t status_code = 0;
  int32_t signal = 0;
  // True if the process was killed because it exceeded its wall limit.
  bool killed = false;
  std::string out;
  std::string err;

  bool Success() const { return status_code == 0 && signal == 0; }
};

// Runs commands asynchronously. The returned promise rejects only if the
// command could not be started at all (EnvironmentUnavailable); a process
// that runs and fails is reported through CommandResult.
class CommandRunner {
 public:
  virtual kj::Promise<CommandResult> Run(Command command)
      KJ_WARN_UNUSED_RESULT = 0;

  virtual ~CommandRunner() = default;
  CommandRunner() = default;
  CommandRunner(const CommandRunner&) = delete;
  CommandRunner(CommandRunner&&) = delete;
  CommandRunner& operator=(const CommandRunner&) = delete;
  CommandRunner& operator=(CommandRunner&&) = delete;
};

}  // namespace sandbox

#endif
