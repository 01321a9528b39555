#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP
#include <sys/types.h>

#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/timer.h>

#include "sandbox/command.hpp"

namespace sandbox {

// CommandRunner for UNIX-like systems: fork + execvp, with the standard
// streams connected to pipes that are driven by the kj event loop.
// kj::UnixEventPort::captureChildExit() must have been called before the event
// port was created, otherwise child exits are never observed.
class Unix : public CommandRunner {
 public:
  Unix(kj::LowLevelAsyncIoProvider& io, kj::UnixEventPort& event_port,
       kj::Timer& timer);
  explicit Unix(kj::AsyncIoContext& context)
      : Unix(*context.lowLevelProvider, context.unixEventPort,
             context.provider->getTimer()) {}

  kj::Promise<CommandResult> Run(Command command) override;

 private:
  // Function that is executed in the child process. Writes the reason to
  // error_fd if exec fails.
  [[noreturn]] static void Child(char* const* argv, int stdin_fd,
                                 int stdout_fd, int stderr_fd, int error_fd);

  kj::LowLevelAsyncIoProvider& io_;
  kj::UnixEventPort& event_port_;
  kj::Timer& timer_;
};

}  // namespace sandbox

#endif
