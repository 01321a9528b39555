#ifndef SANDBOX_WARM_SANDBOX_HPP
#define SANDBOX_WARM_SANDBOX_HPP

#include <string>
#include <vector>

#include <kj/async.h>
#include <kj/time.h>

#include "sandbox/command.hpp"
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Everything needed to create and use one container. Never changes after
// construction.
struct Identity {
  std::string docker = "docker";
  std::string image;
  std::string name;
  // Keeps the container alive between jobs.
  std::vector<std::string> idle_command = {"/bin/sh", "-c", "sleep infinity"};
  // Runs one job inside the container, reading the payload from stdin.
  std::vector<std::string> run_command = {"python",
                                          "/judge/run_submission.py"};
  kj::Duration exec_timeout = 60 * kj::SECONDS;
};

// A sandbox backed by a persistent docker container. Jobs are run with
// "docker exec -i"; the container is recreated on demand if it disappears.
class WarmSandbox : public Sandbox {
 public:
  WarmSandbox(Identity identity, CommandRunner* runner)
      : identity_(std::move(identity)), runner_(runner) {}

  kj::Promise<std::string> Run(std::string payload) override;
  kj::Promise<void> EnsureReady() override;
  kj::Promise<void> Dispose() override;
  const std::string& Name() const override { return identity_.name; }

  const Identity& GetIdentity() const { return identity_; }

  // Runs the job once, without any readiness check or retry.
  kj::Promise<std::string> Execute(const std::string& payload);

 private:
  kj::Promise<void> CheckAndRepair();
  kj::Promise<bool> IsRunning();
  kj::Promise<CommandResult> RemoveContainer();
  kj::Promise<void> Create();

  Identity identity_;
  CommandRunner* runner_;
  // The last readiness check, shared by concurrent callers while checking_.
  kj::Maybe<kj::ForkedPromise<void>> ready_;
  bool checking_ = false;
};

}  // namespace sandbox

#endif
