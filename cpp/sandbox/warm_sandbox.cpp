#include "sandbox/warm_sandbox.hpp"

#include <kj/debug.h>

#include "sandbox/errors.hpp"
#include "util/misc.hpp"

namespace sandbox {

namespace {

std::string DescribeFailure(const CommandResult& result,
                            const std::string& what) {
  std::string err = util::trim(result.err);
  if (!err.empty()) return err;
  if (result.status_code != 0) {
    return what + " exited with status " + std::to_string(result.status_code);
  }
  return what + " killed by signal " + std::to_string(result.signal);
}

}  // namespace

kj::Promise<void> WarmSandbox::EnsureReady() {
  // ready_ keeps the last check alive until the next one replaces it; only a
  // check that is still running is shared.
  if (checking_) {
    KJ_IF_MAYBE(ready, ready_) { return ready->addBranch(); }
  }
  // evalNow turns a synchronous throw into a rejection, so checking_ is
  // always reset.
  checking_ = true;
  kj::Promise<void> check =
      kj::evalNow([this]() { return CheckAndRepair(); })
          .then([this]() { checking_ = false; },
                [this](kj::Exception exc) {
                  checking_ = false;
                  kj::throwFatalException(kj::mv(exc));
                });
  kj::ForkedPromise<void> forked = check.fork();
  kj::Promise<void> branch = forked.addBranch();
  ready_ = kj::mv(forked);
  return branch;
}

kj::Promise<void> WarmSandbox::CheckAndRepair() {
  return IsRunning().then([this](bool running) -> kj::Promise<void> {
    if (running) return kj::READY_NOW;
    KJ_LOG(WARNING, "Container is not running, recreating it",
           identity_.name.c_str());
    return RemoveContainer().then(
        [this](CommandResult) { return Create(); },
        [this](kj::Exception exc) {
          KJ_LOG(INFO, "Could not remove stale container",
                 identity_.name.c_str(), exc.getDescription());
          return Create();
        });
  });
}

kj::Promise<bool> WarmSandbox::IsRunning() {
  Command command;
  command.args = {identity_.docker, "inspect", "-f", "{{.State.Running}}",
                  identity_.name};
  command.wall_limit = identity_.exec_timeout;
  return runner_->Run(std::move(command))
      .then(
          [](CommandResult result) {
            return result.Success() && util::trim(result.out) == "true";
          },
          [this](kj::Exception exc) {
            KJ_LOG(INFO, "Inspect failed", identity_.name.c_str(),
                   exc.getDescription());
            return false;
          });
}

kj::Promise<CommandResult> WarmSandbox::RemoveContainer() {
  Command command;
  command.args = {identity_.docker, "rm", "-f", identity_.name};
  command.wall_limit = identity_.exec_timeout;
  return runner_->Run(std::move(command));
}

kj::Promise<void> WarmSandbox::Create() {
  Command command;
  command.args = {identity_.docker, "run",
                  "-d",             "--rm",
                  "--name",         identity_.name,
                  "--entrypoint",   identity_.idle_command.at(0),
                  identity_.image};
  command.args.insert(command.args.end(), identity_.idle_command.begin() + 1,
                      identity_.idle_command.end());
  command.wall_limit = identity_.exec_timeout;
  return runner_->Run(std::move(command))
      .then([this](CommandResult result) {
        if (!result.Success()) {
          kj::throwFatalException(EnvironmentUnavailable(
              DescribeFailure(result, "docker run " + identity_.name)));
        }
        KJ_LOG(INFO, "Container created", identity_.name.c_str(),
               util::trim(result.out).c_str());
      });
}

kj::Promise<std::string> WarmSandbox::Execute(const std::string& payload) {
  Command command;
  command.args = {identity_.docker, "exec", "-i", identity_.name};
  command.args.insert(command.args.end(), identity_.run_command.begin(),
                      identity_.run_command.end());
  command.input = payload;
  command.wall_limit = identity_.exec_timeout;
  return runner_->Run(std::move(command))
      .then([this](CommandResult result) {
        if (result.Success()) return std::move(result.out);
        if (result.killed) {
          KJ_LOG(WARNING, "Job exceeded the execution timeout",
                 identity_.name.c_str());
        }
        kj::throwFatalException(
            ExecutionFailed(DescribeFailure(result, "Warm sandbox")));
      });
}

kj::Promise<std::string> WarmSandbox::Run(std::string payload) {
  auto data = kj::heap<std::string>(std::move(payload));
  const std::string& input = *data;
  return EnsureReady()
      .then([this, &input]() {
        return Execute(input).then(
            [](std::string out) -> kj::Promise<std::string> {
              return std::move(out);
            },
            [this, &input](kj::Exception exc) -> kj::Promise<std::string> {
              if (!IsEnvironmentLost(exc)) return kj::mv(exc);
              KJ_LOG(WARNING, "Container lost, recreating and retrying once",
                     identity_.name.c_str());
              return EnsureReady().then(
                  [this, &input]() { return Execute(input); });
            });
      })
      .attach(kj::mv(data));
}

kj::Promise<void> WarmSandbox::Dispose() {
  return RemoveContainer().then(
      [this](CommandResult result) {
        if (!result.Success()) {
          KJ_LOG(WARNING, "Could not remove container", identity_.name.c_str(),
                 DescribeFailure(result, "docker rm").c_str());
        }
      },
      [this](kj::Exception exc) {
        KJ_LOG(WARNING, "Could not remove container", identity_.name.c_str(),
               exc.getDescription());
      });
}

}  // namespace sandbox
