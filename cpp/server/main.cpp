#include "server/main.hpp"
#include <csignal>
#include <string>
#include <vector>

#include <capnp/rpc-twoparty.h>
#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/debug.h>

#include "pool/scheduler.hpp"
#include "sandbox/unix.hpp"
#include "sandbox/warm_sandbox.hpp"
#include "server/server.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"

namespace server {

namespace {

std::vector<kj::Own<sandbox::Sandbox>> MakeSandboxes(
    sandbox::CommandRunner* runner) {
  std::vector<kj::Own<sandbox::Sandbox>> sandboxes;
  for (int32_t i = 1; i <= Flags::pool_size; i++) {
    sandbox::Identity identity;
    identity.docker = Flags::docker;
    identity.image = Flags::image;
    identity.name = Flags::container_prefix + "-" + std::to_string(i);
    identity.exec_timeout = Flags::exec_timeout_millis * kj::MILLISECONDS;
    sandboxes.push_back(
        kj::heap<sandbox::WarmSandbox>(std::move(identity), runner));
  }
  return sandboxes;
}

}  // namespace

kj::MainBuilder::Validity Main::Run() {
  if (Flags::pool_size < 1) return "The pool size must be at least 1";
  if (Flags::exec_timeout_millis < 1) return "The timeout must be positive";
  util::LogManager log_manager(context);

  if (util::which(Flags::docker).empty()) {
    KJ_LOG(WARNING, "Container runtime not found in PATH, jobs will fail",
           Flags::docker.c_str());
  }

  // Both must happen before the event port is created.
  kj::UnixEventPort::captureChildExit();
  kj::UnixEventPort::captureSignal(SIGINT);
  kj::UnixEventPort::captureSignal(SIGTERM);
  auto io = kj::setupAsyncIo();

  sandbox::Unix runner(io);
  pool::Scheduler scheduler(MakeSandboxes(&runner),
                            io.provider->getTimer());

  kj::Promise<void> warm = kj::READY_NOW;
  if (Flags::prewarm) {
    KJ_LOG(INFO, "Warming up the pool", scheduler.Size());
    warm = scheduler.Warm().eagerlyEvaluate(nullptr);
  }

  auto service = kj::heap<Runner>(&scheduler, Flags::image,
                                  io.provider->getTimer());
  Runner& runner_service = *service;
  {
    capnp::TwoPartyServer server(kj::mv(service));
    auto address = io.provider->getNetwork()
                       .parseAddress(Flags::listen_address, Flags::port)
                       .wait(io.waitScope);
    auto listener = address->listen();
    KJ_LOG(WARNING, "Listening", Flags::listen_address.c_str(),
           listener->getPort(), scheduler.Size());

    auto shutdown = io.unixEventPort.onSignal(SIGINT)
                        .exclusiveJoin(io.unixEventPort.onSignal(SIGTERM))
                        .then([](siginfo_t info) {
                          KJ_LOG(WARNING, "Received signal", info.si_signo);
                        });
    server.listen(*listener).exclusiveJoin(kj::mv(shutdown)).wait(io.waitScope);

    runner_service.Stop();
    KJ_LOG(WARNING, "Shutting down, cleaning containers");
  }
  scheduler.Dispose().wait(io.waitScope);
  KJ_LOG(INFO, "Shut down");
  return true;
}

kj::MainFunc Main::getMain() {
  Flags::LoadEnvironment();
  return kj::MainBuilder(
             context, "warmpool",
             "Runs untrusted submissions on a pool of warm docker containers")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Log also informational messages")
      .addOptionWithArg({'n', "pool-size"}, util::setInt(Flags::pool_size),
                        "<N>", "Number of warm containers")
      .addOptionWithArg({"docker"}, util::setString(Flags::docker), "<PATH>",
                        "Container runtime binary")
      .addOptionWithArg({'i', "image"}, util::setString(Flags::image),
                        "<IMAGE>", "Image of the containers")
      .addOptionWithArg({"prefix"}, util::setString(Flags::container_prefix),
                        "<PREFIX>",
                        "Containers are named <PREFIX>-1 ... <PREFIX>-<N>")
      .addOptionWithArg({'t', "timeout"},
                        util::setInt(Flags::exec_timeout_millis), "<MS>",
                        "Hard time limit of a single job, in milliseconds")
      .addOption({'w', "prewarm"}, util::setBool(Flags::prewarm),
                 "Start all the containers before accepting jobs")
      .addOptionWithArg({'l', "address"},
                        util::setString(Flags::listen_address), "<ADDRESS>",
                        "Address to listen on")
      .addOptionWithArg({'p', "port"}, util::setInt(Flags::port), "<PORT>",
                        "Port to listen on")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace server
