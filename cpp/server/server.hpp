#ifndef SERVER_SERVER_HPP
#define SERVER_SERVER_HPP

#include <string>

#include <kj/timer.h>

#include "capnp/runner.capnp.h"
#include "pool/scheduler.hpp"

namespace server {

// Implementation of the Runner interface on top of a Scheduler.
class Runner : public capnproto::Runner::Server {
 public:
  Runner(pool::Scheduler* scheduler, std::string image, kj::Timer& timer)
      : scheduler_(*scheduler),
        image_(std::move(image)),
        timer_(timer),
        started_(timer.now()) {}

  kj::Promise<void> submit(SubmitContext context) override;
  kj::Promise<void> stats(StatsContext context) override;
  kj::Promise<void> health(HealthContext context) override;

  // Every submission after this call is rejected. Jobs already accepted are
  // not affected.
  void Stop() { stopping_ = true; }

 private:
  pool::Scheduler& scheduler_;
  std::string image_;
  kj::Timer& timer_;
  kj::TimePoint started_;
  bool stopping_ = false;
};

void FillStats(const pool::Stats& stats, capnproto::PoolStats::Builder out);

}  // namespace server

#endif
