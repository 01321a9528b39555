#include "server/server.hpp"

#include <kj/debug.h>

namespace server {

void FillStats(const pool::Stats& stats, capnproto::PoolStats::Builder out) {
  out.setPoolSize(stats.pool_size);
  out.setActiveWorkers(stats.active_workers);
  out.setQueueLength(stats.queue_length);
  out.setTotalRuns(stats.total_runs);
  out.setAvgRunMs(stats.avg_run_millis);
  out.setAvgQueueWaitMs(stats.avg_queue_wait_millis);
  out.setErrorCount(stats.error_count);
  KJ_IF_MAYBE(at, stats.last_run_at) {
    out.getLastRunAt().setAt(*at);
  } else {
    out.getLastRunAt().setNever();
  }
}

kj::Promise<void> Runner::submit(SubmitContext context) {
  if (stopping_) {
    return KJ_EXCEPTION(DISCONNECTED, "Runner is shutting down");
  }
  auto payload = std::string(context.getParams().getPayload());
  context.releaseParams();
  return scheduler_.Submit(std::move(payload))
      .then([context](std::string output) mutable {
        context.getResults().setOutput(output);
      });
}

kj::Promise<void> Runner::stats(StatsContext context) {
  FillStats(scheduler_.GetStats(), context.getResults().initStats());
  return kj::READY_NOW;
}

kj::Promise<void> Runner::health(HealthContext context) {
  auto results = context.getResults();
  results.setImage(image_);
  results.setUptimeSeconds((timer_.now() - started_) / kj::MILLISECONDS /
                           1000.0);
  FillStats(scheduler_.GetStats(), results.initStats());
  return kj::READY_NOW;
}

}  // namespace server
