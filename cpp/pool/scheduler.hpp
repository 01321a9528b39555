#ifndef POOL_SCHEDULER_HPP
#define POOL_SCHEDULER_HPP

#include <cstdint>
#include <deque>
#include <string>
#include <vector>

#include <kj/async.h>
#include <kj/time.h>
#include <kj/timer.h>

#include "sandbox/sandbox.hpp"

namespace pool {

// Snapshot of the pool load and latency.
struct Stats {
  uint32_t pool_size = 0;
  uint32_t active_workers = 0;
  uint32_t queue_length = 0;
  uint64_t total_runs = 0;
  double avg_run_millis = 0;
  double avg_queue_wait_millis = 0;
  uint64_t error_count = 0;
  // Milliseconds since the Unix epoch of the last completion, if any.
  kj::Maybe<int64_t> last_run_at;
};

// Class to dispatch jobs to a fixed set of sandboxes. Jobs are assigned in
// arrival order, to the sandboxes in rotation, and at most one job runs on
// each slot of the pool at any time. Everything runs on the event loop thread.
class Scheduler : private kj::TaskSet::ErrorHandler {
 public:
  // Throws if sandboxes is empty. timer provides the monotonic time used for
  // queue waits and durations, clock the timestamp of the last completion.
  Scheduler(std::vector<kj::Own<sandbox::Sandbox>> sandboxes, kj::Timer& timer,
            const kj::Clock& clock = kj::systemPreciseCalendarClock());

  // Queues a job and returns its raw output. Never waits for a free slot:
  // the job is started as soon as one is available.
  kj::Promise<std::string> Submit(std::string payload) KJ_WARN_UNUSED_RESULT;

  Stats GetStats() const;

  // Makes every sandbox ready. Failures are logged, never propagated.
  kj::Promise<void> Warm() KJ_WARN_UNUSED_RESULT;

  // Tears every sandbox down.
  kj::Promise<void> Dispose() KJ_WARN_UNUSED_RESULT;

  size_t Size() const { return sandboxes_.size(); }

 private:
  struct Job {
    std::string payload;
    kj::TimePoint arrival;
    kj::Own<kj::PromiseFulfiller<std::string>> fulfiller;
  };

  // Starts queued jobs while there are free slots.
  void Drain();
  kj::Promise<void> Assign(Job job, size_t slot, kj::TimePoint start);
  // Bookkeeping common to successful and failed jobs.
  void Complete(kj::TimePoint start);

  void taskFailed(kj::Exception&& exception) override;

  std::vector<kj::Own<sandbox::Sandbox>> sandboxes_;
  kj::Timer& timer_;
  const kj::Clock& clock_;

  std::deque<Job> queue_;
  size_t active_ = 0;
  size_t cursor_ = 0;

  uint64_t total_runs_ = 0;
  kj::Duration total_run_time_ = 0 * kj::NANOSECONDS;
  kj::Duration total_queue_wait_ = 0 * kj::NANOSECONDS;
  uint64_t error_count_ = 0;
  kj::Maybe<kj::Date> last_run_at_;

  kj::TaskSet tasks_;
};

}  // namespace pool

#endif
