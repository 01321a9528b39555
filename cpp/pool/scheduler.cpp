#include "pool/scheduler.hpp"

#include <kj/debug.h>

#include "sandbox/errors.hpp"

namespace pool {

namespace {

double ToMillis(kj::Duration duration) {
  return static_cast<double>(duration / kj::NANOSECONDS) / 1e6;
}

}  // namespace

Scheduler::Scheduler(std::vector<kj::Own<sandbox::Sandbox>> sandboxes,
                     kj::Timer& timer, const kj::Clock& clock)
    : sandboxes_(std::move(sandboxes)),
      timer_(timer),
      clock_(clock),
      tasks_(*this) {
  if (sandboxes_.empty()) {
    kj::throwFatalException(
        sandbox::PoolMisconfigured("a pool needs at least one sandbox"));
  }
}

kj::Promise<std::string> Scheduler::Submit(std::string payload) {
  auto paf = kj::newPromiseAndFulfiller<std::string>();
  queue_.push_back(
      Job{std::move(payload), timer_.now(), kj::mv(paf.fulfiller)});
  KJ_LOG(INFO, "Job enqueued", queue_.size(), active_);
  Drain();
  return kj::mv(paf.promise);
}

void Scheduler::Drain() {
  while (!queue_.empty() && active_ < sandboxes_.size()) {
    Job job = std::move(queue_.front());
    queue_.pop_front();
    size_t slot = cursor_;
    cursor_ = (cursor_ + 1) % sandboxes_.size();
    active_++;
    kj::TimePoint start = timer_.now();
    kj::Duration wait = start - job.arrival;
    total_queue_wait_ += wait;
    KJ_LOG(INFO, "Job started", slot, sandboxes_[slot]->Name().c_str(),
           wait / kj::MILLISECONDS, queue_.size(), active_);
    tasks_.add(Assign(std::move(job), slot, start));
  }
}

kj::Promise<void> Scheduler::Assign(Job job, size_t slot,
                                    kj::TimePoint start) {
  kj::PromiseFulfiller<std::string>& fulfiller = *job.fulfiller;
  sandbox::Sandbox& sandbox = *sandboxes_[slot];
  return kj::evalNow([&]() { return sandbox.Run(std::move(job.payload)); })
      .then(
          [this, &fulfiller, start](std::string output) {
            Complete(start);
            fulfiller.fulfill(std::move(output));
          },
          [this, &fulfiller, &sandbox, start](kj::Exception exc) {
            error_count_++;
            KJ_LOG(WARNING, "Job failed", sandbox.Name().c_str(),
                   exc.getDescription());
            Complete(start);
            fulfiller.reject(kj::mv(exc));
          })
      .then([this]() { Drain(); })
      .attach(kj::mv(job.fulfiller));
}

void Scheduler::Complete(kj::TimePoint start) {
  KJ_ASSERT(active_ > 0);
  kj::Duration duration = timer_.now() - start;
  active_--;
  total_runs_++;
  total_run_time_ += duration;
  last_run_at_ = clock_.now();
  KJ_LOG(INFO, "Job done", duration / kj::MILLISECONDS, queue_.size(),
         active_);
}

Stats Scheduler::GetStats() const {
  Stats stats;
  stats.pool_size = sandboxes_.size();
  stats.active_workers = active_;
  stats.queue_length = queue_.size();
  stats.total_runs = total_runs_;
  stats.error_count = error_count_;
  if (total_runs_ > 0) {
    stats.avg_run_millis = ToMillis(total_run_time_) / total_runs_;
    stats.avg_queue_wait_millis = ToMillis(total_queue_wait_) / total_runs_;
  }
  KJ_IF_MAYBE(date, last_run_at_) {
    stats.last_run_at = (*date - kj::UNIX_EPOCH) / kj::MILLISECONDS;
  }
  return stats;
}

kj::Promise<void> Scheduler::Warm() {
  auto promises = kj::heapArrayBuilder<kj::Promise<void>>(sandboxes_.size());
  for (auto& sandbox : sandboxes_) {
    const std::string& name = sandbox->Name();
    promises.add(sandbox->EnsureReady().then(
        [&name]() { KJ_LOG(INFO, "Sandbox ready", name.c_str()); },
        [&name](kj::Exception exc) {
          KJ_LOG(WARNING, "Could not warm up sandbox", name.c_str(),
                 exc.getDescription());
        }));
  }
  return kj::joinPromises(promises.finish());
}

kj::Promise<void> Scheduler::Dispose() {
  auto promises = kj::heapArrayBuilder<kj::Promise<void>>(sandboxes_.size());
  for (auto& sandbox : sandboxes_) promises.add(sandbox->Dispose());
  return kj::joinPromises(promises.finish());
}

void Scheduler::taskFailed(kj::Exception&& exception) {
  KJ_LOG(ERROR, "Scheduler task failed", exception);
}

}  // namespace pool
