#ifndef SANDBOXD_EXECUTION_SCHEDULER_H
#define SANDBOXD_EXECUTION_SCHEDULER_H

#include <deque>
#include <memory>
#include "background_queue.h"
#include "config.h"
#include "container_runtime.h"
#include "rate_limiter.h"
#include "session.h"

namespace sandboxd {

// Runs code executions against sandboxes. At most max_concurrent run at once
// and at most rate_limit_points start per window; the rest wait in submission
// order until admitted or until the queue timeout fails them with
// errc::capacity.
class ExecutionScheduler {
 public:
  ExecutionScheduler(EventLoop& loop,
                     ContainerRuntime& runtime,
                     BackgroundQueue& background,
                     const SchedulerConfig& config);
  ExecutionScheduler(const ExecutionScheduler&) = delete;
  ExecutionScheduler& operator=(const ExecutionScheduler&) = delete;

  // Completes exactly once. Timeout and output-limit failures carry the
  // partial result.
  void Execute(const SandboxHandle& sandbox,
               const ExecutionRequest& request,
               ResultHandler<ExecutionResult> handler);

  std::size_t running() const { return running_; }
  std::size_t queued() const { return queue_.size(); }

  // Requested values are clamped to the configured maximum, zero or less
  // selects the default.
  std::chrono::milliseconds EffectiveTimeout(int64_t requested_ms) const;
  int64_t EffectiveOutputLimit(int64_t requested_bytes) const;

 private:
  struct Waiter {
    SandboxHandle sandbox;
    ExecutionRequest request;
    ResultHandler<ExecutionResult> handler;
    std::unique_ptr<Timer> deadline;
  };

  void Pump();
  void ArmRateTimer(Clock::duration delay);
  void HandleQueueTimeout(const std::shared_ptr<Waiter>& waiter,
                          const boost::system::error_code& error_code);
  void Run(const std::shared_ptr<Waiter>& waiter);

  EventLoop& loop_;
  ContainerRuntime& runtime_;
  BackgroundQueue& background_;
  const SchedulerConfig config_;
  SlidingWindowLimiter limiter_;
  std::deque<std::shared_ptr<Waiter>> queue_;
  Timer rate_timer_;
  bool rate_timer_armed_ = false;
  std::size_t running_ = 0;
};

}

#endif //SANDBOXD_EXECUTION_SCHEDULER_H
