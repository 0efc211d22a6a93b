#ifndef SANDBOXD_PERIODIC_TIMER_H
#define SANDBOXD_PERIODIC_TIMER_H

#include <chrono>
#include <functional>
#include "shim.h"

namespace sandboxd {

// Runs an asynchronous tick every |interval|. The next tick is scheduled only
// after the previous one has called its completion callback, so ticks never
// overlap.
class PeriodicTimer {
 public:
  using Tick = std::function<void(Callback done)>;

  PeriodicTimer(EventLoop& loop, Clock::duration interval, Tick tick);
  PeriodicTimer(const PeriodicTimer&) = delete;
  PeriodicTimer& operator=(const PeriodicTimer&) = delete;

  void Start();
  void Stop();

  bool running() const { return running_; }

 private:
  void Schedule();
  void HandleTimer(const boost::system::error_code& error_code);

  Timer timer_;
  const Clock::duration interval_;
  Tick tick_;
  bool running_ = false;
  // Distinguishes completions of ticks started before a Stop and Start.
  uint64_t generation_ = 0;
};

}

#endif //SANDBOXD_PERIODIC_TIMER_H
