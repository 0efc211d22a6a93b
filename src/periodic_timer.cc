#include "periodic_timer.h"

#include <glog/logging.h>

namespace sandboxd {

PeriodicTimer::PeriodicTimer(EventLoop& loop,
                             Clock::duration interval,
                             Tick tick)
    : timer_(loop), interval_(interval), tick_(std::move(tick)) {
  CHECK(interval_ > Clock::duration::zero());
}

void PeriodicTimer::Start() {
  if (running_) {
    return;
  }
  running_ = true;
  ++generation_;
  Schedule();
}

void PeriodicTimer::Stop() {
  running_ = false;
  ++generation_;
  timer_.cancel();
}

void PeriodicTimer::Schedule() {
  timer_.expires_after(interval_);
  timer_.async_wait([this](const boost::system::error_code& error_code) {
    if (error_code == boost::asio::error::operation_aborted) {
      return;
    }
    HandleTimer(error_code);
  });
}

void PeriodicTimer::HandleTimer(const boost::system::error_code& error_code) {
  CHECK(!error_code) << error_code.message();
  if (!running_) {
    return;
  }
  uint64_t generation = generation_;
  tick_([this, generation]() {
    if (running_ && generation == generation_) {
      Schedule();
    }
  });
}

}
