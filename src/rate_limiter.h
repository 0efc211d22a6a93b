#ifndef SANDBOXD_RATE_LIMITER_H
#define SANDBOXD_RATE_LIMITER_H

#include <deque>
#include <string>
#include <unordered_map>
#include <utility>
#include "shim.h"

namespace sandboxd {

// Sliding window log: at most |points| consumed within any |window|.
class SlidingWindowLimiter {
 public:
  SlidingWindowLimiter(int points, Clock::duration window);

  bool TryConsume(TimePoint now, int points = 1);
  int Remaining(TimePoint now);
  // Time until one more point can be consumed, zero if it can be now.
  Clock::duration RetryAfter(TimePoint now);
  bool idle(TimePoint now);

 private:
  void Expire(TimePoint now);

  const int points_;
  const Clock::duration window_;
  std::deque<std::pair<TimePoint, int>> events_;
  int used_ = 0;
};

class KeyedRateLimiter {
 public:
  KeyedRateLimiter(int points, Clock::duration window);

  bool TryConsume(const std::string& key, TimePoint now, int points = 1);
  int Remaining(const std::string& key, TimePoint now);
  // Drops keys with no consumption left inside the window. TryConsume calls
  // it at most once per window.
  void Prune(TimePoint now);
  std::size_t size() const { return limiters_.size(); }

 private:
  const int points_;
  const Clock::duration window_;
  std::unordered_map<std::string, SlidingWindowLimiter> limiters_;
  TimePoint next_prune_;
};

}

#endif //SANDBOXD_RATE_LIMITER_H
