#include "rate_limiter.h"

#include <glog/logging.h>

namespace sandboxd {

SlidingWindowLimiter::SlidingWindowLimiter(int points, Clock::duration window)
    : points_(points),
      window_(window) {
  CHECK_GT(points_, 0);
}

void SlidingWindowLimiter::Expire(TimePoint now) {
  while (!events_.empty() && now - events_.front().first >= window_) {
    used_ -= events_.front().second;
    events_.pop_front();
  }
}

bool SlidingWindowLimiter::TryConsume(TimePoint now, int points) {
  Expire(now);
  if (used_ + points > points_) {
    return false;
  }
  events_.emplace_back(now, points);
  used_ += points;
  return true;
}

int SlidingWindowLimiter::Remaining(TimePoint now) {
  Expire(now);
  return points_ - used_;
}

Clock::duration SlidingWindowLimiter::RetryAfter(TimePoint now) {
  Expire(now);
  if (used_ < points_) {
    return Clock::duration::zero();
  }
  int freed = 0;
  for (const auto& event : events_) {
    freed += event.second;
    if (used_ - freed < points_) {
      return event.first + window_ - now;
    }
  }
  return window_;
}

bool SlidingWindowLimiter::idle(TimePoint now) {
  Expire(now);
  return events_.empty();
}

KeyedRateLimiter::KeyedRateLimiter(int points, Clock::duration window)
    : points_(points),
      window_(window) {}

bool KeyedRateLimiter::TryConsume(const std::string& key,
                                  TimePoint now,
                                  int points) {
  if (now >= next_prune_) {
    Prune(now);
  }
  auto iter = limiters_.find(key);
  if (iter == limiters_.end()) {
    iter = limiters_.emplace(key, SlidingWindowLimiter(points_, window_)).first;
  }
  return iter->second.TryConsume(now, points);
}

int KeyedRateLimiter::Remaining(const std::string& key, TimePoint now) {
  auto iter = limiters_.find(key);
  if (iter == limiters_.end()) {
    return points_;
  }
  return iter->second.Remaining(now);
}

void KeyedRateLimiter::Prune(TimePoint now) {
  next_prune_ = now + window_;
  for (auto iter = limiters_.begin(); iter != limiters_.end();) {
    if (iter->second.idle(now)) {
      iter = limiters_.erase(iter);
    } else {
      ++iter;
    }
  }
}

}
