#ifndef SANDBOXD_BACKGROUND_QUEUE_H
#define SANDBOXD_BACKGROUND_QUEUE_H

#include <functional>
#include <string>
#include "shim.h"
#include "status.h"

namespace sandboxd {

// Detached tasks whose failures are logged and never reach the submitter.
class BackgroundQueue {
 public:
  using Task = std::function<void(StatusHandler done)>;

  explicit BackgroundQueue(EventLoop& loop);
  BackgroundQueue(const BackgroundQueue&) = delete;
  BackgroundQueue& operator=(const BackgroundQueue&) = delete;

  // Starts |task| on the next turn of the loop. |name| is used for logging.
  void Submit(const std::string& name, Task task);

  std::size_t pending() const { return pending_; }
  std::size_t failures() const { return failures_; }

 private:
  EventLoop& loop_;
  std::size_t pending_ = 0;
  std::size_t failures_ = 0;
};

}

#endif //SANDBOXD_BACKGROUND_QUEUE_H
