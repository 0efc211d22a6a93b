#include "background_queue.h"

#include <boost/asio/post.hpp>
#include <glog/logging.h>
#include <memory>

namespace sandboxd {

BackgroundQueue::BackgroundQueue(EventLoop& loop) : loop_(loop) {}

void BackgroundQueue::Submit(const std::string& name, Task task) {
  ++pending_;
  boost::asio::post(loop_, [this, name, task]() {
    auto finished = std::make_shared<bool>(false);
    task([this, name, finished](const Status& status) {
      if (*finished) {
        LOG(ERROR) << "Background task " << name << " completed twice";
        return;
      }
      *finished = true;
      --pending_;
      if (!status.ok()) {
        ++failures_;
        LOG(WARNING) << "Background task " << name << " failed: " << status;
      } else {
        VLOG(1) << "Background task " << name << " done";
      }
    });
  });
}

}
