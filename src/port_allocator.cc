#include "port_allocator.h"

#include <arpa/inet.h>
#include <glog/logging.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>

namespace sandboxd {

PortAllocator::PortAllocator(EventLoop& loop, const PortConfig& config)
    : loop_(loop),
      config_(config),
      reserved_(config.range_end - config.range_begin + 1, false),
      bind_probe_(&PortAllocator::IsBindable),
      random_(std::random_device()()) {
  CHECK_LE(config_.range_begin, config_.range_end);
}

bool PortAllocator::IsBindable(uint16_t port) {
  int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    PLOG(WARNING) << "socket";
    return false;
  }
  int enable = 1;
  setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));
  sockaddr_in address = {};
  address.sin_family = AF_INET;
  address.sin_addr.s_addr = htonl(INADDR_ANY);
  address.sin_port = htons(port);
  bool bindable =
      bind(fd, reinterpret_cast<sockaddr*>(&address), sizeof(address)) == 0;
  close(fd);
  return bindable;
}

bool PortAllocator::InRange(uint16_t port) const {
  return port >= config_.range_begin && port <= config_.range_end;
}

bool PortAllocator::IsReserved(uint16_t port) const {
  return InRange(port) && reserved_[port - config_.range_begin];
}

std::size_t PortAllocator::reserved_count() const {
  return std::count(reserved_.begin(), reserved_.end(), true);
}

uint16_t PortAllocator::FindAvailablePort(uint16_t range_start) {
  uint32_t scan_end = std::min<uint32_t>(
      uint32_t(range_start) + config_.scan_window, uint32_t(config_.range_end) + 1);
  for (uint32_t port = std::max(range_start, config_.range_begin);
       port < scan_end; ++port) {
    if (reserved_[port - config_.range_begin]) {
      continue;
    }
    if (!bind_probe_(static_cast<uint16_t>(port))) {
      // Held by someone outside the cache, keep it out of the scan for a while.
      VLOG(1) << "Port " << port << " is not bindable";
      Reserve(static_cast<uint16_t>(port));
      continue;
    }
    Reserve(static_cast<uint16_t>(port));
    return static_cast<uint16_t>(port);
  }
  uint32_t span = scan_end > range_start ? scan_end - range_start : 1;
  uint16_t port = static_cast<uint16_t>(
      range_start + std::uniform_int_distribution<uint32_t>(0, span - 1)(random_));
  LOG(WARNING) << "No confirmed free port from " << range_start
               << ", falling back to " << port;
  if (InRange(port)) {
    Reserve(port);
  }
  return port;
}

void PortAllocator::Reserve(uint16_t port) {
  reserved_[port - config_.range_begin] = true;
  std::unique_ptr<Timer>& timer = release_timers_[port];
  timer.reset(new Timer(loop_));
  timer->expires_after(config_.release_grace);
  timer->async_wait([this, port](const boost::system::error_code& error_code) {
    if (error_code == boost::asio::error::operation_aborted) {
      return;
    }
    HandleRelease(port, error_code);
  });
}

void PortAllocator::HandleRelease(uint16_t port,
                                  const boost::system::error_code& error_code) {
  CHECK(!error_code) << error_code.message();
  reserved_[port - config_.range_begin] = false;
  release_timers_.erase(port);
  VLOG(1) << "Port " << port << " released";
}

}
