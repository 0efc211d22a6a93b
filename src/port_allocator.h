#ifndef SANDBOXD_PORT_ALLOCATOR_H
#define SANDBOXD_PORT_ALLOCATOR_H

#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <unordered_map>
#include <vector>
#include "config.h"
#include "shim.h"

namespace sandboxd {

// Availability cache over a fixed host port range. A port handed out stays
// reserved for the grace window, then becomes available again.
class PortAllocator {
 public:
  using BindProbe = std::function<bool(uint16_t)>;

  PortAllocator(EventLoop& loop, const PortConfig& config);
  PortAllocator(const PortAllocator&) = delete;
  PortAllocator& operator=(const PortAllocator&) = delete;

  // Scans forward from |range_start| for a cached-available, bindable port and
  // reserves it. Falls back to a random port in the scan window.
  uint16_t FindAvailablePort(uint16_t range_start);

  bool IsReserved(uint16_t port) const;
  std::size_t reserved_count() const;

  void set_bind_probe(BindProbe probe) { bind_probe_ = std::move(probe); }

  static bool IsBindable(uint16_t port);

 private:
  bool InRange(uint16_t port) const;
  void Reserve(uint16_t port);
  void HandleRelease(uint16_t port, const boost::system::error_code& error_code);

  EventLoop& loop_;
  const PortConfig config_;
  std::vector<bool> reserved_;
  std::unordered_map<uint16_t, std::unique_ptr<Timer>> release_timers_;
  BindProbe bind_probe_;
  std::mt19937 random_;
};

}

#endif //SANDBOXD_PORT_ALLOCATOR_H
