#ifndef SANDBOXD_POOL_MANAGER_H
#define SANDBOXD_POOL_MANAGER_H

#include <deque>
#include <map>
#include <ostream>
#include <string>
#include <vector>
#include "background_queue.h"
#include "sandbox_controller.h"

namespace sandboxd {

struct PoolKey {
  SandboxType type = SandboxType::kExecution;
  // Empty for types that are not language specific.
  std::string language;

  bool operator<(const PoolKey& other) const {
    return type != other.type ? type < other.type : language < other.language;
  }
};

std::ostream& operator<<(std::ostream& out, const PoolKey& key);

// Standing supply of started, unassigned sandboxes per key. Pool hits only
// save latency, callers fall back to SandboxController on a miss.
class PoolManager {
 public:
  PoolManager(SandboxController& controller,
              BackgroundQueue& background,
              std::size_t target_size);
  PoolManager(const PoolManager&) = delete;
  PoolManager& operator=(const PoolManager&) = delete;

  void AddPool(const PoolKey& key);

  // Fills every pool to the target size, one pool after another. A creation
  // failure stops filling that pool and is logged.
  void Initialize(Callback done);

  // Pops a ready sandbox and starts replenishing in the background.
  Optional<SandboxHandle> Acquire(const PoolKey& key);

  // Drops entries that are no longer running, then tops every pool up.
  void Maintain(Callback done);

  // Destroys every pooled sandbox and stops replenishing.
  void Drain(Callback done);

  std::size_t ready_count(const PoolKey& key) const;
  std::size_t in_flight_count(const PoolKey& key) const;
  std::vector<PoolKey> keys() const;
  std::size_t target_size() const { return target_size_; }

 private:
  struct Pool {
    std::deque<SandboxHandle> ready;
    // Creations started and not yet completed.
    std::size_t in_flight = 0;
  };

  void Fill(const PoolKey& key, StatusHandler done);
  void FillAll(std::shared_ptr<std::vector<PoolKey>> keys,
               std::size_t index,
               Callback done);
  void Replenish(const PoolKey& key);
  void Evict(const PoolKey& key, const std::string& id);

  SandboxController& controller_;
  BackgroundQueue& background_;
  const std::size_t target_size_;
  std::map<PoolKey, Pool> pools_;
  bool draining_ = false;
};

}

#endif //SANDBOXD_POOL_MANAGER_H
