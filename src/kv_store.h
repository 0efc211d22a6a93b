#ifndef SANDBOXD_KV_STORE_H
#define SANDBOXD_KV_STORE_H

#include <chrono>
#include <string>
#include <utility>
#include <vector>
#include "shim.h"
#include "status.h"

namespace sandboxd {

using KeyValues = std::vector<std::pair<std::string, std::string>>;

// Durable key-value store. Handlers run on the event loop, never inline. An
// unreachable store fails with errc::infrastructure.
class KeyValueStore {
 public:
  virtual ~KeyValueStore() = default;

  virtual void Get(const std::string& key,
                   ResultHandler<Optional<std::string>> handler) = 0;
  virtual void SetWithTtl(const std::string& key,
                          const std::string& value,
                          std::chrono::milliseconds ttl,
                          StatusHandler handler) = 0;
  // Completes with whether the key existed.
  virtual void Delete(const std::string& key, ResultHandler<bool> handler) = 0;
  virtual void ScanPrefix(const std::string& prefix,
                          ResultHandler<KeyValues> handler) = 0;

  KeyValueStore() = default;
  KeyValueStore(const KeyValueStore&) = delete;
  KeyValueStore& operator=(const KeyValueStore&) = delete;
};

}

#endif //SANDBOXD_KV_STORE_H
