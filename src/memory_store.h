#ifndef SANDBOXD_MEMORY_STORE_H
#define SANDBOXD_MEMORY_STORE_H

#include <map>
#include "kv_store.h"

namespace sandboxd {

// In-process store with expiring keys, for single instance deployments.
class MemoryStore : public KeyValueStore {
 public:
  explicit MemoryStore(EventLoop& loop);

  void Get(const std::string& key,
           ResultHandler<Optional<std::string>> handler) override;
  void SetWithTtl(const std::string& key,
                  const std::string& value,
                  std::chrono::milliseconds ttl,
                  StatusHandler handler) override;
  void Delete(const std::string& key, ResultHandler<bool> handler) override;
  void ScanPrefix(const std::string& prefix,
                  ResultHandler<KeyValues> handler) override;

  std::size_t size();

 private:
  struct Entry {
    std::string value;
    TimePoint expires_at;
  };

  void Expire();

  EventLoop& loop_;
  std::map<std::string, Entry> entries_;
};

}

#endif //SANDBOXD_MEMORY_STORE_H
