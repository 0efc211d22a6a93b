#include "memory_store.h"

#include <boost/asio/post.hpp>

namespace sandboxd {

MemoryStore::MemoryStore(EventLoop& loop) : loop_(loop) {}

void MemoryStore::Expire() {
  TimePoint now = Clock::now();
  for (auto iter = entries_.begin(); iter != entries_.end();) {
    if (iter->second.expires_at <= now) {
      iter = entries_.erase(iter);
    } else {
      ++iter;
    }
  }
}

std::size_t MemoryStore::size() {
  Expire();
  return entries_.size();
}

void MemoryStore::Get(const std::string& key,
                      ResultHandler<Optional<std::string>> handler) {
  Expire();
  Optional<std::string> value;
  auto iter = entries_.find(key);
  if (iter != entries_.end()) {
    value = iter->second.value;
  }
  boost::asio::post(loop_, [handler, value]() { handler(Status(), value); });
}

void MemoryStore::SetWithTtl(const std::string& key,
                             const std::string& value,
                             std::chrono::milliseconds ttl,
                             StatusHandler handler) {
  entries_[key] = Entry{value, Clock::now() + ttl};
  boost::asio::post(loop_, [handler]() { handler(Status()); });
}

void MemoryStore::Delete(const std::string& key, ResultHandler<bool> handler) {
  Expire();
  bool existed = entries_.erase(key) > 0;
  boost::asio::post(loop_, [handler, existed]() { handler(Status(), existed); });
}

void MemoryStore::ScanPrefix(const std::string& prefix,
                             ResultHandler<KeyValues> handler) {
  Expire();
  KeyValues matches;
  for (auto iter = entries_.lower_bound(prefix);
       iter != entries_.end() && iter->first.compare(0, prefix.size(), prefix) == 0;
       ++iter) {
    matches.emplace_back(iter->first, iter->second.value);
  }
  boost::asio::post(loop_, [handler, matches]() { handler(Status(), matches); });
}

}
