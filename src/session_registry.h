#ifndef SANDBOXD_SESSION_REGISTRY_H
#define SANDBOXD_SESSION_REGISTRY_H

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "kv_store.h"
#include "session.h"

namespace sandboxd {

// Owns session records. Every record lives in the durable store under
// "session:<id>" with a TTL refreshed on each write, and in an in-process map
// that serves reads whenever the store is unreachable. Store failures are
// logged and never reach the caller. Writes and deletes the store missed are
// replayed after its next successful reply. Until then the in-process state
// wins over the store.
class SessionRegistry {
 public:
  using NowFunction = std::function<int64_t()>;
  // Called for each expired session; |done| continues the sweep.
  using ExpiryHandler = std::function<void(const Session&, Callback done)>;

  SessionRegistry(KeyValueStore& store, std::chrono::milliseconds ttl);
  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  // Assigns an id when |session| has none and stamps both timestamps.
  void Create(Session session, ResultHandler<Session> handler);

  // Fails with errc::not_found.
  void Get(const std::string& id, ResultHandler<Session> handler);

  // Fails with errc::not_found, or errc::validation for a status change the
  // state machine does not allow. Refreshes lastAccessedAt.
  void Update(const std::string& id,
              const SessionPatch& patch,
              ResultHandler<Session> handler);

  // Completes with whether a record existed. Never fails.
  void Destroy(const std::string& id, ResultHandler<bool> handler);

  // Sessions owned by |client_id|, or all of them, oldest first.
  void List(const Optional<std::string>& client_id,
            ResultHandler<std::vector<Session>> handler);

  // Hands every session idle for longer than |max_age| to |on_expired|, one
  // at a time. Completes with the number of expired sessions.
  void SweepExpired(std::chrono::milliseconds max_age,
                    ExpiryHandler on_expired,
                    ResultHandler<std::size_t> done);

  void set_now_function(NowFunction now) { now_ = std::move(now); }
  std::chrono::milliseconds ttl() const { return ttl_; }
  std::size_t cached_count() const { return cache_.size(); }
  // Writes and deletes not yet applied to the store.
  std::size_t pending_count() const { return dirty_.size() + deleted_.size(); }

  static std::string KeyFor(const std::string& id);

 private:
  void Store(const Session& session, Callback done);
  void Resync();
  void ExpireNext(std::shared_ptr<std::vector<Session>> expired,
                  std::size_t index,
                  ExpiryHandler on_expired,
                  ResultHandler<std::size_t> done);

  KeyValueStore& store_;
  const std::chrono::milliseconds ttl_;
  std::map<std::string, Session> cache_;
  // Ids whose latest write failed, with the sequence number of that write.
  std::map<std::string, uint64_t> dirty_;
  // Ids destroyed while the store could not delete them.
  std::set<std::string> deleted_;
  uint64_t write_seq_ = 0;
  bool resyncing_ = false;
  NowFunction now_;
};

}

#endif //SANDBOXD_SESSION_REGISTRY_H
