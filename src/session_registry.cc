#include "session_registry.h"

#include <glog/logging.h>
#include <algorithm>
#include "util.h"

namespace sandboxd {

namespace {

const char kKeyPrefix[] = "session:";

}

SessionRegistry::SessionRegistry(KeyValueStore& store,
                                 std::chrono::milliseconds ttl)
    : store_(store), ttl_(ttl), now_(&NowMillis) {}

std::string SessionRegistry::KeyFor(const std::string& id) {
  return kKeyPrefix + id;
}

void SessionRegistry::Store(const Session& session, Callback done) {
  cache_[session.id] = session;
  deleted_.erase(session.id);
  uint64_t seq = ++write_seq_;
  std::string id = session.id;
  store_.SetWithTtl(KeyFor(id), SessionToRecord(session).dump(), ttl_,
                    [this, id, seq, done](const Status& status) {
                      auto dirty = dirty_.find(id);
                      if (status.ok()) {
                        if (dirty != dirty_.end() && dirty->second <= seq) {
                          dirty_.erase(dirty);
                        }
                        Resync();
                      } else {
                        LOG(WARNING) << "Failed to persist session " << id
                                     << ": " << status;
                        if (cache_.count(id) &&
                            (dirty == dirty_.end() || dirty->second < seq)) {
                          dirty_[id] = seq;
                        }
                      }
                      done();
                    });
}

void SessionRegistry::Resync() {
  if (resyncing_ || (dirty_.empty() && deleted_.empty())) {
    return;
  }
  resyncing_ = true;
  LOG(INFO) << "Session store is back, replaying " << dirty_.size()
            << " writes and " << deleted_.size() << " deletes";
  auto pending = std::make_shared<std::size_t>(dirty_.size() + deleted_.size());
  auto finish = [this, pending]() {
    if (--*pending == 0) {
      resyncing_ = false;
    }
  };
  std::vector<std::string> deleted(deleted_.begin(), deleted_.end());
  for (const std::string& id : deleted) {
    store_.Delete(KeyFor(id), [this, id, finish](const Status& status, bool) {
      if (status.ok() && !cache_.count(id)) {
        deleted_.erase(id);
      }
      finish();
    });
  }
  std::map<std::string, uint64_t> dirty = dirty_;
  for (const auto& entry : dirty) {
    std::string id = entry.first;
    uint64_t seq = entry.second;
    auto cached = cache_.find(id);
    if (cached == cache_.end()) {
      dirty_.erase(id);
      finish();
      continue;
    }
    store_.SetWithTtl(
        KeyFor(id), SessionToRecord(cached->second).dump(), ttl_,
        [this, id, seq, finish](const Status& status) {
          auto current = dirty_.find(id);
          if (status.ok() && current != dirty_.end() &&
              current->second == seq) {
            dirty_.erase(current);
          }
          finish();
        });
  }
}

void SessionRegistry::Create(Session session, ResultHandler<Session> handler) {
  if (session.id.empty()) {
    session.id = RandomId();
  }
  session.created_at = now_();
  session.last_accessed_at = session.created_at;
  Store(session, [session, handler]() {
    LOG(INFO) << "Created session " << session.id << " for client "
              << session.client_id;
    handler(Status(), session);
  });
}

void SessionRegistry::Get(const std::string& id,
                          ResultHandler<Session> handler) {
  store_.Get(KeyFor(id), [this, id, handler](const Status& status,
                                             Optional<std::string> value) {
    if (!status.ok()) {
      LOG(WARNING) << "Session store unavailable, reading " << id
                   << " from memory: " << status;
    } else {
      Resync();
    }
    if (deleted_.count(id)) {
      handler(Status(errc::not_found, "session " + id + " not found"),
              Session());
      return;
    }
    if (status.ok() && value && !dirty_.count(id)) {
      Session session;
      nlohmann::json record = nlohmann::json::parse(*value, nullptr, false);
      if (SessionFromRecord(record, &session)) {
        cache_[id] = session;
        handler(Status(), session);
        return;
      }
      LOG(WARNING) << "Ignoring malformed record for session " << id;
    }
    auto iter = cache_.find(id);
    if (iter == cache_.end()) {
      handler(Status(errc::not_found, "session " + id + " not found"),
              Session());
      return;
    }
    handler(Status(), iter->second);
  });
}

void SessionRegistry::Update(const std::string& id,
                             const SessionPatch& patch,
                             ResultHandler<Session> handler) {
  Get(id, [this, patch, handler](const Status& status, Session session) {
    if (!status.ok()) {
      handler(status, Session());
      return;
    }
    if (patch.status) {
      if (!IsValidTransition(session.status, *patch.status)) {
        handler(Status(errc::validation,
                       std::string("invalid session transition ") +
                           SessionStatusName(session.status) + " -> " +
                           SessionStatusName(*patch.status)),
                Session());
        return;
      }
      if (session.status != *patch.status) {
        VLOG(1) << "Session " << session.id << " "
                << SessionStatusName(session.status) << " -> "
                << SessionStatusName(*patch.status);
      }
      session.status = *patch.status;
    }
    if (patch.endpoints) {
      session.endpoints = *patch.endpoints;
    }
    if (patch.clear_sandbox) {
      session.sandbox = boost::none;
    }
    if (patch.sandbox) {
      session.sandbox = patch.sandbox;
    }
    session.last_accessed_at = now_();
    Store(session, [session, handler]() { handler(Status(), session); });
  });
}

void SessionRegistry::Destroy(const std::string& id,
                              ResultHandler<bool> handler) {
  bool cached = cache_.erase(id) > 0;
  bool pending = deleted_.count(id) > 0;
  dirty_.erase(id);
  store_.Delete(KeyFor(id), [this, id, cached, pending, handler](
      const Status& status, bool existed) {
    if (status.ok()) {
      deleted_.erase(id);
      Resync();
    } else {
      LOG(WARNING) << "Failed to delete session " << id << " from store: "
                   << status;
      if (cached || pending) {
        deleted_.insert(id);
      }
    }
    // A record left behind by an earlier failed delete is already destroyed.
    bool destroyed = cached || (existed && !pending);
    if (destroyed) {
      LOG(INFO) << "Session " << id << " destroyed";
    }
    handler(Status(), destroyed);
  });
}

void SessionRegistry::List(const Optional<std::string>& client_id,
                           ResultHandler<std::vector<Session>> handler) {
  store_.ScanPrefix(kKeyPrefix, [this, client_id, handler](
      const Status& status, KeyValues values) {
    std::map<std::string, Session> merged;
    if (status.ok()) {
      for (const auto& value : values) {
        Session session;
        nlohmann::json record =
            nlohmann::json::parse(value.second, nullptr, false);
        if (!SessionFromRecord(record, &session)) {
          LOG(WARNING) << "Ignoring malformed record " << value.first;
          continue;
        }
        merged[session.id] = std::move(session);
      }
      Resync();
    } else {
      LOG(WARNING) << "Session store unavailable, listing from memory: "
                   << status;
    }
    // Covers records the store already expired.
    merged.insert(cache_.begin(), cache_.end());
    for (const auto& dirty : dirty_) {
      auto cached = cache_.find(dirty.first);
      if (cached != cache_.end()) {
        merged[dirty.first] = cached->second;
      }
    }
    for (const std::string& id : deleted_) {
      merged.erase(id);
    }

    std::vector<Session> sessions;
    for (auto& entry : merged) {
      if (!client_id || entry.second.client_id == *client_id) {
        sessions.push_back(std::move(entry.second));
      }
    }
    std::stable_sort(sessions.begin(), sessions.end(),
                     [](const Session& a, const Session& b) {
                       return a.created_at < b.created_at;
                     });
    handler(Status(), std::move(sessions));
  });
}

void SessionRegistry::SweepExpired(std::chrono::milliseconds max_age,
                                   ExpiryHandler on_expired,
                                   ResultHandler<std::size_t> done) {
  List(boost::none, [this, max_age, on_expired, done](
      const Status& status, std::vector<Session> sessions) {
    if (!status.ok()) {
      done(status, 0);
      return;
    }
    int64_t now = now_();
    auto expired = std::make_shared<std::vector<Session>>();
    for (Session& session : sessions) {
      if (now - session.last_accessed_at > max_age.count()) {
        expired->push_back(std::move(session));
      }
    }
    ExpireNext(expired, 0, on_expired, done);
  });
}

void SessionRegistry::ExpireNext(std::shared_ptr<std::vector<Session>> expired,
                                 std::size_t index,
                                 ExpiryHandler on_expired,
                                 ResultHandler<std::size_t> done) {
  if (index == expired->size()) {
    if (!expired->empty()) {
      LOG(INFO) << "Expired " << expired->size() << " idle sessions";
    }
    done(Status(), expired->size());
    return;
  }
  const Session& session = (*expired)[index];
  LOG(INFO) << "Cleaning up expired session " << session.id;
  on_expired(session, [this, expired, index, on_expired, done]() {
    ExpireNext(expired, index + 1, on_expired, done);
  });
}

}
