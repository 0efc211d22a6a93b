#include <gtest/gtest.h>
#include <boost/asio/post.hpp>
#include "fake_runtime.h"
#include "memory_store.h"
#include "session_registry.h"

namespace sandboxd {
namespace {

using std::chrono::milliseconds;

// A store whose backend is down.
class UnreachableStore : public KeyValueStore {
 public:
  explicit UnreachableStore(EventLoop& loop) : loop_(loop) {}

  void Get(const std::string& key,
           ResultHandler<Optional<std::string>> handler) override {
    boost::asio::post(loop_, [handler]() {
      handler(Status(errc::infrastructure, "store down"), boost::none);
    });
  }

  void SetWithTtl(const std::string& key,
                  const std::string& value,
                  std::chrono::milliseconds ttl,
                  StatusHandler handler) override {
    boost::asio::post(loop_, [handler]() {
      handler(Status(errc::infrastructure, "store down"));
    });
  }

  void Delete(const std::string& key, ResultHandler<bool> handler) override {
    boost::asio::post(loop_, [handler]() {
      handler(Status(errc::infrastructure, "store down"), false);
    });
  }

  void ScanPrefix(const std::string& prefix,
                  ResultHandler<KeyValues> handler) override {
    boost::asio::post(loop_, [handler]() {
      handler(Status(errc::infrastructure, "store down"), KeyValues());
    });
  }

 private:
  EventLoop& loop_;
};

// Forwards to a MemoryStore, or fails like UnreachableStore while down.
class FlakyStore : public KeyValueStore {
 public:
  explicit FlakyStore(EventLoop& loop) : backend(loop), outage_(loop) {}

  void Get(const std::string& key,
           ResultHandler<Optional<std::string>> handler) override {
    if (down) {
      outage_.Get(key, handler);
    } else {
      backend.Get(key, handler);
    }
  }

  void SetWithTtl(const std::string& key,
                  const std::string& value,
                  std::chrono::milliseconds ttl,
                  StatusHandler handler) override {
    if (down) {
      outage_.SetWithTtl(key, value, ttl, handler);
    } else {
      backend.SetWithTtl(key, value, ttl, handler);
    }
  }

  void Delete(const std::string& key, ResultHandler<bool> handler) override {
    if (down) {
      outage_.Delete(key, handler);
    } else {
      backend.Delete(key, handler);
    }
  }

  void ScanPrefix(const std::string& prefix,
                  ResultHandler<KeyValues> handler) override {
    if (down) {
      outage_.ScanPrefix(prefix, handler);
    } else {
      backend.ScanPrefix(prefix, handler);
    }
  }

  MemoryStore backend;
  bool down = false;

 private:
  UnreachableStore outage_;
};

template <typename StoreType>
class RegistryFixture : public ::testing::Test {
 protected:
  RegistryFixture()
      : store_(loop_), registry_(store_, milliseconds(60000)) {
    registry_.set_now_function([this]() { return now_; });
  }

  Session CreateSession(const std::string& client_id) {
    Session session;
    session.language = "python";
    session.memory = "5g";
    session.client_id = client_id;
    Session created;
    bool done = false;
    registry_.Create(session, [&](const Status& status, Session result) {
      EXPECT_TRUE(status.ok()) << status;
      created = result;
      done = true;
    });
    EXPECT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
    return created;
  }

  Status Update(const std::string& id, const SessionPatch& patch,
                Session* updated = nullptr) {
    Status result;
    bool done = false;
    registry_.Update(id, patch, [&](const Status& status, Session session) {
      result = status;
      if (updated) {
        *updated = session;
      }
      done = true;
    });
    EXPECT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
    return result;
  }

  Status Get(const std::string& id, Session* session) {
    Status result;
    bool done = false;
    registry_.Get(id, [&](const Status& status, Session found) {
      result = status;
      *session = found;
      done = true;
    });
    EXPECT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
    return result;
  }

  bool Destroy(const std::string& id) {
    bool existed = false;
    bool done = false;
    registry_.Destroy(id, [&](const Status& status, bool result) {
      EXPECT_TRUE(status.ok());
      existed = result;
      done = true;
    });
    EXPECT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
    return existed;
  }

  std::vector<Session> List(const Optional<std::string>& client_id) {
    std::vector<Session> sessions;
    bool done = false;
    registry_.List(client_id, [&](const Status& status,
                                  std::vector<Session> result) {
      EXPECT_TRUE(status.ok());
      sessions = result;
      done = true;
    });
    EXPECT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
    return sessions;
  }

  EventLoop loop_;
  StoreType store_;
  SessionRegistry registry_;
  int64_t now_ = 1000000;
};

using SessionRegistryTest = RegistryFixture<MemoryStore>;
using SessionRegistryOutageTest = RegistryFixture<FlakyStore>;

TEST_F(SessionRegistryTest, CreateAssignsIdAndTimestamps) {
  Session session = CreateSession("alice");
  EXPECT_FALSE(session.id.empty());
  EXPECT_EQ(SessionStatus::kCreating, session.status);
  EXPECT_EQ(now_, session.created_at);
  EXPECT_EQ(now_, session.last_accessed_at);
  EXPECT_NE(session.id, CreateSession("alice").id);
  EXPECT_EQ(2u, store_.size());
}

TEST_F(SessionRegistryTest, UpdateFollowsTheStateMachine) {
  Session session = CreateSession("alice");
  SandboxHandle handle;
  handle.id = "container-1";
  SessionPatch ready;
  ready.status = SessionStatus::kReady;
  ready.sandbox = handle;
  ready.endpoints = std::map<std::string, std::string>{{"url", "http://x"}};
  now_ += 500;
  Session updated;
  ASSERT_TRUE(Update(session.id, ready, &updated).ok());
  EXPECT_EQ(SessionStatus::kReady, updated.status);
  EXPECT_EQ(now_, updated.last_accessed_at);
  EXPECT_EQ(session.created_at, updated.created_at);
  ASSERT_TRUE(updated.sandbox);
  EXPECT_EQ("container-1", updated.sandbox->id);

  SessionPatch creating;
  creating.status = SessionStatus::kCreating;
  Status status = Update(session.id, creating);
  EXPECT_TRUE(status.Is(errc::validation));
  EXPECT_EQ("invalid session transition ready -> creating", status.reason());

  Session stored;
  ASSERT_TRUE(Get(session.id, &stored).ok());
  EXPECT_EQ(SessionStatus::kReady, stored.status);
  EXPECT_EQ("http://x", stored.endpoints["url"]);
}

TEST_F(SessionRegistryTest, ClearSandbox) {
  Session session = CreateSession("alice");
  SessionPatch attach;
  attach.sandbox = SandboxHandle();
  attach.sandbox->id = "container-1";
  ASSERT_TRUE(Update(session.id, attach).ok());
  SessionPatch clear;
  clear.clear_sandbox = true;
  Session updated;
  ASSERT_TRUE(Update(session.id, clear, &updated).ok());
  EXPECT_FALSE(updated.sandbox);
}

TEST_F(SessionRegistryTest, MissingSessions) {
  Session session;
  Status status = Get("nope", &session);
  EXPECT_TRUE(status.Is(errc::not_found));
  EXPECT_EQ("session nope not found", status.reason());
  EXPECT_TRUE(Update("nope", SessionPatch()).Is(errc::not_found));
}

TEST_F(SessionRegistryTest, DestroyTwice) {
  Session session = CreateSession("alice");
  EXPECT_TRUE(Destroy(session.id));
  EXPECT_FALSE(Destroy(session.id));
  Session found;
  EXPECT_TRUE(Get(session.id, &found).Is(errc::not_found));
  EXPECT_EQ(0u, registry_.cached_count());
}

TEST_F(SessionRegistryTest, ListFiltersByClientOldestFirst) {
  Session first = CreateSession("alice");
  now_ += 10;
  Session second = CreateSession("bob");
  now_ += 10;
  Session third = CreateSession("alice");

  std::vector<Session> all = List(boost::none);
  ASSERT_EQ(3u, all.size());
  EXPECT_EQ(first.id, all[0].id);
  EXPECT_EQ(second.id, all[1].id);
  EXPECT_EQ(third.id, all[2].id);

  std::vector<Session> alice = List(std::string("alice"));
  ASSERT_EQ(2u, alice.size());
  EXPECT_EQ(first.id, alice[0].id);
  EXPECT_EQ(third.id, alice[1].id);
  EXPECT_TRUE(List(std::string("carol")).empty());
}

TEST_F(SessionRegistryTest, SweepExpiredVisitsIdleSessions) {
  Session stale = CreateSession("alice");
  now_ += 5000;
  Session fresh = CreateSession("alice");
  now_ += 2000;

  std::vector<std::string> visited;
  std::size_t expired = 0;
  bool done = false;
  registry_.SweepExpired(
      milliseconds(3000),
      [&](const Session& session, Callback next) {
        visited.push_back(session.id);
        registry_.Destroy(session.id,
                          [next](const Status&, bool) { next(); });
      },
      [&](const Status& status, std::size_t count) {
        EXPECT_TRUE(status.ok());
        expired = count;
        done = true;
      });
  ASSERT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
  EXPECT_EQ(1u, expired);
  ASSERT_EQ(1u, visited.size());
  EXPECT_EQ(stale.id, visited[0]);
  ASSERT_EQ(1u, List(boost::none).size());
}

TEST(SessionRegistryFallbackTest, ServesFromMemoryWhenStoreIsDown) {
  EventLoop loop;
  UnreachableStore store(loop);
  SessionRegistry registry(store, milliseconds(60000));

  Session created;
  bool done = false;
  Session session;
  session.client_id = "alice";
  registry.Create(session, [&](const Status& status, Session result) {
    EXPECT_TRUE(status.ok());
    created = result;
    done = true;
  });
  ASSERT_TRUE(testing::RunUntil(loop, [&]() { return done; }));

  done = false;
  SessionPatch ready;
  ready.status = SessionStatus::kReady;
  registry.Update(created.id, ready, [&](const Status& status, Session result) {
    EXPECT_TRUE(status.ok()) << status;
    EXPECT_EQ(SessionStatus::kReady, result.status);
    done = true;
  });
  ASSERT_TRUE(testing::RunUntil(loop, [&]() { return done; }));

  done = false;
  registry.List(std::string("alice"), [&](const Status& status,
                                          std::vector<Session> sessions) {
    EXPECT_TRUE(status.ok());
    ASSERT_EQ(1u, sessions.size());
    EXPECT_EQ(SessionStatus::kReady, sessions[0].status);
    done = true;
  });
  ASSERT_TRUE(testing::RunUntil(loop, [&]() { return done; }));

  done = false;
  registry.Destroy(created.id, [&](const Status& status, bool existed) {
    EXPECT_TRUE(status.ok());
    EXPECT_TRUE(existed);
    done = true;
  });
  ASSERT_TRUE(testing::RunUntil(loop, [&]() { return done; }));
}

TEST_F(SessionRegistryOutageTest, DestroyedSessionsStayDestroyed) {
  Session session = CreateSession("alice");
  store_.down = true;
  EXPECT_TRUE(Destroy(session.id));
  EXPECT_EQ(1u, registry_.pending_count());
  store_.down = false;

  // The store still holds the record until the delete is replayed.
  Session found;
  EXPECT_TRUE(Get(session.id, &found).Is(errc::not_found));
  EXPECT_TRUE(List(boost::none).empty());
  EXPECT_FALSE(Destroy(session.id));
  EXPECT_TRUE(testing::RunUntil(loop_, [&]() {
    return registry_.pending_count() == 0;
  }));
  EXPECT_EQ(0u, store_.backend.size());
  EXPECT_TRUE(Get(session.id, &found).Is(errc::not_found));
}

TEST_F(SessionRegistryOutageTest, WritesMissedByTheStoreWin) {
  Session session = CreateSession("alice");
  store_.down = true;
  SessionPatch ready;
  ready.status = SessionStatus::kReady;
  ASSERT_TRUE(Update(session.id, ready).ok());
  EXPECT_EQ(1u, registry_.pending_count());
  store_.down = false;

  Session found;
  ASSERT_TRUE(Get(session.id, &found).ok());
  EXPECT_EQ(SessionStatus::kReady, found.status);
  std::vector<Session> sessions = List(boost::none);
  ASSERT_EQ(1u, sessions.size());
  EXPECT_EQ(SessionStatus::kReady, sessions[0].status);

  EXPECT_TRUE(testing::RunUntil(loop_, [&]() {
    return registry_.pending_count() == 0;
  }));
  bool done = false;
  store_.backend.Get(SessionRegistry::KeyFor(session.id),
                      [&](const Status& status, Optional<std::string> value) {
                        ASSERT_TRUE(status.ok());
                        ASSERT_TRUE(value);
                        Session stored;
                        ASSERT_TRUE(SessionFromRecord(
                            nlohmann::json::parse(*value), &stored));
                        EXPECT_EQ(SessionStatus::kReady, stored.status);
                        done = true;
                      });
  ASSERT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
}

}
}
