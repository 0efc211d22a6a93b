#include <gtest/gtest.h>
#include <algorithm>
#include "fake_runtime.h"
#include "memory_store.h"
#include "sandbox_service.h"

namespace sandboxd {
namespace {

using std::chrono::milliseconds;
using testing::ExecScript;
using testing::Frame;

class SandboxServiceTest : public ::testing::Test {
 protected:
  SandboxServiceTest()
      : config_(testing::TestConfig(scratch_.path())),
        runtime_(loop_),
        store_(loop_) {
    config_.session_ttl = milliseconds(1000);
    runtime_.exec_script = [this](const ExecSpec& spec) {
      return spec.cmd[0] == "sh" ? script_ : ExecScript();
    };
    script_.chunks = {Frame(1, "4\n")};
  }

  void MakeService() {
    service_.reset(new SandboxService(loop_, config_, runtime_, store_));
    service_->ports().set_bind_probe([](uint16_t) { return true; });
  }

  Status Initialize() {
    Status result;
    bool done = false;
    service_->Initialize([&](const Status& status) {
      result = status;
      done = true;
    });
    EXPECT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
    return result;
  }

  void Start() {
    MakeService();
    ASSERT_TRUE(Initialize().ok());
  }

  Status Create(const CreateSessionParams& params, Session* session) {
    Status result;
    bool done = false;
    service_->CreateSession(params, [&](const Status& status, Session created) {
      result = status;
      *session = created;
      done = true;
    });
    EXPECT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
    return result;
  }

  Session CreatePython() {
    Session session;
    CreateSessionParams params;
    params.client_id = "alice";
    Status status = Create(params, &session);
    EXPECT_TRUE(status.ok()) << status;
    return session;
  }

  Status Execute(const ExecutionRequest& request, ExecutionResult* result) {
    Status outcome;
    bool done = false;
    service_->ExecuteCode(request, [&](const Status& status,
                                       ExecutionResult executed) {
      outcome = status;
      *result = executed;
      done = true;
    });
    EXPECT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
    return outcome;
  }

  Status Destroy(const std::string& id, bool* existed) {
    Status result;
    bool done = false;
    service_->DestroySession(id, [&](const Status& status, bool destroyed) {
      result = status;
      *existed = destroyed;
      done = true;
    });
    EXPECT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
    return result;
  }

  Status Get(const std::string& id, Session* session) {
    Status result;
    bool done = false;
    service_->GetSession(id, [&](const Status& status, Session found) {
      result = status;
      *session = found;
      done = true;
    });
    EXPECT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
    return result;
  }

  std::vector<Session> List() {
    std::vector<Session> sessions;
    bool done = false;
    service_->ListSessions(boost::none, [&](const Status& status,
                                            std::vector<Session> found) {
      EXPECT_TRUE(status.ok());
      sessions = found;
      done = true;
    });
    EXPECT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
    return sessions;
  }

  void Settle() {
    ASSERT_TRUE(testing::RunUntil(
        loop_, [this]() { return service_->background().pending() == 0; }));
  }

  static ExecutionRequest Request(const std::string& session_id) {
    ExecutionRequest request;
    request.session_id = session_id;
    request.language = "python";
    request.code = "print(2+2)";
    request.client_id = "alice";
    return request;
  }

  EventLoop loop_;
  testing::ScratchDir scratch_;
  Config config_;
  testing::FakeRuntime runtime_;
  MemoryStore store_;
  ExecScript script_;
  std::unique_ptr<SandboxService> service_;
};

TEST_F(SandboxServiceTest, InitializeFailsWithoutRuntime) {
  runtime_.ping_status = Status(errc::infrastructure, "connection refused");
  MakeService();
  Status status = Initialize();
  EXPECT_TRUE(status.Is(errc::infrastructure));
  EXPECT_EQ("container runtime unreachable: connection refused", status.reason());
  EXPECT_FALSE(service_->initialized());
  EXPECT_EQ(0, runtime_.create_count);
}

TEST_F(SandboxServiceTest, ReclaimsOrphansBeforeFillingPools) {
  config_.pool_size = 1;
  config_.pool_languages = {"python"};
  std::string orphan = runtime_.AddOrphan(config_.SessionLabel());
  Start();
  EXPECT_TRUE(service_->initialized());

  auto removed = std::find(runtime_.events.begin(), runtime_.events.end(),
                           "remove:" + orphan);
  auto created = std::find_if(runtime_.events.begin(), runtime_.events.end(),
                              [](const std::string& event) {
                                return event.compare(0, 7, "create:") == 0;
                              });
  ASSERT_NE(runtime_.events.end(), removed);
  ASSERT_NE(runtime_.events.end(), created);
  EXPECT_LT(std::distance(runtime_.events.begin(), removed),
            std::distance(runtime_.events.begin(), created));
  EXPECT_EQ(0u, runtime_.containers.count(orphan));
  EXPECT_EQ(1u, service_->pool().ready_count(PoolKey{SandboxType::kExecution, "python"}));
}

TEST_F(SandboxServiceTest, SessionLifecycle) {
  Start();
  Session session = CreatePython();
  EXPECT_EQ(SessionStatus::kReady, session.status);
  ASSERT_TRUE(session.sandbox);
  EXPECT_EQ("alice", session.client_id);
  EXPECT_TRUE(runtime_.containers.at(session.sandbox->id).running);

  ExecutionResult result;
  Status status = Execute(Request(session.id), &result);
  ASSERT_TRUE(status.ok()) << status;
  EXPECT_EQ("4", result.stdout_text);
  EXPECT_EQ(0, result.exit_code);

  Session after;
  ASSERT_TRUE(Get(session.id, &after).ok());
  EXPECT_EQ(SessionStatus::kReady, after.status);
  EXPECT_GE(after.last_accessed_at, session.last_accessed_at);

  bool existed = false;
  ASSERT_TRUE(Destroy(session.id, &existed).ok());
  EXPECT_TRUE(existed);
  EXPECT_TRUE(runtime_.containers.empty());
  ASSERT_TRUE(Destroy(session.id, &existed).ok());
  EXPECT_FALSE(existed);
  EXPECT_TRUE(Get(session.id, &after).Is(errc::not_found));
}

TEST_F(SandboxServiceTest, ConcurrentDestroysShareTheOutcome) {
  Start();
  Session session = CreatePython();
  int completions = 0;
  for (int i = 0; i < 2; ++i) {
    service_->DestroySession(session.id, [&](const Status& status, bool existed) {
      EXPECT_TRUE(status.ok());
      EXPECT_TRUE(existed);
      ++completions;
    });
  }
  ASSERT_TRUE(testing::RunUntil(loop_, [&]() { return completions == 2; }));
  int removes = std::count(runtime_.events.begin(), runtime_.events.end(),
                           "remove:" + session.sandbox->id);
  EXPECT_EQ(1, removes);
}

TEST_F(SandboxServiceTest, DestroyFailureKeepsTheSession) {
  Start();
  Session session = CreatePython();
  runtime_.remove_status = Status(errc::infrastructure, "engine down");
  bool existed = true;
  EXPECT_TRUE(Destroy(session.id, &existed).Is(errc::infrastructure));
  Session after;
  ASSERT_TRUE(Get(session.id, &after).ok());
  EXPECT_EQ(SessionStatus::kReady, after.status);
}

TEST_F(SandboxServiceTest, ValidatesSessionParams) {
  Start();
  Session session;
  CreateSessionParams params;
  params.language = "cobol";
  EXPECT_TRUE(Create(params, &session).Is(errc::validation));
  params.language = "python";
  params.memory = "a lot";
  EXPECT_TRUE(Create(params, &session).Is(errc::validation));
  params = CreateSessionParams();
  params.type = SandboxType::kBrowser;
  params.browser = "opera";
  EXPECT_TRUE(Create(params, &session).Is(errc::validation));
  EXPECT_EQ(0, runtime_.create_count);
  EXPECT_TRUE(List().empty());
}

TEST_F(SandboxServiceTest, CreateFailureMarksTheSession) {
  Start();
  runtime_.create_status = Status(errc::infrastructure, "engine down");
  Session session;
  CreateSessionParams params;
  EXPECT_TRUE(Create(params, &session).Is(errc::infrastructure));
  std::vector<Session> sessions = List();
  ASSERT_EQ(1u, sessions.size());
  EXPECT_EQ(SessionStatus::kError, sessions[0].status);
  EXPECT_FALSE(sessions[0].sandbox);
}

TEST_F(SandboxServiceTest, UsesPooledSandboxes) {
  config_.pool_size = 1;
  config_.pool_languages = {"python"};
  Start();
  ASSERT_EQ(1, runtime_.create_count);
  Session session = CreatePython();
  ASSERT_TRUE(session.sandbox);
  EXPECT_TRUE(session.sandbox->prewarmed);

  // Custom limits bypass the pool.
  CreateSessionParams params;
  params.memory = "1g";
  Session custom;
  ASSERT_TRUE(Create(params, &custom).ok());
  EXPECT_FALSE(custom.sandbox->prewarmed);
  EXPECT_EQ(int64_t(1) << 30, custom.sandbox->limits.memory_bytes);
}

TEST_F(SandboxServiceTest, TemporaryExecution) {
  Start();
  ExecutionResult result;
  ASSERT_TRUE(Execute(Request(""), &result).ok());
  EXPECT_EQ("4", result.stdout_text);
  Settle();
  EXPECT_TRUE(runtime_.containers.empty());
  EXPECT_TRUE(List().empty());
}

TEST_F(SandboxServiceTest, RejectsBeforeRunning) {
  Start();
  Session session = CreatePython();
  ExecutionResult result;
  ExecutionRequest request = Request(session.id);
  request.code = "import os\nos.system('ls')";
  EXPECT_TRUE(Execute(request, &result).Is(errc::validation));
  request.code = "";
  EXPECT_TRUE(Execute(request, &result).Is(errc::validation));
  request = Request(session.id);
  request.language = "javascript";
  EXPECT_TRUE(Execute(request, &result).Is(errc::validation));
  EXPECT_TRUE(Execute(Request("missing"), &result).Is(errc::not_found));
  EXPECT_TRUE(runtime_.ProgramExecs().empty());
}

TEST_F(SandboxServiceTest, BusySessionRejectsOverlappingRuns) {
  script_.delay = milliseconds(50);
  Start();
  Session session = CreatePython();
  Status first;
  Status second;
  int done = 0;
  service_->ExecuteCode(Request(session.id), [&](const Status& status,
                                                 ExecutionResult) {
    first = status;
    ++done;
  });
  service_->ExecuteCode(Request(session.id), [&](const Status& status,
                                                 ExecutionResult) {
    second = status;
    ++done;
  });
  ASSERT_TRUE(testing::RunUntil(loop_, [&]() { return done == 2; }));
  EXPECT_TRUE(first.ok()) << first;
  EXPECT_TRUE(second.Is(errc::capacity));
  EXPECT_EQ("session " + session.id + " is busy", second.reason());
  EXPECT_EQ(1u, runtime_.ProgramExecs().size());
}

TEST_F(SandboxServiceTest, ClientRateLimit) {
  config_.security.client_rate_limit_points = 1;
  Start();
  Session session = CreatePython();
  ExecutionResult result;
  ASSERT_TRUE(Execute(Request(session.id), &result).ok());
  Status status = Execute(Request(session.id), &result);
  EXPECT_TRUE(status.Is(errc::capacity));
  ExecutionRequest other = Request(session.id);
  other.client_id = "bob";
  EXPECT_TRUE(Execute(other, &result).ok());
}

TEST_F(SandboxServiceTest, RecoversFromRuntimeFailure) {
  Start();
  Session session = CreatePython();
  std::string old_id = session.sandbox->id;
  runtime_.containers.erase(old_id);

  ExecutionResult result;
  EXPECT_TRUE(Execute(Request(session.id), &result).Is(errc::runtime));
  Session failed;
  ASSERT_TRUE(Get(session.id, &failed).ok());
  EXPECT_EQ(SessionStatus::kError, failed.status);
  EXPECT_TRUE(Execute(Request(session.id), &result).Is(errc::validation));

  Session recovered;
  bool done = false;
  service_->RecoverSession(session.id, [&](const Status& status, Session found) {
    EXPECT_TRUE(status.ok()) << status;
    recovered = found;
    done = true;
  });
  ASSERT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
  EXPECT_EQ(SessionStatus::kReady, recovered.status);
  ASSERT_TRUE(recovered.sandbox);
  EXPECT_NE(old_id, recovered.sandbox->id);
  EXPECT_TRUE(Execute(Request(session.id), &result).ok());

  done = false;
  service_->RecoverSession(session.id, [&](const Status& status, Session) {
    EXPECT_TRUE(status.Is(errc::validation));
    done = true;
  });
  ASSERT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
}

TEST_F(SandboxServiceTest, VSCodeSession) {
  Start();
  Session session;
  bool done = false;
  service_->CreateVSCodeSession(CreateSessionParams(), [&](const Status& status,
                                                           Session created) {
    EXPECT_TRUE(status.ok()) << status;
    session = created;
    done = true;
  });
  ASSERT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
  EXPECT_EQ(SandboxType::kIde, session.type);
  EXPECT_EQ("http://localhost:8080", session.endpoints["url"]);

  std::string url;
  done = false;
  service_->GetVSCodeUrl(session.id, [&](const Status& status, std::string found) {
    EXPECT_TRUE(status.ok());
    url = found;
    done = true;
  });
  ASSERT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
  EXPECT_EQ("http://localhost:8080", url);

  Session python = CreatePython();
  done = false;
  service_->GetVSCodeUrl(python.id, [&](const Status& status, std::string) {
    EXPECT_TRUE(status.Is(errc::validation));
    done = true;
  });
  ASSERT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
}

TEST_F(SandboxServiceTest, PlaywrightSession) {
  Start();
  CreateSessionParams params;
  params.browser = "webkit";
  Session session;
  bool done = false;
  service_->CreatePlaywrightSession(params, [&](const Status& status,
                                                Session created) {
    EXPECT_TRUE(status.ok()) << status;
    session = created;
    done = true;
  });
  ASSERT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
  EXPECT_EQ(SandboxType::kBrowser, session.type);
  EXPECT_EQ("ws://localhost:9222", session.endpoints["ws"]);
  EXPECT_EQ("http://localhost:9222", session.endpoints["http"]);
  EXPECT_EQ("webkit",
            runtime_.containers.at(session.sandbox->id).labels.at("mcp.browser"));
}

TEST_F(SandboxServiceTest, SweepDestroysIdleSessions) {
  Start();
  int64_t now = 1000000;
  service_->registry().set_now_function([&now]() { return now; });
  Session session = CreatePython();
  now += 2000;
  bool done = false;
  service_->SweepExpired([&]() { done = true; });
  ASSERT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
  EXPECT_TRUE(runtime_.containers.empty());
  EXPECT_TRUE(List().empty());
}

TEST_F(SandboxServiceTest, ShutdownDestroysEverything) {
  config_.pool_size = 1;
  config_.pool_languages = {"python"};
  Start();
  CreatePython();
  CreatePython();
  Settle();
  EXPECT_EQ(3u, runtime_.containers.size());

  bool done = false;
  service_->Shutdown([&]() { done = true; });
  ASSERT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
  EXPECT_TRUE(runtime_.containers.empty());
  EXPECT_TRUE(List().empty());

  Session session;
  EXPECT_TRUE(Create(CreateSessionParams(), &session).Is(errc::infrastructure));
}

TEST_F(SandboxServiceTest, Capabilities) {
  MakeService();
  nlohmann::json capabilities = service_->Capabilities();
  EXPECT_EQ(10, capabilities["execution"]["maxConcurrent"]);
  EXPECT_EQ(30000, capabilities["execution"]["defaultTimeoutMs"]);
  EXPECT_EQ("published", capabilities["sessions"]["ide"]["network"]);
  EXPECT_EQ("none", capabilities["sessions"]["execution"]["network"]);
  EXPECT_FALSE(capabilities["sessions"]["execution"]["pooled"].get<bool>());
  std::vector<std::string> languages = capabilities["languages"];
  EXPECT_NE(languages.end(), std::find(languages.begin(), languages.end(), "python"));
  EXPECT_TRUE(capabilities["security"]["codeValidation"].get<bool>());
}

TEST_F(SandboxServiceTest, CheckRequest) {
  config_.security.api_keys = {"secret"};
  MakeService();
  nlohmann::json request = {
      {"method", "create_session"},
      {"id", 7},
      {"params", {{"clientId", "<script>x</script>alice"}}},
  };
  EXPECT_TRUE(service_->CheckRequest(&request, "wrong", "").Is(errc::validation));
  ASSERT_TRUE(service_->CheckRequest(&request, "secret", "").ok());
  EXPECT_EQ("alice", request["params"]["clientId"]);
  nlohmann::json broken = {{"id", 7}};
  EXPECT_TRUE(service_->CheckRequest(&broken, "secret", "").Is(errc::validation));
}

TEST(SandboxParamsTest, ParsesCreateSessionParams) {
  CreateSessionParams params;
  ASSERT_TRUE(ParseCreateSessionParams(
      {{"type", "playwright"},
       {"browser", "firefox"},
       {"headless", false},
       {"viewport", {{"width", 800}, {"height", 600}}}},
      &params).ok());
  EXPECT_EQ(SandboxType::kBrowser, params.type);
  EXPECT_EQ("firefox", params.browser);
  EXPECT_FALSE(params.headless);
  EXPECT_EQ(800, params.viewport_width);
  EXPECT_EQ("5g", params.memory);

  ASSERT_TRUE(ParseCreateSessionParams(nullptr, &params).ok());
  EXPECT_EQ(SandboxType::kExecution, params.type);
  EXPECT_EQ("python", params.language);

  EXPECT_TRUE(ParseCreateSessionParams({{"type", "robot"}}, &params).Is(errc::validation));
  EXPECT_TRUE(ParseCreateSessionParams({{"memory", 5}}, &params).Is(errc::validation));
  EXPECT_TRUE(ParseCreateSessionParams({{"viewport", {{"width", "wide"}}}}, &params)
                  .Is(errc::validation));
}

TEST(SandboxParamsTest, ParsesExecutionRequest) {
  ExecutionRequest request;
  ASSERT_TRUE(ParseExecutionRequest({{"language", "python"},
                                     {"code", "print(1)"},
                                     {"session_id", "s1"},
                                     {"timeout", 5000}},
                                    &request).ok());
  EXPECT_EQ("s1", request.session_id);
  EXPECT_EQ(5000, request.timeout_ms);
  EXPECT_EQ(0, request.max_output_bytes);
  EXPECT_TRUE(ParseExecutionRequest({{"language", "python"}}, &request)
                  .Is(errc::validation));
  EXPECT_TRUE(ParseExecutionRequest({{"language", "python"}, {"code", "x"},
                                     {"timeout", "soon"}},
                                    &request).Is(errc::validation));
}

}
}
