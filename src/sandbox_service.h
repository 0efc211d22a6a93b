#ifndef SANDBOXD_SANDBOX_SERVICE_H
#define SANDBOXD_SANDBOX_SERVICE_H

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>
#include "background_queue.h"
#include "config.h"
#include "container_runtime.h"
#include "execution_scheduler.h"
#include "kv_store.h"
#include "periodic_timer.h"
#include "pool_manager.h"
#include "port_allocator.h"
#include "sandbox_controller.h"
#include "security_gate.h"
#include "session_registry.h"

namespace sandboxd {

struct CreateSessionParams {
  SandboxType type = SandboxType::kExecution;
  std::string language = "python";
  std::string memory = "5g";
  std::string client_id;
  std::string browser = "chromium";
  bool headless = true;
  int viewport_width = 1920;
  int viewport_height = 1080;
};

// Reads {type, language, memory, clientId, browser, headless, viewport}.
// Absent fields keep their defaults.
Status ParseCreateSessionParams(const nlohmann::json& params,
                                CreateSessionParams* result);

// Reads {language, code, sessionId, timeout, maxOutputBytes, clientId}.
Status ParseExecutionRequest(const nlohmann::json& params,
                             ExecutionRequest* result);

// Operations offered to the transport layer. Every handler runs exactly once
// on the event loop.
class SandboxService {
 public:
  SandboxService(EventLoop& loop,
                 const Config& config,
                 ContainerRuntime& runtime,
                 KeyValueStore& store);
  SandboxService(const SandboxService&) = delete;
  SandboxService& operator=(const SandboxService&) = delete;

  // Pings the runtime, reclaims orphans, fills the pools and starts the
  // periodic maintenance. An unreachable runtime fails with
  // errc::infrastructure.
  void Initialize(StatusHandler handler);

  // Tears down every sandbox this process owns and stops maintenance.
  void Shutdown(Callback done);

  // Envelope and credential checks, then sanitizes "params" in place.
  Status CheckRequest(nlohmann::json* request,
                      const std::string& api_key,
                      const std::string& origin) const;

  void CreateSession(const CreateSessionParams& params,
                     ResultHandler<Session> handler);
  void GetSession(const std::string& id, ResultHandler<Session> handler);
  void ListSessions(const Optional<std::string>& client_id,
                    ResultHandler<std::vector<Session>> handler);
  // Completes with false when there was nothing to destroy.
  void DestroySession(const std::string& id, ResultHandler<bool> handler);
  // Replaces the sandbox of a session in the error state.
  void RecoverSession(const std::string& id, ResultHandler<Session> handler);

  // Without a session id a temporary execution session is created for the
  // call and destroyed afterwards.
  void ExecuteCode(const ExecutionRequest& request,
                   ResultHandler<ExecutionResult> handler);

  void CreateVSCodeSession(CreateSessionParams params,
                           ResultHandler<Session> handler);
  void GetVSCodeUrl(const std::string& id, ResultHandler<std::string> handler);
  void CreatePlaywrightSession(CreateSessionParams params,
                               ResultHandler<Session> handler);

  nlohmann::json Capabilities() const;

  // Runs one expiry sweep.
  void SweepExpired(Callback done);

  SessionRegistry& registry() { return registry_; }
  PoolManager& pool() { return pool_; }
  PortAllocator& ports() { return ports_; }
  ExecutionScheduler& scheduler() { return scheduler_; }
  SecurityGate& security_gate() { return gate_; }
  BackgroundQueue& background() { return background_; }
  bool initialized() const { return initialized_; }

 private:
  void Provision(const Session& session,
                 const SandboxOptions& options,
                 ResultHandler<Session> handler);
  void Attach(const std::string& id,
              const SandboxHandle& handle,
              ResultHandler<Session> handler);
  bool PoolEligible(SandboxType type, const SandboxOptions& options) const;
  void RunInSession(const Session& session,
                    const ExecutionRequest& request,
                    ResultHandler<ExecutionResult> handler);
  void RunTemporary(const ExecutionRequest& request,
                    ResultHandler<ExecutionResult> handler);
  void FinishDestroy(const std::string& id, const Status& status, bool existed);
  Status Validate(const CreateSessionParams& params) const;
  static SandboxOptions OptionsFor(const CreateSessionParams& params);

  EventLoop& loop_;
  const Config config_;
  ContainerRuntime& runtime_;
  BackgroundQueue background_;
  PortAllocator ports_;
  SecurityGate gate_;
  SandboxController controller_;
  PoolManager pool_;
  ExecutionScheduler scheduler_;
  SessionRegistry registry_;
  PeriodicTimer sweep_timer_;
  PeriodicTimer maintain_timer_;
  // Sessions whose sandbox this process created or handed out.
  std::set<std::string> owned_;
  std::set<std::string> executing_;
  // Callers waiting on a destroy already in progress.
  std::map<std::string, std::vector<ResultHandler<bool>>> destroying_;
  bool initialized_ = false;
  bool shutting_down_ = false;
};

}

#endif //SANDBOXD_SANDBOX_SERVICE_H
