#include "sandbox_service.h"

#include <boost/asio/post.hpp>
#include <glog/logging.h>
#include "language.h"
#include "util.h"

namespace sandboxd {

namespace {

const std::set<std::string> kBrowsers = {"chromium", "firefox", "webkit"};

template <typename Result>
void PostFailure(EventLoop& loop,
                 const ResultHandler<Result>& handler,
                 const Status& status) {
  boost::asio::post(loop, [handler, status]() { handler(status, Result()); });
}

Status ReadString(const nlohmann::json& params,
                  const char* key,
                  std::string* value) {
  auto iter = params.find(key);
  if (iter == params.end() || iter->is_null()) {
    return Status();
  }
  if (!iter->is_string()) {
    return Status(errc::validation, std::string(key) + " must be a string");
  }
  *value = iter->get<std::string>();
  return Status();
}

Status ReadInteger(const nlohmann::json& params, const char* key, int64_t* value) {
  auto iter = params.find(key);
  if (iter == params.end() || iter->is_null()) {
    return Status();
  }
  if (!iter->is_number_integer()) {
    return Status(errc::validation, std::string(key) + " must be an integer");
  }
  *value = iter->get<int64_t>();
  return Status();
}

Status ReadBool(const nlohmann::json& params, const char* key, bool* value) {
  auto iter = params.find(key);
  if (iter == params.end() || iter->is_null()) {
    return Status();
  }
  if (!iter->is_boolean()) {
    return Status(errc::validation, std::string(key) + " must be a boolean");
  }
  *value = iter->get<bool>();
  return Status();
}

SandboxOptions OptionsForSession(const Session& session) {
  SandboxOptions options;
  if (session.type != SandboxType::kBrowser) {
    options.language = session.language;
  }
  options.memory = session.memory;
  return options;
}

}

Status ParseCreateSessionParams(const nlohmann::json& params,
                                CreateSessionParams* result) {
  CreateSessionParams parsed;
  if (params.is_null()) {
    *result = parsed;
    return Status();
  }
  if (!params.is_object()) {
    return Status(errc::validation, "params must be an object");
  }
  std::string type;
  Status status = ReadString(params, "type", &type);
  if (status.ok() && !type.empty() && !ParseSandboxType(type, &parsed.type)) {
    status = Status(errc::validation, "unknown session type: " + type);
  }
  if (status.ok()) {
    status = ReadString(params, "language", &parsed.language);
  }
  if (status.ok()) {
    status = ReadString(params, "memory", &parsed.memory);
  }
  if (status.ok()) {
    status = ReadString(params, "clientId", &parsed.client_id);
  }
  if (status.ok()) {
    status = ReadString(params, "browser", &parsed.browser);
  }
  if (status.ok()) {
    status = ReadBool(params, "headless", &parsed.headless);
  }
  if (!status.ok()) {
    return status;
  }
  auto viewport = params.find("viewport");
  if (viewport != params.end() && !viewport->is_null()) {
    if (!viewport->is_object()) {
      return Status(errc::validation, "viewport must be an object");
    }
    int64_t width = parsed.viewport_width;
    int64_t height = parsed.viewport_height;
    status = ReadInteger(*viewport, "width", &width);
    if (status.ok()) {
      status = ReadInteger(*viewport, "height", &height);
    }
    if (!status.ok()) {
      return status;
    }
    parsed.viewport_width = static_cast<int>(width);
    parsed.viewport_height = static_cast<int>(height);
  }
  *result = parsed;
  return Status();
}

Status ParseExecutionRequest(const nlohmann::json& params,
                             ExecutionRequest* result) {
  if (!params.is_object()) {
    return Status(errc::validation, "params must be an object");
  }
  if (!params.contains("language") || !params.contains("code")) {
    return Status(errc::validation, "language and code are required");
  }
  ExecutionRequest parsed;
  Status status = ReadString(params, "language", &parsed.language);
  if (status.ok()) {
    status = ReadString(params, "code", &parsed.code);
  }
  if (status.ok()) {
    status = ReadString(params, "sessionId", &parsed.session_id);
  }
  if (status.ok() && parsed.session_id.empty()) {
    status = ReadString(params, "session_id", &parsed.session_id);
  }
  if (status.ok()) {
    status = ReadInteger(params, "timeout", &parsed.timeout_ms);
  }
  if (status.ok()) {
    status = ReadInteger(params, "maxOutputBytes", &parsed.max_output_bytes);
  }
  if (status.ok()) {
    status = ReadString(params, "clientId", &parsed.client_id);
  }
  if (!status.ok()) {
    return status;
  }
  *result = parsed;
  return Status();
}

SandboxService::SandboxService(EventLoop& loop,
                               const Config& config,
                               ContainerRuntime& runtime,
                               KeyValueStore& store)
    : loop_(loop),
      config_(config),
      runtime_(runtime),
      background_(loop),
      ports_(loop, config_.ports),
      gate_(config_.security),
      controller_(loop, config_, runtime, ports_, background_),
      pool_(controller_, background_, config_.pool_size),
      scheduler_(loop, runtime, background_, config_.scheduler),
      registry_(store, config_.session_ttl),
      sweep_timer_(loop, config_.sweep_interval,
                   [this](Callback done) { SweepExpired(done); }),
      maintain_timer_(loop, config_.pool_maintain_interval,
                      [this](Callback done) { pool_.Maintain(done); }) {
  if (config_.pool_size == 0) {
    return;
  }
  for (const std::string& language : config_.pool_languages) {
    if (!FindLanguage(language)) {
      LOG(WARNING) << "Not pooling unknown language " << language;
      continue;
    }
    pool_.AddPool(PoolKey{SandboxType::kExecution, language});
  }
  if (config_.pool_ide) {
    pool_.AddPool(PoolKey{SandboxType::kIde, std::string()});
  }
  if (config_.pool_browser) {
    pool_.AddPool(PoolKey{SandboxType::kBrowser, std::string()});
  }
}

void SandboxService::Initialize(StatusHandler handler) {
  LOG(INFO) << "Initializing sandbox service";
  runtime_.Ping([this, handler](const Status& status) {
    if (!status.ok()) {
      LOG(ERROR) << "Container runtime unreachable: " << status;
      handler(Status(errc::infrastructure,
                     "container runtime unreachable: " + status.reason()));
      return;
    }
    Status made = MakeDirs(config_.workspace_root);
    if (!made.ok()) {
      handler(made);
      return;
    }
    controller_.ReclaimOrphans([this, handler](const Status& status,
                                               std::size_t) {
      if (!status.ok()) {
        LOG(WARNING) << "Failed to reclaim orphaned sandboxes: " << status;
      }
      pool_.Initialize([this, handler]() {
        sweep_timer_.Start();
        maintain_timer_.Start();
        initialized_ = true;
        LOG(INFO) << "Sandbox service ready";
        handler(Status());
      });
    });
  });
}

void SandboxService::Shutdown(Callback done) {
  LOG(INFO) << "Shutting down sandbox service";
  shutting_down_ = true;
  sweep_timer_.Stop();
  maintain_timer_.Stop();
  pool_.Drain([this, done]() {
    std::vector<std::string> ids(owned_.begin(), owned_.end());
    if (ids.empty()) {
      done();
      return;
    }
    auto pending = std::make_shared<std::size_t>(ids.size());
    for (const std::string& id : ids) {
      DestroySession(id, [id, pending, done](const Status& status, bool) {
        if (!status.ok()) {
          LOG(ERROR) << "Failed to destroy session " << id << ": " << status;
        }
        if (--*pending == 0) {
          done();
        }
      });
    }
  });
}

Status SandboxService::CheckRequest(nlohmann::json* request,
                                    const std::string& api_key,
                                    const std::string& origin) const {
  Status status = SecurityGate::ValidateEnvelope(*request);
  if (!status.ok()) {
    return status;
  }
  status = gate_.CheckCredentials(api_key, origin);
  if (!status.ok()) {
    return status;
  }
  auto params = request->find("params");
  if (params != request->end()) {
    SecurityGate::Sanitize(&*params);
  }
  return Status();
}

Status SandboxService::Validate(const CreateSessionParams& params) const {
  switch (params.type) {
  case SandboxType::kExecution:
    if (!FindLanguage(params.language)) {
      return Status(errc::validation,
                    "unsupported language: " + params.language);
    }
    break;
  case SandboxType::kIde:
    // The editor image is shared, the language is only a hint.
    if (!params.language.empty() && !FindLanguage(params.language)) {
      return Status(errc::validation,
                    "unsupported language: " + params.language);
    }
    break;
  case SandboxType::kBrowser:
    if (!kBrowsers.count(params.browser)) {
      return Status(errc::validation, "unsupported browser: " + params.browser);
    }
    break;
  }
  if (!params.memory.empty()) {
    Optional<int64_t> memory = ParseMemorySize(params.memory);
    if (!memory || *memory <= 0) {
      return Status(errc::validation, "invalid memory size: " + params.memory);
    }
  }
  if (params.viewport_width <= 0 || params.viewport_height <= 0) {
    return Status(errc::validation, "viewport must be positive");
  }
  return Status();
}

SandboxOptions SandboxService::OptionsFor(const CreateSessionParams& params) {
  SandboxOptions options;
  if (params.type != SandboxType::kBrowser) {
    options.language = params.language;
  }
  options.memory = params.memory;
  options.browser = params.browser;
  options.headless = params.headless;
  options.viewport_width = params.viewport_width;
  options.viewport_height = params.viewport_height;
  return options;
}

bool SandboxService::PoolEligible(SandboxType type,
                                  const SandboxOptions& options) const {
  auto profile = config_.profiles.find(type);
  if (profile == config_.profiles.end() || !options.env.empty()) {
    return false;
  }
  if (!options.memory.empty()) {
    Optional<int64_t> memory = ParseMemorySize(options.memory);
    if (!memory || *memory != profile->second.memory_bytes) {
      return false;
    }
  }
  if (type == SandboxType::kBrowser) {
    SandboxOptions defaults;
    return options.browser == defaults.browser &&
           options.headless == defaults.headless &&
           options.viewport_width == defaults.viewport_width &&
           options.viewport_height == defaults.viewport_height;
  }
  return true;
}

void SandboxService::CreateSession(const CreateSessionParams& params,
                                   ResultHandler<Session> handler) {
  if (shutting_down_) {
    PostFailure(loop_, handler,
                Status(errc::infrastructure, "service is shutting down"));
    return;
  }
  Status status = Validate(params);
  if (!status.ok()) {
    PostFailure(loop_, handler, status);
    return;
  }
  Session session;
  session.type = params.type;
  session.language = params.language;
  session.memory = params.memory;
  session.client_id = params.client_id;
  session.status = SessionStatus::kCreating;
  SandboxOptions options = OptionsFor(params);
  registry_.Create(session, [this, options, handler](const Status& status,
                                                     Session session) {
    if (!status.ok()) {
      handler(status, Session());
      return;
    }
    Provision(session, options, handler);
  });
}

void SandboxService::Provision(const Session& session,
                               const SandboxOptions& options,
                               ResultHandler<Session> handler) {
  if (PoolEligible(session.type, options)) {
    PoolKey key{session.type, session.type == SandboxType::kExecution
                                  ? options.language : std::string()};
    Optional<SandboxHandle> pooled = pool_.Acquire(key);
    if (pooled) {
      VLOG(1) << "Session " << session.id << " takes pooled sandbox "
              << pooled->name;
      Attach(session.id, *pooled, handler);
      return;
    }
  }
  std::string id = session.id;
  controller_.CreateSandbox(session.type, id, options, [this, id, handler](
      const Status& status, SandboxHandle handle) {
    if (!status.ok()) {
      SessionPatch patch;
      patch.status = SessionStatus::kError;
      registry_.Update(id, patch, [id, status, handler](
          const Status& update_status, Session) {
        if (!update_status.ok()) {
          LOG(WARNING) << "Failed to mark session " << id << " as failed: "
                       << update_status;
        }
        handler(status, Session());
      });
      return;
    }
    Attach(id, handle, handler);
  });
}

void SandboxService::Attach(const std::string& id,
                            const SandboxHandle& handle,
                            ResultHandler<Session> handler) {
  owned_.insert(id);
  SessionPatch patch;
  patch.status = SessionStatus::kReady;
  patch.sandbox = handle;
  patch.endpoints = controller_.EndpointsFor(handle);
  registry_.Update(id, patch, [this, id, handle, handler](
      const Status& status, Session session) {
    if (!status.ok()) {
      // The session went away while its sandbox was being created.
      LOG(WARNING) << "Discarding sandbox of session " << id << ": " << status;
      owned_.erase(id);
      background_.Submit("destroy " + handle.id, [this, handle](
          StatusHandler done) {
        controller_.DestroySandbox(handle, done);
      });
      handler(status, Session());
      return;
    }
    handler(Status(), session);
  });
}

void SandboxService::GetSession(const std::string& id,
                                ResultHandler<Session> handler) {
  registry_.Get(id, std::move(handler));
}

void SandboxService::ListSessions(const Optional<std::string>& client_id,
                                  ResultHandler<std::vector<Session>> handler) {
  registry_.List(client_id, std::move(handler));
}

void SandboxService::DestroySession(const std::string& id,
                                    ResultHandler<bool> handler) {
  auto pending = destroying_.find(id);
  if (pending != destroying_.end()) {
    pending->second.push_back(std::move(handler));
    return;
  }
  destroying_[id].push_back(std::move(handler));
  registry_.Get(id, [this, id](const Status& status, Session session) {
    if (!status.ok() || !session.sandbox) {
      registry_.Destroy(id, [this, id](const Status&, bool existed) {
        FinishDestroy(id, Status(), existed);
      });
      return;
    }
    controller_.DestroySandbox(*session.sandbox, [this, id](
        const Status& status) {
      if (!status.ok()) {
        FinishDestroy(id, status, false);
        return;
      }
      owned_.erase(id);
      registry_.Destroy(id, [this, id](const Status&, bool) {
        FinishDestroy(id, Status(), true);
      });
    });
  });
}

void SandboxService::FinishDestroy(const std::string& id,
                                   const Status& status,
                                   bool existed) {
  auto iter = destroying_.find(id);
  CHECK(iter != destroying_.end());
  std::vector<ResultHandler<bool>> handlers = std::move(iter->second);
  destroying_.erase(iter);
  for (const ResultHandler<bool>& handler : handlers) {
    handler(status, existed);
  }
}

void SandboxService::RecoverSession(const std::string& id,
                                    ResultHandler<Session> handler) {
  registry_.Get(id, [this, id, handler](const Status& status,
                                        Session session) {
    if (!status.ok()) {
      handler(status, Session());
      return;
    }
    if (session.status != SessionStatus::kError) {
      handler(Status(errc::validation,
                     "session " + id + " is " +
                         SessionStatusName(session.status) + ", not error"),
              Session());
      return;
    }
    auto reprovision = [this, id, handler]() {
      SessionPatch patch;
      patch.status = SessionStatus::kCreating;
      patch.clear_sandbox = true;
      patch.endpoints = std::map<std::string, std::string>();
      registry_.Update(id, patch, [this, handler](const Status& status,
                                                  Session session) {
        if (!status.ok()) {
          handler(status, Session());
          return;
        }
        LOG(INFO) << "Recovering session " << session.id;
        Provision(session, OptionsForSession(session), handler);
      });
    };
    if (!session.sandbox) {
      reprovision();
      return;
    }
    controller_.DestroySandbox(*session.sandbox, [this, id, handler,
                                                  reprovision](
        const Status& status) {
      if (!status.ok()) {
        handler(status, Session());
        return;
      }
      owned_.erase(id);
      reprovision();
    });
  });
}

void SandboxService::ExecuteCode(const ExecutionRequest& request,
                                 ResultHandler<ExecutionResult> handler) {
  if (shutting_down_) {
    PostFailure(loop_, handler,
                Status(errc::infrastructure, "service is shutting down"));
    return;
  }
  Status status = gate_.ConsumeRateLimit(
      request.client_id.empty() ? "anonymous" : request.client_id,
      Clock::now());
  if (status.ok() && !FindLanguage(request.language)) {
    status = Status(errc::validation, "unsupported language: " + request.language);
  }
  if (status.ok() && request.code.empty()) {
    status = Status(errc::validation, "code must not be empty");
  }
  if (status.ok()) {
    status = gate_.ValidateCode(request.language, request.code);
  }
  if (!status.ok()) {
    PostFailure(loop_, handler, status);
    return;
  }
  if (request.session_id.empty()) {
    RunTemporary(request, handler);
    return;
  }
  registry_.Get(request.session_id, [this, request, handler](
      const Status& status, Session session) {
    if (!status.ok()) {
      handler(status, ExecutionResult());
      return;
    }
    RunInSession(session, request, handler);
  });
}

void SandboxService::RunInSession(const Session& session,
                                  const ExecutionRequest& request,
                                  ResultHandler<ExecutionResult> handler) {
  std::string id = session.id;
  Status status;
  if (session.type != SandboxType::kExecution) {
    status = Status(errc::validation,
                    "session " + id + " is not an execution session");
  } else if (session.language != request.language) {
    status = Status(errc::validation,
                    "session " + id + " runs " + session.language);
  } else if (executing_.count(id) || session.status == SessionStatus::kBusy) {
    status = Status(errc::capacity, "session " + id + " is busy");
  } else if (session.status != SessionStatus::kReady || !session.sandbox) {
    status = Status(errc::validation, "session " + id + " is " +
                                          SessionStatusName(session.status));
  }
  if (!status.ok()) {
    handler(status, ExecutionResult());
    return;
  }
  executing_.insert(id);
  SessionPatch busy;
  busy.status = SessionStatus::kBusy;
  registry_.Update(id, busy, [this, id, request, handler](
      const Status& status, Session session) {
    if (!status.ok()) {
      executing_.erase(id);
      handler(status, ExecutionResult());
      return;
    }
    scheduler_.Execute(*session.sandbox, request, [this, id, handler](
        const Status& status, ExecutionResult result) {
      executing_.erase(id);
      SessionPatch after;
      after.status = status.Is(errc::runtime) ? SessionStatus::kError
                                              : SessionStatus::kReady;
      registry_.Update(id, after, [id, status, result, handler](
          const Status& update_status, Session) {
        if (!update_status.ok()) {
          LOG(WARNING) << "Failed to update session " << id
                       << " after execution: " << update_status;
        }
        handler(status, result);
      });
    });
  });
}

void SandboxService::RunTemporary(const ExecutionRequest& request,
                                  ResultHandler<ExecutionResult> handler) {
  CreateSessionParams params;
  params.type = SandboxType::kExecution;
  params.language = request.language;
  params.client_id = request.client_id;
  CreateSession(params, [this, request, handler](const Status& status,
                                                 Session session) {
    if (!status.ok()) {
      handler(status, ExecutionResult());
      return;
    }
    std::string id = session.id;
    RunInSession(session, request, [this, id, handler](
        const Status& status, ExecutionResult result) {
      handler(status, result);
      background_.Submit("destroy temporary session " + id, [this, id](
          StatusHandler done) {
        DestroySession(id, [done](const Status& status, bool) {
          done(status);
        });
      });
    });
  });
}

void SandboxService::CreateVSCodeSession(CreateSessionParams params,
                                         ResultHandler<Session> handler) {
  params.type = SandboxType::kIde;
  CreateSession(params, std::move(handler));
}

void SandboxService::GetVSCodeUrl(const std::string& id,
                                  ResultHandler<std::string> handler) {
  registry_.Get(id, [id, handler](const Status& status, Session session) {
    if (!status.ok()) {
      handler(status, std::string());
      return;
    }
    if (session.type != SandboxType::kIde) {
      handler(Status(errc::validation, "session " + id + " is not an ide session"),
              std::string());
      return;
    }
    auto url = session.endpoints.find("url");
    if (url == session.endpoints.end()) {
      handler(Status(errc::not_found, "no ide endpoint for session " + id),
              std::string());
      return;
    }
    handler(Status(), url->second);
  });
}

void SandboxService::CreatePlaywrightSession(CreateSessionParams params,
                                             ResultHandler<Session> handler) {
  params.type = SandboxType::kBrowser;
  CreateSession(params, std::move(handler));
}

nlohmann::json SandboxService::Capabilities() const {
  std::set<SandboxType> pooled;
  for (const PoolKey& key : pool_.keys()) {
    pooled.insert(key.type);
  }
  nlohmann::json sessions = nlohmann::json::object();
  for (const auto& profile : config_.profiles) {
    const ResourceProfile& limits = profile.second;
    sessions[SandboxTypeName(profile.first)] = {
        {"memoryBytes", limits.memory_bytes},
        {"cpus", limits.cpus},
        {"network",
         limits.network_mode == NetworkMode::kNone ? "none" : "published"},
        {"pooled", pooled.count(profile.first) > 0},
    };
  }
  return {
      {"sessions", sessions},
      {"languages", SupportedLanguages()},
      {"execution",
       {
           {"maxConcurrent", config_.scheduler.max_concurrent},
           {"defaultTimeoutMs", config_.scheduler.default_timeout.count()},
           {"maxTimeoutMs", config_.scheduler.max_timeout.count()},
           {"maxOutputBytes", config_.scheduler.max_output_bytes},
       }},
      {"security",
       {
           {"networkIsolation", true},
           {"filesystemIsolation", true},
           {"resourceLimits", true},
           {"codeValidation", true},
           {"clientRateLimitPoints", config_.security.client_rate_limit_points},
           {"clientRateLimitWindowMs",
            config_.security.client_rate_limit_window.count()},
       }},
  };
}

void SandboxService::SweepExpired(Callback done) {
  registry_.SweepExpired(
      config_.session_ttl,
      [this](const Session& session, Callback next) {
        std::string id = session.id;
        DestroySession(id, [id, next](const Status& status, bool) {
          if (!status.ok()) {
            LOG(WARNING) << "Failed to destroy expired session " << id << ": "
                         << status;
          }
          next();
        });
      },
      [done](const Status& status, std::size_t) {
        if (!status.ok()) {
          LOG(WARNING) << "Session sweep failed: " << status;
        }
        done();
      });
}

}
