#ifndef SANDBOXD_SESSION_H
#define SANDBOXD_SESSION_H

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include "sandbox.h"

namespace sandboxd {

// creating -> ready <-> busy -> destroyed, with error reachable from creating
// and busy. An errored session may go back to creating or be destroyed.
enum class SessionStatus {
  kCreating,
  kReady,
  kBusy,
  kError,
  kDestroyed,
};

const char* SessionStatusName(SessionStatus status);

bool ParseSessionStatus(StringView name, SessionStatus* status);

bool IsValidTransition(SessionStatus from, SessionStatus to);

struct Session {
  std::string id;
  SandboxType type = SandboxType::kExecution;
  std::string language;
  SessionStatus status = SessionStatus::kCreating;
  std::string memory;
  std::map<std::string, std::string> endpoints;
  Optional<SandboxHandle> sandbox;
  std::string client_id;
  int64_t created_at = 0;
  int64_t last_accessed_at = 0;
};

struct SessionPatch {
  Optional<SessionStatus> status;
  Optional<std::map<std::string, std::string>> endpoints;
  Optional<SandboxHandle> sandbox;
  bool clear_sandbox = false;
};

// Wire shape: {id, type, language, status, memory, endpoints, clientId,
// createdAt, lastAccessedAt, containerId?}.
nlohmann::json SessionToJson(const Session& session);

// Stored shape: the wire shape plus the full sandbox handle.
nlohmann::json SessionToRecord(const Session& session);

bool SessionFromRecord(const nlohmann::json& record, Session* session);

struct ExecutionRequest {
  std::string session_id;
  std::string language;
  std::string code;
  int64_t timeout_ms = 0;
  int64_t max_output_bytes = 0;
  std::string client_id;
};

struct ExecutionResult {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = -1;
  int64_t duration_ms = 0;
  Optional<int64_t> memory_usage_mb;
};

nlohmann::json ExecutionResultToJson(const ExecutionResult& result);

}

#endif //SANDBOXD_SESSION_H
