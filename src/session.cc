#include "session.h"

namespace sandboxd {

const char* SessionStatusName(SessionStatus status) {
  switch (status) {
  case SessionStatus::kCreating:
    return "creating";
  case SessionStatus::kReady:
    return "ready";
  case SessionStatus::kBusy:
    return "busy";
  case SessionStatus::kError:
    return "error";
  case SessionStatus::kDestroyed:
    return "destroyed";
  }
  return "error";
}

bool ParseSessionStatus(StringView name, SessionStatus* status) {
  static const std::map<std::string, SessionStatus> kStatuses = {
      {"creating", SessionStatus::kCreating},
      {"ready", SessionStatus::kReady},
      {"busy", SessionStatus::kBusy},
      {"error", SessionStatus::kError},
      {"destroyed", SessionStatus::kDestroyed},
  };
  auto iter = kStatuses.find(name.to_string());
  if (iter == kStatuses.end()) {
    return false;
  }
  *status = iter->second;
  return true;
}

bool IsValidTransition(SessionStatus from, SessionStatus to) {
  if (from == to) {
    return from != SessionStatus::kDestroyed;
  }
  switch (from) {
  case SessionStatus::kCreating:
    return to == SessionStatus::kReady || to == SessionStatus::kError ||
           to == SessionStatus::kDestroyed;
  case SessionStatus::kReady:
    return to == SessionStatus::kBusy || to == SessionStatus::kDestroyed;
  case SessionStatus::kBusy:
    return to == SessionStatus::kReady || to == SessionStatus::kError ||
           to == SessionStatus::kDestroyed;
  case SessionStatus::kError:
    return to == SessionStatus::kCreating || to == SessionStatus::kDestroyed;
  case SessionStatus::kDestroyed:
    return false;
  }
  return false;
}

nlohmann::json SessionToJson(const Session& session) {
  nlohmann::json json = {
      {"id", session.id},
      {"type", SandboxTypeName(session.type)},
      {"language", session.language},
      {"status", SessionStatusName(session.status)},
      {"memory", session.memory},
      {"endpoints", session.endpoints},
      {"clientId", session.client_id},
      {"createdAt", session.created_at},
      {"lastAccessedAt", session.last_accessed_at},
  };
  if (session.sandbox) {
    json["containerId"] = session.sandbox->id;
  }
  return json;
}

nlohmann::json SessionToRecord(const Session& session) {
  nlohmann::json record = SessionToJson(session);
  if (session.sandbox) {
    record["sandbox"] = SandboxHandleToJson(*session.sandbox);
  }
  return record;
}

bool SessionFromRecord(const nlohmann::json& record, Session* session) {
  if (!record.is_object()) {
    return false;
  }
  Session parsed;
  parsed.id = record.value("id", "");
  if (parsed.id.empty() ||
      !ParseSandboxType(record.value("type", ""), &parsed.type) ||
      !ParseSessionStatus(record.value("status", ""), &parsed.status)) {
    return false;
  }
  parsed.language = record.value("language", "");
  parsed.memory = record.value("memory", "");
  parsed.endpoints =
      record.value("endpoints", std::map<std::string, std::string>());
  parsed.client_id = record.value("clientId", "");
  parsed.created_at = record.value("createdAt", int64_t(0));
  parsed.last_accessed_at = record.value("lastAccessedAt", int64_t(0));
  if (record.contains("sandbox")) {
    SandboxHandle handle;
    if (!SandboxHandleFromJson(record["sandbox"], &handle)) {
      return false;
    }
    parsed.sandbox = handle;
  }
  *session = std::move(parsed);
  return true;
}

nlohmann::json ExecutionResultToJson(const ExecutionResult& result) {
  nlohmann::json json = {
      {"stdout", result.stdout_text},
      {"stderr", result.stderr_text},
      {"exitCode", result.exit_code},
      {"durationMs", result.duration_ms},
  };
  if (result.memory_usage_mb) {
    json["memoryUsageMb"] = *result.memory_usage_mb;
  }
  return json;
}

}
