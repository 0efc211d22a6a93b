#ifndef SANDBOXD_SANDBOX_H
#define SANDBOXD_SANDBOX_H

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include "shim.h"

namespace sandboxd {

enum class SandboxType {
  kExecution,
  kIde,
  kBrowser,
};

const char* SandboxTypeName(SandboxType type);

// Also accepts the historical "vscode" and "playwright" names.
bool ParseSandboxType(StringView name, SandboxType* type);

enum class NetworkMode {
  kNone,
  kPublished,
};

struct ResourceProfile {
  int64_t memory_bytes = int64_t(5) << 30;
  double cpus = 1.0;
  int64_t cpu_shares = 1024;
  int64_t pids_limit = 1024;
  int64_t nofile = 65536;
  int64_t nproc = 4096;
  int64_t shm_size = 0;
  std::map<std::string, std::string> tmpfs;
  NetworkMode network_mode = NetworkMode::kNone;
  // Port the service listens on inside the sandbox, and where host port
  // allocation starts.
  uint16_t container_port = 0;
  uint16_t host_port_base = 0;
};

std::map<SandboxType, ResourceProfile> DefaultProfiles();

struct SandboxHandle {
  std::string id;
  std::string name;
  SandboxType type = SandboxType::kExecution;
  std::string language;
  ResourceProfile limits;
  uint16_t host_port = 0;
  std::string workspace_path;
  std::map<std::string, std::string> labels;
  bool prewarmed = false;

  NetworkMode network_mode() const { return limits.network_mode; }
};

nlohmann::json SandboxHandleToJson(const SandboxHandle& handle);

bool SandboxHandleFromJson(const nlohmann::json& json, SandboxHandle* handle);

}

#endif //SANDBOXD_SANDBOX_H
