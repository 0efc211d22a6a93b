#include "sandbox.h"

namespace sandboxd {

const char* SandboxTypeName(SandboxType type) {
  switch (type) {
  case SandboxType::kExecution:
    return "execution";
  case SandboxType::kIde:
    return "ide";
  case SandboxType::kBrowser:
    return "browser-automation";
  }
  return "execution";
}

bool ParseSandboxType(StringView name, SandboxType* type) {
  if (name == "execution") {
    *type = SandboxType::kExecution;
  } else if (name == "ide" || name == "vscode") {
    *type = SandboxType::kIde;
  } else if (name == "browser-automation" || name == "playwright") {
    *type = SandboxType::kBrowser;
  } else {
    return false;
  }
  return true;
}

std::map<SandboxType, ResourceProfile> DefaultProfiles() {
  std::map<SandboxType, ResourceProfile> profiles;

  ResourceProfile& execution = profiles[SandboxType::kExecution];
  execution.cpus = 0.5;
  execution.cpu_shares = 512;
  execution.pids_limit = 1024;
  execution.nproc = 4096;
  execution.tmpfs = {{"/tmp", "rw,noexec,nosuid,size=512m"},
                     {"/var/tmp", "rw,noexec,nosuid,size=256m"}};

  ResourceProfile& ide = profiles[SandboxType::kIde];
  ide.pids_limit = 2048;
  ide.nproc = 8192;
  ide.tmpfs = {{"/tmp", "rw,noexec,nosuid,size=1g"},
               {"/var/tmp", "rw,noexec,nosuid,size=512m"}};
  ide.network_mode = NetworkMode::kPublished;
  ide.container_port = 8080;
  ide.host_port_base = 8080;

  ResourceProfile& browser = profiles[SandboxType::kBrowser];
  browser.pids_limit = 4096;
  browser.nproc = 8192;
  browser.shm_size = int64_t(2) << 30;
  browser.tmpfs = ide.tmpfs;
  browser.network_mode = NetworkMode::kPublished;
  browser.container_port = 9222;
  browser.host_port_base = 9222;

  return profiles;
}

nlohmann::json SandboxHandleToJson(const SandboxHandle& handle) {
  return {
      {"id", handle.id},
      {"name", handle.name},
      {"type", SandboxTypeName(handle.type)},
      {"language", handle.language},
      {"memoryBytes", handle.limits.memory_bytes},
      {"cpus", handle.limits.cpus},
      {"networkMode",
       handle.network_mode() == NetworkMode::kNone ? "none" : "published"},
      {"containerPort", handle.limits.container_port},
      {"hostPortBase", handle.limits.host_port_base},
      {"cpuShares", handle.limits.cpu_shares},
      {"pidsLimit", handle.limits.pids_limit},
      {"nofile", handle.limits.nofile},
      {"nproc", handle.limits.nproc},
      {"shmSize", handle.limits.shm_size},
      {"tmpfs", handle.limits.tmpfs},
      {"hostPort", handle.host_port},
      {"workspace", handle.workspace_path},
      {"labels", handle.labels},
      {"prewarmed", handle.prewarmed},
  };
}

bool SandboxHandleFromJson(const nlohmann::json& json, SandboxHandle* handle) {
  if (!json.is_object() || !json.contains("id")) {
    return false;
  }
  SandboxType type;
  if (!ParseSandboxType(json.value("type", ""), &type)) {
    return false;
  }
  handle->id = json.value("id", "");
  handle->name = json.value("name", "");
  handle->type = type;
  handle->language = json.value("language", "");
  // Records written by older builds lack some limits.
  ResourceProfile& limits = handle->limits;
  limits = DefaultProfiles()[type];
  limits.memory_bytes = json.value("memoryBytes", limits.memory_bytes);
  limits.cpus = json.value("cpus", limits.cpus);
  limits.cpu_shares = json.value("cpuShares", limits.cpu_shares);
  limits.pids_limit = json.value("pidsLimit", limits.pids_limit);
  limits.nofile = json.value("nofile", limits.nofile);
  limits.nproc = json.value("nproc", limits.nproc);
  limits.shm_size = json.value("shmSize", limits.shm_size);
  limits.tmpfs = json.value("tmpfs", limits.tmpfs);
  limits.host_port_base = json.value("hostPortBase", limits.host_port_base);
  handle->limits.network_mode = json.value("networkMode", "none") == "none"
                                    ? NetworkMode::kNone
                                    : NetworkMode::kPublished;
  handle->limits.container_port =
      json.value("containerPort", handle->limits.container_port);
  handle->host_port = json.value("hostPort", uint16_t(0));
  handle->workspace_path = json.value("workspace", "");
  handle->labels =
      json.value("labels", std::map<std::string, std::string>());
  handle->prewarmed = json.value("prewarmed", false);
  return !handle->id.empty();
}

}
