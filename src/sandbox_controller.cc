#include "sandbox_controller.h"

#include <boost/asio/post.hpp>
#include <boost/format.hpp>
#include <glog/logging.h>
#include <memory>
#include "language.h"
#include "util.h"

namespace sandboxd {

namespace {

const char kWorkspaceMount[] = "/workspace";

const char* ShortTypeName(SandboxType type) {
  switch (type) {
  case SandboxType::kExecution:
    return "exec";
  case SandboxType::kIde:
    return "vscode";
  case SandboxType::kBrowser:
    return "playwright";
  }
  return "exec";
}

}

SandboxController::SandboxController(EventLoop& loop,
                                     const Config& config,
                                     ContainerRuntime& runtime,
                                     PortAllocator& ports,
                                     BackgroundQueue& background)
    : loop_(loop),
      config_(config),
      runtime_(runtime),
      ports_(ports),
      background_(background) {}

Path SandboxController::WorkspaceFor(const std::string& key) const {
  return Path(config_.workspace_root) / key;
}

std::string SandboxController::ImageFor(SandboxType type,
                                        const std::string& language) const {
  switch (type) {
  case SandboxType::kExecution:
    return config_.image_prefix + language + ":latest";
  case SandboxType::kIde:
    return config_.image_prefix + "vscode:latest";
  case SandboxType::kBrowser:
    return config_.image_prefix + "playwright:latest";
  }
  return std::string();
}

ContainerSpec SandboxController::BuildSpec(SandboxType type,
                                           const std::string& key,
                                           const SandboxOptions& options,
                                           const ResourceProfile& limits,
                                           uint16_t host_port) const {
  const std::string& prefix = config_.label_prefix;
  ContainerSpec spec;
  spec.name = options.prewarmed
      ? (boost::format("%s-prewarmed-%s-%s") % prefix % ShortTypeName(type) %
         ShortId()).str()
      : (boost::format("%s-%s-%s") % prefix % ShortTypeName(type) % key).str();
  spec.image = ImageFor(type, options.language);
  spec.working_dir = kWorkspaceMount;
  spec.binds.push_back(WorkspaceFor(key).string() + ":" + kWorkspaceMount +
                       ":rw");
  spec.security_opt.push_back("no-new-privileges:true");
  spec.limits = limits;
  spec.host_port = host_port;

  switch (type) {
  case SandboxType::kExecution:
    spec.env = {"DEBIAN_FRONTEND=noninteractive", "LANG=C.UTF-8",
                "LC_ALL=C.UTF-8"};
    break;
  case SandboxType::kIde:
    spec.env = {"PASSWORD=" + RandomId(), "SUDO_PASSWORD=disabled",
                std::string("DEFAULT_WORKSPACE=") + kWorkspaceMount};
    break;
  case SandboxType::kBrowser:
    spec.env = {"BROWSER=" + options.browser,
                std::string("HEADLESS=") + (options.headless ? "true" : "false"),
                "VIEWPORT_WIDTH=" + std::to_string(options.viewport_width),
                "VIEWPORT_HEIGHT=" + std::to_string(options.viewport_height)};
    spec.labels[prefix + ".browser"] = options.browser;
    break;
  }
  spec.env.insert(spec.env.end(), options.env.begin(), options.env.end());

  spec.labels[config_.SessionLabel()] = key;
  spec.labels[prefix + ".type"] = SandboxTypeName(type);
  spec.labels[prefix + ".prewarmed"] = options.prewarmed ? "true" : "false";
  if (!options.language.empty()) {
    spec.labels[prefix + ".language"] = options.language;
  }
  if (limits.network_mode == NetworkMode::kPublished) {
    spec.labels[prefix + ".port"] = std::to_string(host_port);
  }
  return spec;
}

void SandboxController::CreateSandbox(SandboxType type,
                                      const std::string& session_id,
                                      const SandboxOptions& options,
                                      ResultHandler<SandboxHandle> handler) {
  auto fail = [this, handler](const Status& status) {
    boost::asio::post(loop_,
                      [handler, status]() { handler(status, SandboxHandle()); });
  };
  if (type == SandboxType::kExecution && !FindLanguage(options.language)) {
    fail(Status(errc::validation, "unsupported language: " + options.language));
    return;
  }
  auto profile = config_.profiles.find(type);
  if (profile == config_.profiles.end()) {
    fail(Status(errc::validation,
                std::string("no profile for ") + SandboxTypeName(type)));
    return;
  }
  ResourceProfile limits = profile->second;
  if (!options.memory.empty()) {
    Optional<int64_t> memory = ParseMemorySize(options.memory);
    if (!memory || *memory <= 0) {
      fail(Status(errc::validation, "invalid memory size: " + options.memory));
      return;
    }
    limits.memory_bytes = *memory;
  }

  std::string key = session_id.empty() ? "pool-" + ShortId() : session_id;
  Path workspace = WorkspaceFor(key);
  Status status = MakeDirs(workspace);
  if (!status.ok()) {
    fail(status);
    return;
  }
  uint16_t host_port = 0;
  if (limits.network_mode == NetworkMode::kPublished) {
    host_port = ports_.FindAvailablePort(limits.host_port_base);
  }

  auto handle = std::make_shared<SandboxHandle>();
  handle->type = type;
  handle->language = options.language;
  handle->limits = limits;
  handle->host_port = host_port;
  handle->workspace_path = workspace.string();
  handle->prewarmed = options.prewarmed;

  ContainerSpec spec = BuildSpec(type, key, options, limits, host_port);
  handle->name = spec.name;
  handle->labels = spec.labels;

  runtime_.CreateContainer(spec, [this, handle, handler](
      const Status& status, std::string id) {
    if (!status.ok()) {
      LOG(ERROR) << "Failed to create " << handle->name << ": " << status;
      RemoveWorkspace(handle->workspace_path);
      handler(status, SandboxHandle());
      return;
    }
    handle->id = id;
    runtime_.StartContainer(id, [this, handle, handler](const Status& status) {
      if (!status.ok()) {
        LOG(ERROR) << "Failed to start " << handle->name << ": " << status;
        std::string id = handle->id;
        background_.Submit("remove " + id, [this, id](StatusHandler done) {
          runtime_.RemoveContainer(id, true, done);
        });
        RemoveWorkspace(handle->workspace_path);
        handler(status, SandboxHandle());
        return;
      }
      LOG(INFO) << "Created " << SandboxTypeName(handle->type) << " sandbox "
                << handle->name << " (" << handle->id.substr(0, 12) << ")"
                << (handle->host_port ? " on port " +
                        std::to_string(handle->host_port) : "");
      handler(Status(), *handle);
    });
  });
}

void SandboxController::DestroySandbox(const SandboxHandle& handle,
                                       StatusHandler handler) {
  std::string id = handle.id;
  std::string workspace = handle.workspace_path;
  runtime_.KillContainer(id, [this, id, workspace, handler](
      const Status& status) {
    if (!status.ok() && !status.Is(errc::not_found)) {
      // Usually the container is not running anymore.
      VLOG(1) << "Kill " << id << ": " << status;
    }
    runtime_.RemoveContainer(id, true, [this, id, workspace, handler](
        const Status& status) {
      if (!status.ok() && !status.Is(errc::not_found)) {
        LOG(ERROR) << "Failed to remove " << id << ": " << status;
        handler(status);
        return;
      }
      LOG(INFO) << "Destroyed sandbox " << id.substr(0, 12);
      RemoveWorkspace(workspace);
      handler(Status());
    });
  });
}

void SandboxController::ReclaimOrphans(ResultHandler<std::size_t> handler) {
  runtime_.ListContainers(config_.SessionLabel(), [this, handler](
      const Status& status, std::vector<ContainerSummary> containers) {
    if (!status.ok()) {
      handler(status, 0);
      return;
    }
    if (containers.empty()) {
      handler(Status(), 0);
      return;
    }
    auto pending = std::make_shared<std::size_t>(containers.size());
    auto removed = std::make_shared<std::size_t>(0);
    for (const ContainerSummary& container : containers) {
      std::string id = container.id;
      runtime_.RemoveContainer(id, true, [id, pending, removed, handler](
          const Status& status) {
        if (status.ok() || status.Is(errc::not_found)) {
          ++*removed;
          VLOG(1) << "Removed orphaned container " << id;
        } else {
          LOG(WARNING) << "Failed to remove orphaned container " << id << ": "
                       << status;
        }
        if (--*pending == 0) {
          if (*removed > 0) {
            LOG(INFO) << "Cleaned up " << *removed << " orphaned containers";
          }
          handler(Status(), *removed);
        }
      });
    }
  });
}

void SandboxController::CheckRunning(const SandboxHandle& handle,
                                     ResultHandler<bool> handler) {
  runtime_.InspectContainer(handle.id, [handler](const Status& status,
                                                 ContainerState state) {
    if (status.Is(errc::not_found)) {
      handler(Status(), false);
      return;
    }
    handler(status, status.ok() && state.running);
  });
}

std::map<std::string, std::string> SandboxController::EndpointsFor(
    const SandboxHandle& handle) const {
  std::map<std::string, std::string> endpoints;
  if (handle.network_mode() != NetworkMode::kPublished) {
    return endpoints;
  }
  std::string address =
      config_.public_host + ":" + std::to_string(handle.host_port);
  if (handle.type == SandboxType::kIde) {
    endpoints["url"] = "http://" + address;
  } else if (handle.type == SandboxType::kBrowser) {
    endpoints["ws"] = "ws://" + address;
    endpoints["http"] = "http://" + address;
  }
  return endpoints;
}

void SandboxController::RemoveWorkspace(const std::string& workspace) {
  if (workspace.empty()) {
    return;
  }
  background_.Submit("remove workspace " + workspace,
                     [workspace](StatusHandler done) {
                       done(RemoveDir(workspace));
                     });
}

}
