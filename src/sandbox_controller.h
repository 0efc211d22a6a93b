#ifndef SANDBOXD_SANDBOX_CONTROLLER_H
#define SANDBOXD_SANDBOX_CONTROLLER_H

#include <map>
#include <string>
#include <vector>
#include "background_queue.h"
#include "config.h"
#include "container_runtime.h"
#include "port_allocator.h"
#include "sandbox.h"
#include "status.h"

namespace sandboxd {

struct SandboxOptions {
  std::string language;
  // Overrides the profile memory limit when set, e.g. "2g".
  std::string memory;
  std::vector<std::string> env;
  std::string browser = "chromium";
  bool headless = true;
  int viewport_width = 1920;
  int viewport_height = 1080;
  bool prewarmed = false;
};

// The only component creating and tearing down containers.
class SandboxController {
 public:
  SandboxController(EventLoop& loop,
                    const Config& config,
                    ContainerRuntime& runtime,
                    PortAllocator& ports,
                    BackgroundQueue& background);
  SandboxController(const SandboxController&) = delete;
  SandboxController& operator=(const SandboxController&) = delete;

  // Creates and starts a sandbox with a private workspace bound at /workspace.
  // An empty |session_id| creates an unassigned sandbox for a pool.
  void CreateSandbox(SandboxType type,
                     const std::string& session_id,
                     const SandboxOptions& options,
                     ResultHandler<SandboxHandle> handler);

  // Kill then remove. A sandbox that is already gone counts as destroyed.
  void DestroySandbox(const SandboxHandle& handle, StatusHandler handler);

  // Force removes every container carrying the session label. Completes with
  // the number removed.
  void ReclaimOrphans(ResultHandler<std::size_t> handler);

  void CheckRunning(const SandboxHandle& handle, ResultHandler<bool> handler);

  std::map<std::string, std::string> EndpointsFor(
      const SandboxHandle& handle) const;

  Path WorkspaceFor(const std::string& key) const;

  ContainerSpec BuildSpec(SandboxType type,
                          const std::string& key,
                          const SandboxOptions& options,
                          const ResourceProfile& limits,
                          uint16_t host_port) const;

 private:
  std::string ImageFor(SandboxType type, const std::string& language) const;
  void RemoveWorkspace(const std::string& workspace);

  EventLoop& loop_;
  const Config& config_;
  ContainerRuntime& runtime_;
  PortAllocator& ports_;
  BackgroundQueue& background_;
};

}

#endif //SANDBOXD_SANDBOX_CONTROLLER_H
