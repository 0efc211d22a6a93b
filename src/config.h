#ifndef SANDBOXD_CONFIG_H
#define SANDBOXD_CONFIG_H

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "sandbox.h"

namespace sandboxd {

struct SchedulerConfig {
  std::size_t max_concurrent = 10;
  int rate_limit_points = 50;
  std::chrono::milliseconds rate_limit_window{1000};
  // How long a request may wait for admission before failing.
  std::chrono::milliseconds queue_timeout{60000};
  std::chrono::milliseconds default_timeout{30000};
  std::chrono::milliseconds max_timeout{300000};
  int64_t default_max_output_bytes = int64_t(10) << 20;
  int64_t max_output_bytes = int64_t(10) << 20;
};

struct SecurityConfig {
  int client_rate_limit_points = 50;
  std::chrono::milliseconds client_rate_limit_window{60000};
  std::vector<std::string> api_keys;
  std::vector<std::string> allowed_origins;
};

struct PortConfig {
  uint16_t range_begin = 8080;
  uint16_t range_end = 9999;
  uint16_t scan_window = 1000;
  std::chrono::milliseconds release_grace{30000};
};

struct Config {
  // Container runtime.
  std::string docker_socket = "/var/run/docker.sock";
  std::string docker_api_version = "v1.41";
  std::chrono::milliseconds runtime_timeout{30000};
  std::string label_prefix = "mcp";
  std::string image_prefix = "mcp-";
  std::string workspace_root = "/app/sessions";
  std::string public_host = "localhost";

  // Session store.
  std::string redis_host;
  uint16_t redis_port = 6379;
  std::chrono::milliseconds session_ttl{std::chrono::hours(24)};
  std::chrono::milliseconds sweep_interval{60000};

  // Pre-warmed pools.
  std::size_t pool_size = 3;
  std::vector<std::string> pool_languages = {"python", "javascript"};
  bool pool_ide = true;
  bool pool_browser = true;
  std::chrono::milliseconds pool_maintain_interval{60000};

  SchedulerConfig scheduler;
  SecurityConfig security;
  PortConfig ports;
  std::map<SandboxType, ResourceProfile> profiles = DefaultProfiles();

  std::string SessionLabel() const { return label_prefix + ".session"; }
};

// Builds a Config from the command line flags.
Config LoadConfigFromFlags();

}

#endif //SANDBOXD_CONFIG_H
