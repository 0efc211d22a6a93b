#include "config.h"

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <algorithm>
#include "util.h"

DEFINE_string(docker_socket, "/var/run/docker.sock",
              "Unix socket of the Docker engine.");
DEFINE_string(docker_api_version, "v1.41", "Docker engine API version.");
DEFINE_int32(runtime_timeout_ms, 30000,
             "Timeout of a single container runtime call.");
DEFINE_string(label_prefix, "mcp",
              "Prefix of the labels put on every sandbox container.");
DEFINE_string(image_prefix, "mcp-", "Prefix of sandbox image names.");
DEFINE_string(workspace_root, "/app/sessions",
              "Host directory holding per-sandbox workspaces.");
DEFINE_string(public_host, "localhost",
              "Host name used in published endpoint URLs.");

DEFINE_string(redis_host, "",
              "Redis host for session records, empty to keep them in memory.");
DEFINE_int32(redis_port, 6379, "Redis port.");
DEFINE_int64(session_ttl_s, 24 * 60 * 60, "Idle time before a session expires.");
DEFINE_int32(sweep_interval_s, 60, "Interval of the expired session sweep.");

DEFINE_int32(pool_size, 3, "Pre-warmed sandboxes kept per pool.");
DEFINE_string(pool_languages, "python,javascript",
              "Languages with a pre-warmed execution pool.");
DEFINE_bool(pool_ide, true, "Keep a pre-warmed IDE pool.");
DEFINE_bool(pool_browser, true, "Keep a pre-warmed browser automation pool.");
DEFINE_int32(pool_maintain_interval_s, 60, "Interval of pool maintenance.");

DEFINE_int32(max_concurrent_executions, 10,
             "Executions allowed to run at the same time.");
DEFINE_int32(execution_rate_limit, 50,
             "Executions admitted per rate limit window.");
DEFINE_int32(execution_rate_window_ms, 1000,
             "Window of the execution admission rate limit.");
DEFINE_int32(scheduler_queue_timeout_ms, 60000,
             "How long a request waits for admission before failing.");
DEFINE_int32(default_timeout_ms, 30000, "Default execution timeout.");
DEFINE_int32(max_timeout_ms, 300000, "Largest execution timeout accepted.");
DEFINE_int64(default_max_output_bytes, 10 << 20,
             "Default cap on captured bytes per output stream.");
DEFINE_int64(max_output_bytes, 10 << 20,
             "Largest per stream output cap accepted.");

DEFINE_int32(client_rate_limit_points, 50, "Request points per client window.");
DEFINE_int32(client_rate_limit_window_s, 60, "Per client rate limit window.");
DEFINE_string(api_keys, "", "Comma separated accepted API keys, empty for none.");
DEFINE_string(allowed_origins, "http://localhost:8080",
              "Comma separated accepted request origins.");

DEFINE_int32(port_range_begin, 8080, "First host port handed to sandboxes.");
DEFINE_int32(port_range_end, 9999, "Last host port handed to sandboxes.");
DEFINE_int32(port_release_grace_s, 30,
             "How long a handed out port stays reserved.");
DEFINE_int32(ide_port_base, 8080, "Where IDE port allocation starts.");
DEFINE_int32(browser_port_base, 9222,
             "Where browser automation port allocation starts.");

DEFINE_string(execution_memory, "5g", "Memory limit of execution sandboxes.");
DEFINE_double(execution_cpus, 0.5, "CPU limit of execution sandboxes.");
DEFINE_string(ide_memory, "5g", "Memory limit of IDE sandboxes.");
DEFINE_double(ide_cpus, 1.0, "CPU limit of IDE sandboxes.");
DEFINE_string(browser_memory, "5g",
              "Memory limit of browser automation sandboxes.");
DEFINE_double(browser_cpus, 1.0, "CPU limit of browser automation sandboxes.");

namespace sandboxd {

namespace {

void ApplyProfileFlags(ResourceProfile* profile,
                       const std::string& memory,
                       double cpus) {
  Optional<int64_t> bytes = ParseMemorySize(memory);
  if (bytes) {
    profile->memory_bytes = *bytes;
  } else {
    LOG(WARNING) << "Ignoring malformed memory size " << memory;
  }
  if (cpus > 0) {
    profile->cpus = cpus;
  }
}

}

Config LoadConfigFromFlags() {
  Config config;
  config.docker_socket = FLAGS_docker_socket;
  config.docker_api_version = FLAGS_docker_api_version;
  config.runtime_timeout = std::chrono::milliseconds(FLAGS_runtime_timeout_ms);
  config.label_prefix = FLAGS_label_prefix;
  config.image_prefix = FLAGS_image_prefix;
  config.workspace_root = FLAGS_workspace_root;
  config.public_host = FLAGS_public_host;

  config.redis_host = FLAGS_redis_host;
  config.redis_port = static_cast<uint16_t>(FLAGS_redis_port);
  config.session_ttl = std::chrono::seconds(FLAGS_session_ttl_s);
  config.sweep_interval = std::chrono::seconds(FLAGS_sweep_interval_s);

  config.pool_size = static_cast<std::size_t>(std::max(FLAGS_pool_size, 0));
  config.pool_languages = SplitList(FLAGS_pool_languages);
  config.pool_ide = FLAGS_pool_ide;
  config.pool_browser = FLAGS_pool_browser;
  config.pool_maintain_interval =
      std::chrono::seconds(FLAGS_pool_maintain_interval_s);

  SchedulerConfig& scheduler = config.scheduler;
  scheduler.max_concurrent =
      static_cast<std::size_t>(std::max(FLAGS_max_concurrent_executions, 1));
  scheduler.rate_limit_points = std::max(FLAGS_execution_rate_limit, 1);
  scheduler.rate_limit_window =
      std::chrono::milliseconds(FLAGS_execution_rate_window_ms);
  scheduler.queue_timeout =
      std::chrono::milliseconds(FLAGS_scheduler_queue_timeout_ms);
  scheduler.default_timeout = std::chrono::milliseconds(FLAGS_default_timeout_ms);
  scheduler.max_timeout = std::chrono::milliseconds(FLAGS_max_timeout_ms);
  scheduler.default_max_output_bytes = FLAGS_default_max_output_bytes;
  scheduler.max_output_bytes = FLAGS_max_output_bytes;

  SecurityConfig& security = config.security;
  security.client_rate_limit_points = FLAGS_client_rate_limit_points;
  security.client_rate_limit_window =
      std::chrono::seconds(FLAGS_client_rate_limit_window_s);
  security.api_keys = SplitList(FLAGS_api_keys);
  security.allowed_origins = SplitList(FLAGS_allowed_origins);

  config.ports.range_begin = static_cast<uint16_t>(FLAGS_port_range_begin);
  config.ports.range_end = static_cast<uint16_t>(FLAGS_port_range_end);
  config.ports.release_grace = std::chrono::seconds(FLAGS_port_release_grace_s);
  CHECK_LE(config.ports.range_begin, config.ports.range_end);

  ResourceProfile& execution = config.profiles[SandboxType::kExecution];
  ApplyProfileFlags(&execution, FLAGS_execution_memory, FLAGS_execution_cpus);
  ResourceProfile& ide = config.profiles[SandboxType::kIde];
  ApplyProfileFlags(&ide, FLAGS_ide_memory, FLAGS_ide_cpus);
  ide.host_port_base = static_cast<uint16_t>(FLAGS_ide_port_base);
  ResourceProfile& browser = config.profiles[SandboxType::kBrowser];
  ApplyProfileFlags(&browser, FLAGS_browser_memory, FLAGS_browser_cpus);
  browser.host_port_base = static_cast<uint16_t>(FLAGS_browser_port_base);
  return config;
}

}
