#include <gflags/gflags.h>
#include <glog/logging.h>
#include <boost/asio.hpp>
#include <csignal>
#include <memory>
#include "config.h"
#include "docker_runtime.h"
#include "memory_store.h"
#include "redis_store.h"
#include "sandbox_service.h"

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  gflags::SetUsageMessage("Sandbox orchestration daemon");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  sandboxd::Config config = sandboxd::LoadConfigFromFlags();

  boost::asio::io_context io_context;
  sandboxd::DockerRuntime runtime(io_context, config.docker_socket,
                                  config.docker_api_version,
                                  config.runtime_timeout);
  std::unique_ptr<sandboxd::KeyValueStore> store;
  if (config.redis_host.empty()) {
    LOG(INFO) << "No redis host configured, sessions are kept in memory";
    store.reset(new sandboxd::MemoryStore(io_context));
  } else {
    store.reset(new sandboxd::RedisStore(io_context, config.redis_host,
                                         config.redis_port,
                                         config.runtime_timeout));
  }
  sandboxd::SandboxService service(io_context, config, runtime, *store);

  int exit_code = 0;
  boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &error_code,
                         int signal_number) {
    if (error_code == boost::asio::error::operation_aborted) {
      return;
    }
    LOG(INFO) << "Received signal " << signal_number << ", shutting down";
    service.Shutdown([&]() { io_context.stop(); });
  });
  service.Initialize([&](const sandboxd::Status &status) {
    if (!status.ok()) {
      LOG(ERROR) << "Failed to initialize: " << status;
      exit_code = 1;
      io_context.stop();
      return;
    }
    VLOG(1) << "Capabilities: " << service.Capabilities().dump();
  });
  io_context.run();
  return exit_code;
}
