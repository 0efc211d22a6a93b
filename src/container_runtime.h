#ifndef SANDBOXD_CONTAINER_RUNTIME_H
#define SANDBOXD_CONTAINER_RUNTIME_H

#include <boost/asio/buffer.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "sandbox.h"
#include "status.h"

namespace sandboxd {

struct ContainerSpec {
  std::string name;
  std::string image;
  std::vector<std::string> env;
  std::string working_dir;
  std::vector<std::string> binds;
  std::map<std::string, std::string> labels;
  ResourceProfile limits;
  // Published only when limits.network_mode is kPublished.
  uint16_t host_port = 0;
  std::vector<std::string> security_opt;
  bool tty = true;
  bool open_stdin = true;
};

struct ContainerState {
  std::string id;
  bool running = false;
  std::string status;
  int exit_code = 0;
};

struct ContainerSummary {
  std::string id;
  std::vector<std::string> names;
  std::map<std::string, std::string> labels;
  std::string state;
};

struct ExecSpec {
  std::vector<std::string> cmd;
  std::string working_dir;
  std::vector<std::string> env;
};

struct ExecState {
  bool running = false;
  int exit_code = 0;
};

// Raw multiplexed output of an attached exec, see FrameReader.
class ExecStream {
 public:
  using ReadHandler =
      std::function<void(const boost::system::error_code&, std::size_t)>;

  virtual ~ExecStream() = default;
  // Completes with boost::asio::error::eof at the end of the output.
  virtual void AsyncReadSome(boost::asio::mutable_buffer buffer,
                             ReadHandler handler) = 0;
  virtual void Close() = 0;

  ExecStream() = default;
  ExecStream(const ExecStream&) = delete;
  ExecStream& operator=(const ExecStream&) = delete;
};

// Asynchronous container runtime. Every call completes its handler exactly
// once on the event loop, never inline. A missing container or exec fails with
// errc::not_found, an unreachable runtime with errc::infrastructure.
class ContainerRuntime {
 public:
  virtual ~ContainerRuntime() = default;

  virtual void Ping(StatusHandler handler) = 0;
  virtual void CreateContainer(const ContainerSpec& spec,
                               ResultHandler<std::string> handler) = 0;
  virtual void StartContainer(const std::string& id, StatusHandler handler) = 0;
  virtual void StopContainer(const std::string& id, StatusHandler handler) = 0;
  virtual void KillContainer(const std::string& id, StatusHandler handler) = 0;
  virtual void RemoveContainer(const std::string& id,
                               bool force,
                               StatusHandler handler) = 0;
  virtual void InspectContainer(const std::string& id,
                                ResultHandler<ContainerState> handler) = 0;
  // Lists containers, running or not, carrying label |label|.
  virtual void ListContainers(
      const std::string& label,
      ResultHandler<std::vector<ContainerSummary>> handler) = 0;
  virtual void CreateExec(const std::string& container_id,
                          const ExecSpec& spec,
                          ResultHandler<std::string> handler) = 0;
  virtual void StartExec(const std::string& exec_id,
                         ResultHandler<std::shared_ptr<ExecStream>> handler) = 0;
  virtual void InspectExec(const std::string& exec_id,
                           ResultHandler<ExecState> handler) = 0;
  // Current memory usage of the container in bytes.
  virtual void GetMemoryUsage(const std::string& container_id,
                              ResultHandler<int64_t> handler) = 0;

  ContainerRuntime() = default;
  ContainerRuntime(const ContainerRuntime&) = delete;
  ContainerRuntime& operator=(const ContainerRuntime&) = delete;
};

}

#endif //SANDBOXD_CONTAINER_RUNTIME_H
