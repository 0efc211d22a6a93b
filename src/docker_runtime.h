#ifndef SANDBOXD_DOCKER_RUNTIME_H
#define SANDBOXD_DOCKER_RUNTIME_H

#include <boost/beast/http.hpp>
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include "container_runtime.h"
#include "shim.h"

namespace sandboxd {

// Docker engine API over its unix socket. One connection per call, attached
// exec output is read from the hijacked connection.
class DockerRuntime : public ContainerRuntime {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  DockerRuntime(EventLoop& loop,
                std::string socket_path,
                std::string api_version,
                std::chrono::milliseconds timeout);

  void Ping(StatusHandler handler) override;
  void CreateContainer(const ContainerSpec& spec,
                       ResultHandler<std::string> handler) override;
  void StartContainer(const std::string& id, StatusHandler handler) override;
  void StopContainer(const std::string& id, StatusHandler handler) override;
  void KillContainer(const std::string& id, StatusHandler handler) override;
  void RemoveContainer(const std::string& id,
                       bool force,
                       StatusHandler handler) override;
  void InspectContainer(const std::string& id,
                        ResultHandler<ContainerState> handler) override;
  void ListContainers(
      const std::string& label,
      ResultHandler<std::vector<ContainerSummary>> handler) override;
  void CreateExec(const std::string& container_id,
                  const ExecSpec& spec,
                  ResultHandler<std::string> handler) override;
  void StartExec(const std::string& exec_id,
                 ResultHandler<std::shared_ptr<ExecStream>> handler) override;
  void InspectExec(const std::string& exec_id,
                   ResultHandler<ExecState> handler) override;
  void GetMemoryUsage(const std::string& container_id,
                      ResultHandler<int64_t> handler) override;

  static nlohmann::json BuildCreateBody(const ContainerSpec& spec);

  // Maps an engine response to a Status, |what| names the call for messages.
  static Status StatusFromResponse(const Response& response,
                                   const std::string& what);

 private:
  void Call(boost::beast::http::verb verb,
            const std::string& path,
            const nlohmann::json* body,
            ResultHandler<Response> handler);
  void CallForStatus(boost::beast::http::verb verb,
                     const std::string& path,
                     const std::string& what,
                     StatusHandler handler);
  boost::beast::http::request<boost::beast::http::string_body> MakeRequest(
      boost::beast::http::verb verb,
      const std::string& path,
      const nlohmann::json* body) const;

  EventLoop& loop_;
  const std::string socket_path_;
  const std::string api_version_;
  const std::chrono::milliseconds timeout_;
};

}

#endif //SANDBOXD_DOCKER_RUNTIME_H
