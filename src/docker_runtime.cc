#include "docker_runtime.h"

#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/format.hpp>
#include <glog/logging.h>
#include "util.h"

namespace http = boost::beast::http;

namespace sandboxd {

namespace {

using Socket = boost::asio::local::stream_protocol::socket;
using Endpoint = boost::asio::local::stream_protocol::endpoint;
using Request = http::request<http::string_body>;
using Response = DockerRuntime::Response;

nlohmann::json ParseBody(const Response& response) {
  return nlohmann::json::parse(response.body(), nullptr, false);
}

// One request/response exchange on a fresh connection.
class HttpCall : public std::enable_shared_from_this<HttpCall> {
 public:
  HttpCall(EventLoop& loop,
           std::chrono::milliseconds timeout,
           Request request,
           ResultHandler<Response> handler)
      : socket_(loop),
        deadline_(loop),
        timeout_(timeout),
        request_(std::move(request)),
        handler_(std::move(handler)) {}

  void Start(const std::string& socket_path) {
    auto self = shared_from_this();
    deadline_.expires_after(timeout_);
    deadline_.async_wait([self](const boost::system::error_code& error_code) {
      if (error_code != boost::asio::error::operation_aborted) {
        self->Finish(Status(errc::infrastructure, "docker call timed out"));
      }
    });
    socket_.async_connect(
        Endpoint(socket_path),
        [self](const boost::system::error_code& error_code) {
          self->HandleConnect(error_code);
        });
  }

 private:
  void HandleConnect(const boost::system::error_code& error_code) {
    if (error_code) {
      Finish(Status(errc::infrastructure,
                    "connect to docker: " + error_code.message()));
      return;
    }
    auto self = shared_from_this();
    http::async_write(socket_, request_,
                      [self](const boost::system::error_code& error_code,
                             std::size_t) {
                        self->HandleWrite(error_code);
                      });
  }

  void HandleWrite(const boost::system::error_code& error_code) {
    if (error_code) {
      Finish(Status(errc::infrastructure,
                    "write to docker: " + error_code.message()));
      return;
    }
    auto self = shared_from_this();
    http::async_read(socket_, buffer_, response_,
                     [self](const boost::system::error_code& error_code,
                            std::size_t) {
                       self->HandleRead(error_code);
                     });
  }

  void HandleRead(const boost::system::error_code& error_code) {
    if (error_code) {
      Finish(Status(errc::infrastructure,
                    "read from docker: " + error_code.message()));
      return;
    }
    Finish(Status());
  }

  void Finish(const Status& status) {
    if (done_) {
      return;
    }
    done_ = true;
    deadline_.cancel();
    boost::system::error_code ignored;
    socket_.close(ignored);
    handler_(status, std::move(response_));
  }

  Socket socket_;
  Timer deadline_;
  const std::chrono::milliseconds timeout_;
  Request request_;
  ResultHandler<Response> handler_;
  boost::beast::flat_buffer buffer_;
  Response response_;
  bool done_ = false;
};

// Hijacked connection of a started exec. Bytes after the response header are
// the multiplexed output.
class DockerExecStream : public ExecStream,
                         public std::enable_shared_from_this<DockerExecStream> {
 public:
  DockerExecStream(EventLoop& loop, std::chrono::milliseconds timeout)
      : loop_(loop),
        socket_(loop),
        deadline_(loop),
        timeout_(timeout) {}

  void Open(const std::string& socket_path,
            Request request,
            ResultHandler<std::shared_ptr<ExecStream>> handler) {
    request_ = std::move(request);
    open_handler_ = std::move(handler);
    auto self = shared_from_this();
    deadline_.expires_after(timeout_);
    deadline_.async_wait([self](const boost::system::error_code& error_code) {
      if (error_code != boost::asio::error::operation_aborted) {
        self->FinishOpen(Status(errc::infrastructure, "exec start timed out"));
      }
    });
    socket_.async_connect(
        Endpoint(socket_path),
        [self](const boost::system::error_code& error_code) {
          if (error_code) {
            self->FinishOpen(Status(errc::infrastructure,
                                    "connect to docker: " + error_code.message()));
            return;
          }
          http::async_write(self->socket_, self->request_,
                            [self](const boost::system::error_code& error_code,
                                   std::size_t) {
                              self->HandleWrite(error_code);
                            });
        });
  }

  void AsyncReadSome(boost::asio::mutable_buffer buffer,
                     ReadHandler handler) override {
    if (closed_) {
      boost::asio::post(loop_, [handler]() {
        handler(boost::asio::error::operation_aborted, 0);
      });
      return;
    }
    if (buffer_.size() > 0) {
      std::size_t count = boost::asio::buffer_copy(buffer, buffer_.data());
      buffer_.consume(count);
      boost::asio::post(loop_, [handler, count]() {
        handler(boost::system::error_code(), count);
      });
      return;
    }
    socket_.async_read_some(buffer, std::move(handler));
  }

  void Close() override {
    closed_ = true;
    deadline_.cancel();
    boost::system::error_code ignored;
    socket_.close(ignored);
  }

 private:
  void HandleWrite(const boost::system::error_code& error_code) {
    if (error_code) {
      FinishOpen(Status(errc::infrastructure,
                        "write to docker: " + error_code.message()));
      return;
    }
    auto self = shared_from_this();
    http::async_read_header(socket_, buffer_, parser_,
                            [self](const boost::system::error_code& error_code,
                                   std::size_t) {
                              self->HandleHeader(error_code);
                            });
  }

  void HandleHeader(const boost::system::error_code& error_code) {
    if (error_code) {
      FinishOpen(Status(errc::infrastructure,
                        "read from docker: " + error_code.message()));
      return;
    }
    unsigned status = parser_.get().result_int();
    if (status == 404) {
      FinishOpen(Status(errc::not_found, "no such exec"));
    } else if (status != 101 && status != 200) {
      FinishOpen(Status(errc::runtime,
                        (boost::format("exec start failed with HTTP %1%") %
                         status).str()));
    } else {
      FinishOpen(Status());
    }
  }

  void FinishOpen(const Status& status) {
    if (!open_handler_) {
      return;
    }
    auto handler = std::move(open_handler_);
    open_handler_ = nullptr;
    deadline_.cancel();
    if (!status.ok()) {
      Close();
      handler(status, nullptr);
      return;
    }
    handler(status, shared_from_this());
  }

  EventLoop& loop_;
  Socket socket_;
  Timer deadline_;
  const std::chrono::milliseconds timeout_;
  Request request_;
  ResultHandler<std::shared_ptr<ExecStream>> open_handler_;
  boost::beast::flat_buffer buffer_;
  http::response_parser<http::empty_body> parser_;
  bool closed_ = false;
};

}

DockerRuntime::DockerRuntime(EventLoop& loop,
                             std::string socket_path,
                             std::string api_version,
                             std::chrono::milliseconds timeout)
    : loop_(loop),
      socket_path_(std::move(socket_path)),
      api_version_(std::move(api_version)),
      timeout_(timeout) {}

Request DockerRuntime::MakeRequest(http::verb verb,
                                   const std::string& path,
                                   const nlohmann::json* body) const {
  Request request(verb, "/" + api_version_ + path, 11);
  request.set(http::field::host, "docker");
  request.set(http::field::user_agent, "sandboxd");
  if (body) {
    request.set(http::field::content_type, "application/json");
    request.body() = body->dump();
  }
  request.prepare_payload();
  return request;
}

void DockerRuntime::Call(http::verb verb,
                         const std::string& path,
                         const nlohmann::json* body,
                         ResultHandler<Response> handler) {
  VLOG(1) << "docker " << verb << " " << path;
  auto call = std::make_shared<HttpCall>(
      loop_, timeout_, MakeRequest(verb, path, body), std::move(handler));
  call->Start(socket_path_);
}

Status DockerRuntime::StatusFromResponse(const Response& response,
                                         const std::string& what) {
  unsigned status = response.result_int();
  if (status < 300 || status == 304) {
    return Status();
  }
  std::string message = response.body();
  nlohmann::json body = ParseBody(response);
  if (body.is_object() && body.contains("message") &&
      body["message"].is_string()) {
    message = body["message"].get<std::string>();
  }
  std::string reason =
      (boost::format("%1%: HTTP %2%: %3%") % what % status % message).str();
  if (status == 404) {
    return Status(errc::not_found, reason);
  }
  return Status(errc::runtime, reason);
}

void DockerRuntime::CallForStatus(http::verb verb,
                                  const std::string& path,
                                  const std::string& what,
                                  StatusHandler handler) {
  Call(verb, path, nullptr,
       [handler, what](const Status& status, Response response) {
         handler(status.ok() ? StatusFromResponse(response, what) : status);
       });
}

void DockerRuntime::Ping(StatusHandler handler) {
  CallForStatus(http::verb::get, "/_ping", "ping", std::move(handler));
}

nlohmann::json DockerRuntime::BuildCreateBody(const ContainerSpec& spec) {
  const ResourceProfile& limits = spec.limits;
  const int64_t cpu_period = 100000;
  nlohmann::json ulimits = nlohmann::json::array();
  ulimits.push_back(
      {{"Name", "nofile"}, {"Soft", limits.nofile}, {"Hard", limits.nofile}});
  ulimits.push_back(
      {{"Name", "nproc"}, {"Soft", limits.nproc}, {"Hard", limits.nproc}});

  nlohmann::json host_config;
  host_config["Memory"] = limits.memory_bytes;
  // Same as Memory, so the sandbox cannot swap.
  host_config["MemorySwap"] = limits.memory_bytes;
  host_config["CpuPeriod"] = cpu_period;
  host_config["CpuQuota"] = static_cast<int64_t>(limits.cpus * cpu_period);
  host_config["CpuShares"] = limits.cpu_shares;
  host_config["NetworkMode"] =
      limits.network_mode == NetworkMode::kNone ? "none" : "bridge";
  host_config["AutoRemove"] = false;
  host_config["Binds"] = spec.binds;
  host_config["SecurityOpt"] = spec.security_opt;
  host_config["ReadonlyRootfs"] = false;
  host_config["Tmpfs"] = limits.tmpfs;
  host_config["Ulimits"] = ulimits;
  host_config["OomKillDisable"] = false;
  host_config["PidsLimit"] = limits.pids_limit;
  if (limits.shm_size > 0) {
    host_config["ShmSize"] = limits.shm_size;
  }

  nlohmann::json body;
  body["Image"] = spec.image;
  body["Env"] = spec.env;
  body["WorkingDir"] = spec.working_dir;
  body["Labels"] = spec.labels;
  body["Tty"] = spec.tty;
  body["OpenStdin"] = spec.open_stdin;
  body["AttachStdin"] = false;
  body["AttachStdout"] = false;
  body["AttachStderr"] = false;
  if (limits.network_mode == NetworkMode::kPublished) {
    std::string port_key = std::to_string(limits.container_port) + "/tcp";
    nlohmann::json binding;
    binding["HostPort"] = std::to_string(spec.host_port);
    body["ExposedPorts"][port_key] = nlohmann::json::object();
    host_config["PortBindings"][port_key] = nlohmann::json::array({binding});
  }
  body["HostConfig"] = host_config;
  return body;
}

void DockerRuntime::CreateContainer(const ContainerSpec& spec,
                                    ResultHandler<std::string> handler) {
  nlohmann::json body = BuildCreateBody(spec);
  Call(http::verb::post, "/containers/create?name=" + UrlEncode(spec.name), &body,
       [handler](const Status& status, Response response) {
         if (!status.ok()) {
           handler(status, std::string());
           return;
         }
         Status result = StatusFromResponse(response, "create container");
         if (!result.ok()) {
           handler(result, std::string());
           return;
         }
         nlohmann::json created = ParseBody(response);
         if (!created.is_object() || !created.contains("Id")) {
           handler(Status(errc::runtime, "create container: malformed response"),
                   std::string());
           return;
         }
         handler(Status(), created["Id"].get<std::string>());
       });
}

void DockerRuntime::StartContainer(const std::string& id, StatusHandler handler) {
  CallForStatus(http::verb::post, "/containers/" + id + "/start",
                "start container", std::move(handler));
}

void DockerRuntime::StopContainer(const std::string& id, StatusHandler handler) {
  CallForStatus(http::verb::post, "/containers/" + id + "/stop?t=5",
                "stop container", std::move(handler));
}

void DockerRuntime::KillContainer(const std::string& id, StatusHandler handler) {
  CallForStatus(http::verb::post, "/containers/" + id + "/kill",
                "kill container", std::move(handler));
}

void DockerRuntime::RemoveContainer(const std::string& id,
                                    bool force,
                                    StatusHandler handler) {
  CallForStatus(http::verb::delete_,
                "/containers/" + id + (force ? "?force=true" : ""),
                "remove container", std::move(handler));
}

void DockerRuntime::InspectContainer(const std::string& id,
                                     ResultHandler<ContainerState> handler) {
  Call(http::verb::get, "/containers/" + id + "/json", nullptr,
       [handler, id](const Status& status, Response response) {
         Status result =
             status.ok() ? StatusFromResponse(response, "inspect container")
                         : status;
         ContainerState state;
         state.id = id;
         if (!result.ok()) {
           handler(result, state);
           return;
         }
         nlohmann::json info = ParseBody(response);
         if (!info.is_object() || !info.contains("State") ||
             !info["State"].is_object()) {
           handler(Status(errc::runtime, "inspect container: malformed response"),
                   state);
           return;
         }
         const nlohmann::json& container_state = info["State"];
         state.running = container_state.value("Running", false);
         state.status = container_state.value("Status", "");
         state.exit_code = container_state.value("ExitCode", 0);
         handler(Status(), state);
       });
}

void DockerRuntime::ListContainers(
    const std::string& label,
    ResultHandler<std::vector<ContainerSummary>> handler) {
  nlohmann::json filters;
  filters["label"] = nlohmann::json::array({label});
  Call(http::verb::get,
       "/containers/json?all=true&filters=" + UrlEncode(filters.dump()), nullptr,
       [handler](const Status& status, Response response) {
         Status result =
             status.ok() ? StatusFromResponse(response, "list containers")
                         : status;
         std::vector<ContainerSummary> summaries;
         if (!result.ok()) {
           handler(result, summaries);
           return;
         }
         nlohmann::json list = ParseBody(response);
         if (!list.is_array()) {
           handler(Status(errc::runtime, "list containers: malformed response"),
                   summaries);
           return;
         }
         for (const nlohmann::json& entry : list) {
           ContainerSummary summary;
           summary.id = entry.value("Id", "");
           summary.names =
               entry.value("Names", std::vector<std::string>());
           summary.labels =
               entry.value("Labels", std::map<std::string, std::string>());
           summary.state = entry.value("State", "");
           summaries.push_back(std::move(summary));
         }
         handler(Status(), std::move(summaries));
       });
}

void DockerRuntime::CreateExec(const std::string& container_id,
                               const ExecSpec& spec,
                               ResultHandler<std::string> handler) {
  nlohmann::json body = {
      {"AttachStdin", false},
      {"AttachStdout", true},
      {"AttachStderr", true},
      {"Tty", false},
      {"Cmd", spec.cmd},
  };
  if (!spec.working_dir.empty()) {
    body["WorkingDir"] = spec.working_dir;
  }
  if (!spec.env.empty()) {
    body["Env"] = spec.env;
  }
  Call(http::verb::post, "/containers/" + container_id + "/exec", &body,
       [handler](const Status& status, Response response) {
         Status result =
             status.ok() ? StatusFromResponse(response, "create exec") : status;
         if (!result.ok()) {
           handler(result, std::string());
           return;
         }
         nlohmann::json created = ParseBody(response);
         if (!created.is_object() || !created.contains("Id")) {
           handler(Status(errc::runtime, "create exec: malformed response"),
                   std::string());
           return;
         }
         handler(Status(), created["Id"].get<std::string>());
       });
}

void DockerRuntime::StartExec(
    const std::string& exec_id,
    ResultHandler<std::shared_ptr<ExecStream>> handler) {
  nlohmann::json body = {{"Detach", false}, {"Tty", false}};
  Request request =
      MakeRequest(http::verb::post, "/exec/" + exec_id + "/start", &body);
  request.set(http::field::connection, "Upgrade");
  request.set(http::field::upgrade, "tcp");
  auto stream = std::make_shared<DockerExecStream>(loop_, timeout_);
  stream->Open(socket_path_, std::move(request), std::move(handler));
}

void DockerRuntime::InspectExec(const std::string& exec_id,
                                ResultHandler<ExecState> handler) {
  Call(http::verb::get, "/exec/" + exec_id + "/json", nullptr,
       [handler](const Status& status, Response response) {
         Status result =
             status.ok() ? StatusFromResponse(response, "inspect exec") : status;
         ExecState state;
         if (!result.ok()) {
           handler(result, state);
           return;
         }
         nlohmann::json info = ParseBody(response);
         if (!info.is_object()) {
           handler(Status(errc::runtime, "inspect exec: malformed response"),
                   state);
           return;
         }
         state.running = info.value("Running", false);
         if (info.contains("ExitCode") && info["ExitCode"].is_number()) {
           state.exit_code = info["ExitCode"].get<int>();
         }
         handler(Status(), state);
       });
}

void DockerRuntime::GetMemoryUsage(const std::string& container_id,
                                   ResultHandler<int64_t> handler) {
  Call(http::verb::get, "/containers/" + container_id + "/stats?stream=false",
       nullptr, [handler](const Status& status, Response response) {
         Status result =
             status.ok() ? StatusFromResponse(response, "container stats")
                         : status;
         if (!result.ok()) {
           handler(result, 0);
           return;
         }
         nlohmann::json stats = ParseBody(response);
         if (!stats.is_object() || !stats.contains("memory_stats") ||
             !stats["memory_stats"].is_object() ||
             !stats["memory_stats"].contains("usage")) {
           handler(Status(errc::runtime, "container stats: no memory usage"), 0);
           return;
         }
         handler(Status(), stats["memory_stats"]["usage"].get<int64_t>());
       });
}

}
