#include "execution_scheduler.h"

#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/post.hpp>
#include <glog/logging.h>
#include <algorithm>
#include <array>
#include "frame_reader.h"
#include "language.h"
#include "util.h"

namespace sandboxd {

namespace {

const char kWorkspaceMount[] = "/workspace";

Status RuntimeFailure(const std::string& what, const Status& cause) {
  return Status(errc::runtime, what + ": " + cause.reason());
}

// Reads |stream| to its end and discards the output.
void DrainStream(std::shared_ptr<ExecStream> stream, StatusHandler done) {
  auto buffer = std::make_shared<std::array<char, 1024>>();
  stream->AsyncReadSome(
      boost::asio::buffer(*buffer),
      [stream, buffer, done](const boost::system::error_code& error_code,
                             std::size_t) {
        if (error_code == boost::asio::error::eof) {
          stream->Close();
          done(Status());
        } else if (error_code) {
          stream->Close();
          done(Status(errc::runtime, error_code.message()));
        } else {
          DrainStream(stream, done);
        }
      });
}

class Execution : public std::enable_shared_from_this<Execution> {
 public:
  Execution(EventLoop& loop,
            ContainerRuntime& runtime,
            BackgroundQueue& background,
            const SandboxHandle& sandbox,
            const Language& language,
            const std::string& code,
            std::chrono::milliseconds timeout,
            int64_t max_output_bytes,
            ResultHandler<ExecutionResult> handler)
      : runtime_(runtime),
        background_(background),
        sandbox_(sandbox),
        language_(language),
        code_(code),
        timeout_(timeout),
        max_output_bytes_(static_cast<std::size_t>(max_output_bytes)),
        handler_(std::move(handler)),
        timer_(loop),
        reader_([this](StreamChannel channel, StringView data) {
          return HandleOutput(channel, data);
        }) {}

  void Start();

 private:
  void HandleCreateExec(const Status& status, const std::string& exec_id);
  void HandleStartExec(const Status& status,
                       std::shared_ptr<ExecStream> stream);
  void ReadMore();
  void HandleRead(const boost::system::error_code& error_code,
                  std::size_t size);
  bool HandleOutput(StreamChannel channel, StringView data);
  void HandleEnd();
  void HandleInspect(const Status& status, const ExecState& state);
  void HandleTimeout(const boost::system::error_code& error_code);
  void Abort(const Status& status);
  void KillProcesses();
  void Complete(const Status& status);

  ContainerRuntime& runtime_;
  BackgroundQueue& background_;
  const SandboxHandle sandbox_;
  const Language& language_;
  const std::string code_;
  const std::chrono::milliseconds timeout_;
  const std::size_t max_output_bytes_;
  ResultHandler<ExecutionResult> handler_;
  Timer timer_;
  FrameReader reader_;
  TimePoint start_time_;
  Path host_file_;
  std::string container_file_;
  std::string exec_id_;
  std::shared_ptr<ExecStream> stream_;
  std::array<char, 8192> chunk_;
  ExecutionResult result_;
  bool finished_ = false;
};

void Execution::Start() {
  start_time_ = Clock::now();
  auto self = shared_from_this();
  timer_.expires_after(timeout_);
  timer_.async_wait([self](const boost::system::error_code& error_code) {
    if (error_code == boost::asio::error::operation_aborted) {
      return;
    }
    self->HandleTimeout(error_code);
  });

  Path name = RandomPath("code_%%%%%%%%%%%%" + language_.extension);
  host_file_ = Path(sandbox_.workspace_path) / name;
  container_file_ = std::string(kWorkspaceMount) + "/" + name.string();
  Status status = WriteFile(host_file_, code_);
  if (!status.ok()) {
    host_file_.clear();
    Complete(status);
    return;
  }

  ExecSpec spec;
  spec.cmd = {"sh", "-c", BuildRunCommand(language_, container_file_)};
  spec.working_dir = kWorkspaceMount;
  VLOG(1) << "Running " << container_file_ << " in " << sandbox_.name;
  runtime_.CreateExec(sandbox_.id, spec, [self](const Status& status,
                                                std::string exec_id) {
    self->HandleCreateExec(status, exec_id);
  });
}

void Execution::HandleCreateExec(const Status& status,
                                 const std::string& exec_id) {
  if (finished_) {
    return;
  }
  if (!status.ok()) {
    Complete(RuntimeFailure("create exec", status));
    return;
  }
  exec_id_ = exec_id;
  auto self = shared_from_this();
  runtime_.StartExec(exec_id_, [self](const Status& status,
                                      std::shared_ptr<ExecStream> stream) {
    self->HandleStartExec(status, std::move(stream));
  });
}

void Execution::HandleStartExec(const Status& status,
                                std::shared_ptr<ExecStream> stream) {
  if (finished_) {
    if (stream) {
      stream->Close();
    }
    return;
  }
  if (!status.ok()) {
    Complete(RuntimeFailure("start exec", status));
    return;
  }
  stream_ = std::move(stream);
  ReadMore();
}

void Execution::ReadMore() {
  auto self = shared_from_this();
  stream_->AsyncReadSome(
      boost::asio::buffer(chunk_),
      [self](const boost::system::error_code& error_code, std::size_t size) {
        self->HandleRead(error_code, size);
      });
}

void Execution::HandleRead(const boost::system::error_code& error_code,
                           std::size_t size) {
  if (finished_) {
    return;
  }
  if (size > 0) {
    switch (reader_.Feed(chunk_.data(), size)) {
    case FrameReader::FeedResult::kOk:
      break;
    case FrameReader::FeedResult::kStopped:
      Abort(Status(errc::output_limit,
                   "output exceeded " + std::to_string(max_output_bytes_) +
                       " bytes"));
      return;
    case FrameReader::FeedResult::kMalformed:
      Abort(Status(errc::runtime, "malformed exec output stream"));
      return;
    }
  }
  if (error_code == boost::asio::error::eof) {
    HandleEnd();
  } else if (error_code) {
    Abort(Status(errc::runtime, "exec stream: " + error_code.message()));
  } else {
    ReadMore();
  }
}

bool Execution::HandleOutput(StreamChannel channel, StringView data) {
  std::string& sink = channel == StreamChannel::kStderr
      ? result_.stderr_text : result_.stdout_text;
  if (sink.size() + data.size() > max_output_bytes_) {
    sink.append(data.data(), max_output_bytes_ - sink.size());
    return false;
  }
  sink.append(data.data(), data.size());
  return true;
}

void Execution::HandleEnd() {
  if (!reader_.at_frame_boundary()) {
    LOG(WARNING) << "Exec output of " << sandbox_.name
                 << " ended inside a frame";
  }
  stream_->Close();
  stream_.reset();
  auto self = shared_from_this();
  runtime_.InspectExec(exec_id_, [self](const Status& status,
                                        ExecState state) {
    self->HandleInspect(status, state);
  });
}

void Execution::HandleInspect(const Status& status, const ExecState& state) {
  if (finished_) {
    return;
  }
  if (!status.ok()) {
    Complete(RuntimeFailure("inspect exec", status));
    return;
  }
  result_.exit_code = state.exit_code;
  auto self = shared_from_this();
  runtime_.GetMemoryUsage(sandbox_.id, [self](const Status& status,
                                              int64_t bytes) {
    if (status.ok()) {
      self->result_.memory_usage_mb = (bytes + (int64_t(1) << 19)) >> 20;
    } else {
      VLOG(1) << "No memory usage for " << self->sandbox_.name << ": "
              << status;
    }
    self->Complete(Status());
  });
}

void Execution::HandleTimeout(const boost::system::error_code& error_code) {
  CHECK(!error_code) << error_code.message();
  Abort(Status(errc::timeout, "execution exceeded " +
                                  std::to_string(timeout_.count()) + "ms"));
}

void Execution::Abort(const Status& status) {
  if (finished_) {
    return;
  }
  if (stream_) {
    stream_->Close();
    stream_.reset();
  }
  Complete(status);
  if (!container_file_.empty()) {
    KillProcesses();
  }
}

void Execution::KillProcesses() {
  ContainerRuntime* runtime = &runtime_;
  std::string container_id = sandbox_.id;
  std::string file = container_file_;
  background_.Submit("kill " + file, [runtime, container_id, file](
      StatusHandler done) {
    ExecSpec spec;
    spec.cmd = {"pkill", "-KILL", "-f", file};
    runtime->CreateExec(container_id, spec, [runtime, done](
        const Status& status, std::string exec_id) {
      if (!status.ok()) {
        done(status);
        return;
      }
      runtime->StartExec(exec_id, [done](const Status& status,
                                         std::shared_ptr<ExecStream> stream) {
        if (!status.ok()) {
          done(status);
          return;
        }
        DrainStream(stream, done);
      });
    });
  });
}

void Execution::Complete(const Status& status) {
  if (finished_) {
    return;
  }
  finished_ = true;
  timer_.cancel();
  result_.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      Clock::now() - start_time_).count();
  boost::algorithm::trim(result_.stdout_text);
  boost::algorithm::trim(result_.stderr_text);
  if (!host_file_.empty()) {
    Path file = host_file_;
    background_.Submit("remove " + file.string(), [file](StatusHandler done) {
      done(RemoveFile(file));
    });
  }
  if (status.ok()) {
    VLOG(1) << "Execution in " << sandbox_.name << " exited with "
            << result_.exit_code << " after " << result_.duration_ms << "ms";
  } else {
    LOG(INFO) << "Execution in " << sandbox_.name << " failed: " << status;
  }
  ResultHandler<ExecutionResult> handler = std::move(handler_);
  handler(status, result_);
}

}

ExecutionScheduler::ExecutionScheduler(EventLoop& loop,
                                       ContainerRuntime& runtime,
                                       BackgroundQueue& background,
                                       const SchedulerConfig& config)
    : loop_(loop),
      runtime_(runtime),
      background_(background),
      config_(config),
      limiter_(config.rate_limit_points, config.rate_limit_window),
      rate_timer_(loop) {
  CHECK_GT(config_.max_concurrent, 0u);
}

std::chrono::milliseconds ExecutionScheduler::EffectiveTimeout(
    int64_t requested_ms) const {
  if (requested_ms <= 0) {
    return config_.default_timeout;
  }
  return std::min(std::chrono::milliseconds(requested_ms), config_.max_timeout);
}

int64_t ExecutionScheduler::EffectiveOutputLimit(
    int64_t requested_bytes) const {
  if (requested_bytes <= 0) {
    return config_.default_max_output_bytes;
  }
  return std::min(requested_bytes, config_.max_output_bytes);
}

void ExecutionScheduler::Execute(const SandboxHandle& sandbox,
                                 const ExecutionRequest& request,
                                 ResultHandler<ExecutionResult> handler) {
  Status status;
  if (!FindLanguage(request.language)) {
    status = Status(errc::validation, "unsupported language: " + request.language);
  } else if (sandbox.id.empty()) {
    status = Status(errc::not_found, "session has no sandbox");
  }
  if (!status.ok()) {
    boost::asio::post(loop_, [handler, status]() {
      handler(status, ExecutionResult());
    });
    return;
  }

  auto waiter = std::make_shared<Waiter>();
  waiter->sandbox = sandbox;
  waiter->request = request;
  waiter->handler = std::move(handler);
  waiter->deadline.reset(new Timer(loop_));
  waiter->deadline->expires_after(config_.queue_timeout);
  waiter->deadline->async_wait(
      [this, waiter](const boost::system::error_code& error_code) {
        if (error_code == boost::asio::error::operation_aborted) {
          return;
        }
        HandleQueueTimeout(waiter, error_code);
      });
  queue_.push_back(waiter);
  Pump();
}

void ExecutionScheduler::Pump() {
  while (!queue_.empty() && running_ < config_.max_concurrent) {
    TimePoint now = Clock::now();
    if (!limiter_.TryConsume(now)) {
      ArmRateTimer(limiter_.RetryAfter(now));
      return;
    }
    std::shared_ptr<Waiter> waiter = queue_.front();
    queue_.pop_front();
    waiter->deadline->cancel();
    Run(waiter);
  }
}

void ExecutionScheduler::ArmRateTimer(Clock::duration delay) {
  if (rate_timer_armed_) {
    return;
  }
  rate_timer_armed_ = true;
  rate_timer_.expires_after(delay);
  rate_timer_.async_wait([this](const boost::system::error_code& error_code) {
    if (error_code == boost::asio::error::operation_aborted) {
      return;
    }
    rate_timer_armed_ = false;
    Pump();
  });
}

void ExecutionScheduler::HandleQueueTimeout(
    const std::shared_ptr<Waiter>& waiter,
    const boost::system::error_code& error_code) {
  CHECK(!error_code) << error_code.message();
  auto iter = std::find(queue_.begin(), queue_.end(), waiter);
  if (iter == queue_.end()) {
    return;
  }
  queue_.erase(iter);
  LOG(WARNING) << "Execution for session " << waiter->request.session_id
               << " timed out in queue";
  waiter->handler(Status(errc::capacity,
                         "execution queue timeout after " +
                             std::to_string(config_.queue_timeout.count()) +
                             "ms"),
                  ExecutionResult());
}

void ExecutionScheduler::Run(const std::shared_ptr<Waiter>& waiter) {
  ++running_;
  ResultHandler<ExecutionResult> handler = std::move(waiter->handler);
  auto execution = std::make_shared<Execution>(
      loop_, runtime_, background_, waiter->sandbox,
      *FindLanguage(waiter->request.language), waiter->request.code,
      EffectiveTimeout(waiter->request.timeout_ms),
      EffectiveOutputLimit(waiter->request.max_output_bytes),
      [this, handler](const Status& status, ExecutionResult result) {
        --running_;
        handler(status, std::move(result));
        Pump();
      });
  boost::asio::post(loop_, [execution]() { execution->Start(); });
}

}
