#include "redis_store.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <glog/logging.h>

namespace sandboxd {

namespace {

const std::chrono::seconds kReconnectBackoff(5);

bool ReadLine(const std::string& data, std::size_t* pos, std::string* line) {
  std::size_t end = data.find("\r\n", *pos);
  if (end == std::string::npos) {
    return false;
  }
  *line = data.substr(*pos, end - *pos);
  *pos = end + 2;
  return true;
}

bool ParseInteger(const std::string& text, int64_t* value) {
  if (text.empty()) {
    return false;
  }
  std::size_t parsed = 0;
  try {
    *value = std::stoll(text, &parsed);
  } catch (const std::exception&) {
    return false;
  }
  return parsed == text.size();
}

std::string EscapeGlob(const std::string& text) {
  std::string escaped;
  for (char c : text) {
    if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(c);
  }
  return escaped;
}

Status ReplyError(const RespReply& reply, const std::string& command) {
  return Status(errc::infrastructure, "redis " + command + ": " + reply.text);
}

}

RespParse ParseRespReply(const std::string& data,
                         std::size_t* pos,
                         RespReply* reply) {
  if (*pos >= data.size()) {
    return RespParse::kIncomplete;
  }
  std::size_t cursor = *pos;
  char type = data[cursor++];
  std::string line;
  if (!ReadLine(data, &cursor, &line)) {
    return RespParse::kIncomplete;
  }
  RespReply parsed;
  switch (type) {
  case '+':
    parsed.type = RespReply::Type::kSimpleString;
    parsed.text = line;
    break;
  case '-':
    parsed.type = RespReply::Type::kError;
    parsed.text = line;
    break;
  case ':':
    parsed.type = RespReply::Type::kInteger;
    if (!ParseInteger(line, &parsed.integer)) {
      return RespParse::kMalformed;
    }
    break;
  case '$': {
    int64_t length;
    if (!ParseInteger(line, &length) || length < -1) {
      return RespParse::kMalformed;
    }
    if (length == -1) {
      parsed.type = RespReply::Type::kNil;
      break;
    }
    if (data.size() < cursor + length + 2) {
      return RespParse::kIncomplete;
    }
    if (data.compare(cursor + length, 2, "\r\n") != 0) {
      return RespParse::kMalformed;
    }
    parsed.type = RespReply::Type::kBulkString;
    parsed.text = data.substr(cursor, length);
    cursor += length + 2;
    break;
  }
  case '*': {
    int64_t count;
    if (!ParseInteger(line, &count) || count < -1) {
      return RespParse::kMalformed;
    }
    if (count == -1) {
      parsed.type = RespReply::Type::kNil;
      break;
    }
    parsed.type = RespReply::Type::kArray;
    for (int64_t i = 0; i < count; ++i) {
      RespReply element;
      RespParse result = ParseRespReply(data, &cursor, &element);
      if (result != RespParse::kOk) {
        return result;
      }
      parsed.elements.push_back(std::move(element));
    }
    break;
  }
  default:
    return RespParse::kMalformed;
  }
  *reply = std::move(parsed);
  *pos = cursor;
  return RespParse::kOk;
}

std::string EncodeRespCommand(const std::vector<std::string>& args) {
  std::string payload = "*" + std::to_string(args.size()) + "\r\n";
  for (const std::string& arg : args) {
    payload += "$" + std::to_string(arg.size()) + "\r\n";
    payload += arg;
    payload += "\r\n";
  }
  return payload;
}

RedisStore::RedisStore(EventLoop& loop,
                       std::string host,
                       uint16_t port,
                       std::chrono::milliseconds timeout)
    : loop_(loop),
      host_(std::move(host)),
      port_(port),
      timeout_(timeout),
      resolver_(loop),
      socket_(loop),
      deadline_(loop) {}

void RedisStore::Command(std::vector<std::string> args,
                         ResultHandler<RespReply> handler) {
  if (state_ == State::kDisconnected && queue_.empty() &&
      Clock::now() < retry_after_) {
    boost::asio::post(loop_, [handler]() {
      handler(Status(errc::infrastructure, "redis unavailable"), RespReply());
    });
    return;
  }
  queue_.push_back(Pending{EncodeRespCommand(args), std::move(handler)});
  Pump();
}

void RedisStore::Pump() {
  if (in_flight_ || queue_.empty()) {
    return;
  }
  if (state_ == State::kDisconnected) {
    Connect();
    return;
  }
  if (state_ == State::kConnecting) {
    return;
  }
  in_flight_ = true;
  ArmDeadline();
  uint64_t generation = generation_;
  boost::asio::async_write(
      socket_, boost::asio::buffer(queue_.front().payload),
      [this, generation](const boost::system::error_code& error_code,
                         std::size_t) {
        if (generation != generation_) {
          return;
        }
        if (error_code) {
          Fail(Status(errc::infrastructure,
                      "redis write: " + error_code.message()));
          return;
        }
        Read();
      });
}

void RedisStore::Connect() {
  state_ = State::kConnecting;
  ArmDeadline();
  uint64_t generation = generation_;
  resolver_.async_resolve(
      host_, std::to_string(port_),
      [this, generation](
          const boost::system::error_code& error_code,
          boost::asio::ip::tcp::resolver::results_type results) {
        if (generation != generation_) {
          return;
        }
        if (error_code) {
          Fail(Status(errc::infrastructure,
                      "redis resolve " + host_ + ": " + error_code.message()));
          return;
        }
        boost::asio::async_connect(
            socket_, results,
            [this, generation](const boost::system::error_code& error_code,
                               const boost::asio::ip::tcp::endpoint&) {
              if (generation != generation_) {
                return;
              }
              if (error_code) {
                Fail(Status(errc::infrastructure,
                            "redis connect: " + error_code.message()));
                return;
              }
              LOG(INFO) << "Connected to redis at " << host_ << ":" << port_;
              state_ = State::kConnected;
              deadline_.cancel();
              Pump();
            });
      });
}

void RedisStore::ArmDeadline() {
  deadline_.expires_after(timeout_);
  uint64_t generation = generation_;
  deadline_.async_wait(
      [this, generation](const boost::system::error_code& error_code) {
        if (error_code == boost::asio::error::operation_aborted ||
            generation != generation_) {
          return;
        }
        Fail(Status(errc::infrastructure, "redis timed out"));
      });
}

void RedisStore::Read() {
  std::size_t pos = 0;
  RespReply reply;
  switch (ParseRespReply(read_buffer_, &pos, &reply)) {
  case RespParse::kOk:
    read_buffer_.erase(0, pos);
    Complete(std::move(reply));
    return;
  case RespParse::kMalformed:
    Fail(Status(errc::infrastructure, "redis sent a malformed reply"));
    return;
  case RespParse::kIncomplete:
    break;
  }
  uint64_t generation = generation_;
  socket_.async_read_some(
      boost::asio::buffer(chunk_),
      [this, generation](const boost::system::error_code& error_code,
                         std::size_t count) {
        if (generation != generation_) {
          return;
        }
        if (error_code) {
          Fail(Status(errc::infrastructure,
                      "redis read: " + error_code.message()));
          return;
        }
        read_buffer_.append(chunk_.data(), count);
        Read();
      });
}

void RedisStore::Complete(RespReply reply) {
  deadline_.cancel();
  Pending pending = std::move(queue_.front());
  queue_.pop_front();
  in_flight_ = false;
  pending.handler(Status(), std::move(reply));
  Pump();
}

void RedisStore::Fail(const Status& status) {
  LOG(WARNING) << "Redis failure: " << status;
  ++generation_;
  deadline_.cancel();
  resolver_.cancel();
  boost::system::error_code ignored;
  socket_.close(ignored);
  state_ = State::kDisconnected;
  in_flight_ = false;
  read_buffer_.clear();
  retry_after_ = Clock::now() + kReconnectBackoff;
  std::deque<Pending> failed;
  failed.swap(queue_);
  for (Pending& pending : failed) {
    pending.handler(status, RespReply());
  }
}

void RedisStore::Get(const std::string& key,
                     ResultHandler<Optional<std::string>> handler) {
  Command({"GET", key}, [handler](const Status& status, RespReply reply) {
    if (!status.ok()) {
      handler(status, boost::none);
    } else if (reply.type == RespReply::Type::kError) {
      handler(ReplyError(reply, "GET"), boost::none);
    } else if (reply.type == RespReply::Type::kBulkString) {
      handler(Status(), reply.text);
    } else {
      handler(Status(), boost::none);
    }
  });
}

void RedisStore::SetWithTtl(const std::string& key,
                            const std::string& value,
                            std::chrono::milliseconds ttl,
                            StatusHandler handler) {
  Command({"SET", key, value, "PX", std::to_string(ttl.count())},
          [handler](const Status& status, RespReply reply) {
            if (status.ok() && reply.type == RespReply::Type::kError) {
              handler(ReplyError(reply, "SET"));
              return;
            }
            handler(status);
          });
}

void RedisStore::Delete(const std::string& key, ResultHandler<bool> handler) {
  Command({"DEL", key}, [handler](const Status& status, RespReply reply) {
    if (status.ok() && reply.type == RespReply::Type::kError) {
      handler(ReplyError(reply, "DEL"), false);
      return;
    }
    handler(status, status.ok() && reply.integer > 0);
  });
}

void RedisStore::ScanPrefix(const std::string& prefix,
                            ResultHandler<KeyValues> handler) {
  auto scan = std::make_shared<Scan>();
  scan->pattern = EscapeGlob(prefix) + "*";
  scan->handler = std::move(handler);
  ScanStep(scan);
}

void RedisStore::ScanStep(std::shared_ptr<Scan> scan) {
  Command({"SCAN", scan->cursor, "MATCH", scan->pattern, "COUNT", "100"},
          [this, scan](const Status& status, RespReply reply) {
            if (!status.ok()) {
              scan->handler(status, KeyValues());
              return;
            }
            if (reply.type != RespReply::Type::kArray ||
                reply.elements.size() != 2 ||
                reply.elements[1].type != RespReply::Type::kArray) {
              scan->handler(ReplyError(reply, "SCAN"), KeyValues());
              return;
            }
            scan->cursor = reply.elements[0].text;
            for (const RespReply& key : reply.elements[1].elements) {
              scan->keys.push_back(key.text);
            }
            if (scan->cursor == "0") {
              FetchValues(scan);
            } else {
              ScanStep(scan);
            }
          });
}

void RedisStore::FetchValues(std::shared_ptr<Scan> scan) {
  if (scan->keys.empty()) {
    scan->handler(Status(), KeyValues());
    return;
  }
  std::vector<std::string> args = {"MGET"};
  args.insert(args.end(), scan->keys.begin(), scan->keys.end());
  Command(std::move(args), [scan](const Status& status, RespReply reply) {
    if (!status.ok()) {
      scan->handler(status, KeyValues());
      return;
    }
    if (reply.type != RespReply::Type::kArray ||
        reply.elements.size() != scan->keys.size()) {
      scan->handler(ReplyError(reply, "MGET"), KeyValues());
      return;
    }
    KeyValues values;
    for (std::size_t i = 0; i < scan->keys.size(); ++i) {
      // Keys may expire between SCAN and MGET.
      if (reply.elements[i].type == RespReply::Type::kBulkString) {
        values.emplace_back(scan->keys[i], reply.elements[i].text);
      }
    }
    scan->handler(Status(), std::move(values));
  });
}

}
