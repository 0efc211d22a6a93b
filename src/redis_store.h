#ifndef SANDBOXD_REDIS_STORE_H
#define SANDBOXD_REDIS_STORE_H

#include <array>
#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include "kv_store.h"

namespace sandboxd {

struct RespReply {
  enum class Type {
    kSimpleString,
    kError,
    kInteger,
    kBulkString,
    kNil,
    kArray,
  };

  Type type = Type::kNil;
  std::string text;
  int64_t integer = 0;
  std::vector<RespReply> elements;
};

enum class RespParse {
  kOk,
  kIncomplete,
  kMalformed,
};

// Parses one RESP2 reply starting at |*pos|, advancing |*pos| past it on kOk.
RespParse ParseRespReply(const std::string& data, std::size_t* pos,
                         RespReply* reply);

std::string EncodeRespCommand(const std::vector<std::string>& args);

// Redis client speaking RESP2 over one TCP connection, one command in flight.
// After a failure commands fail fast until the reconnect backoff passes.
class RedisStore : public KeyValueStore {
 public:
  RedisStore(EventLoop& loop,
             std::string host,
             uint16_t port,
             std::chrono::milliseconds timeout);

  void Get(const std::string& key,
           ResultHandler<Optional<std::string>> handler) override;
  void SetWithTtl(const std::string& key,
                  const std::string& value,
                  std::chrono::milliseconds ttl,
                  StatusHandler handler) override;
  void Delete(const std::string& key, ResultHandler<bool> handler) override;
  void ScanPrefix(const std::string& prefix,
                  ResultHandler<KeyValues> handler) override;

  void Command(std::vector<std::string> args, ResultHandler<RespReply> handler);

 private:
  enum class State {
    kDisconnected,
    kConnecting,
    kConnected,
  };

  struct Pending {
    std::string payload;
    ResultHandler<RespReply> handler;
  };

  struct Scan {
    std::string pattern;
    std::string cursor = "0";
    std::vector<std::string> keys;
    ResultHandler<KeyValues> handler;
  };

  void Pump();
  void Connect();
  void ArmDeadline();
  void Read();
  void Complete(RespReply reply);
  void Fail(const Status& status);
  void ScanStep(std::shared_ptr<Scan> scan);
  void FetchValues(std::shared_ptr<Scan> scan);

  EventLoop& loop_;
  const std::string host_;
  const uint16_t port_;
  const std::chrono::milliseconds timeout_;
  boost::asio::ip::tcp::resolver resolver_;
  boost::asio::ip::tcp::socket socket_;
  Timer deadline_;
  State state_ = State::kDisconnected;
  // Bumped on every failure so that stale completions are ignored.
  uint64_t generation_ = 0;
  std::deque<Pending> queue_;
  bool in_flight_ = false;
  std::string read_buffer_;
  std::array<char, 4096> chunk_;
  TimePoint retry_after_;
};

}

#endif //SANDBOXD_REDIS_STORE_H
