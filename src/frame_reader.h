#ifndef SANDBOXD_FRAME_READER_H
#define SANDBOXD_FRAME_READER_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include "shim.h"

namespace sandboxd {

enum class StreamChannel : uint8_t {
  kStdin = 0,
  kStdout = 1,
  kStderr = 2,
};

// Demultiplexes an attached exec stream. Each frame is an 8-byte header
// (channel tag, three zero bytes, big-endian payload length) and the payload.
// Payload bytes are emitted as they arrive, so one frame may be reported in
// several pieces.
class FrameReader {
 public:
  static constexpr std::size_t kHeaderSize = 8;

  enum class FeedResult {
    kOk,
    kStopped,
    kMalformed,
  };

  // Returning false from the callback stops the reader.
  using FrameCallback = std::function<bool(StreamChannel, StringView)>;

  explicit FrameReader(FrameCallback callback);

  FeedResult Feed(const char* data, std::size_t size);

  bool at_frame_boundary() const {
    return state_ == State::kHeader && header_filled_ == 0;
  }

 private:
  enum class State {
    kHeader,
    kPayload,
  };

  bool DecodeHeader();

  FrameCallback callback_;
  State state_ = State::kHeader;
  std::array<uint8_t, kHeaderSize> header_;
  std::size_t header_filled_ = 0;
  StreamChannel channel_ = StreamChannel::kStdout;
  std::size_t remaining_ = 0;
};

}

#endif //SANDBOXD_FRAME_READER_H
