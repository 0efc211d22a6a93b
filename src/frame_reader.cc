#include "frame_reader.h"

#include <algorithm>

namespace sandboxd {

constexpr std::size_t FrameReader::kHeaderSize;

FrameReader::FrameReader(FrameCallback callback)
    : callback_(std::move(callback)) {}

bool FrameReader::DecodeHeader() {
  switch (header_[0]) {
  case 0:
  case 1:
    // Stdin frames only show up for echoed input and are reported as stdout.
    channel_ = StreamChannel::kStdout;
    break;
  case 2:
    channel_ = StreamChannel::kStderr;
    break;
  default:
    return false;
  }
  remaining_ = (std::size_t(header_[4]) << 24) | (std::size_t(header_[5]) << 16) |
               (std::size_t(header_[6]) << 8) | std::size_t(header_[7]);
  return true;
}

FrameReader::FeedResult FrameReader::Feed(const char* data, std::size_t size) {
  while (size > 0) {
    switch (state_) {
    case State::kHeader: {
      std::size_t count = std::min(size, kHeaderSize - header_filled_);
      std::copy(data, data + count, header_.begin() + header_filled_);
      header_filled_ += count;
      data += count;
      size -= count;
      if (header_filled_ < kHeaderSize) {
        break;
      }
      header_filled_ = 0;
      if (!DecodeHeader()) {
        return FeedResult::kMalformed;
      }
      if (remaining_ > 0) {
        state_ = State::kPayload;
      }
      break;
    }
    case State::kPayload: {
      std::size_t count = std::min(size, remaining_);
      remaining_ -= count;
      if (remaining_ == 0) {
        state_ = State::kHeader;
      }
      StringView piece(data, count);
      data += count;
      size -= count;
      if (!callback_(channel_, piece)) {
        return FeedResult::kStopped;
      }
      break;
    }
    }
  }
  return FeedResult::kOk;
}

}
