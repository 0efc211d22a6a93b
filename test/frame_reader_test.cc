#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>
#include "fake_runtime.h"
#include "frame_reader.h"

namespace sandboxd {
namespace {

using testing::Frame;

class FrameReaderTest : public ::testing::Test {
 protected:
  FrameReaderTest()
      : reader_([this](StreamChannel channel, StringView data) {
          pieces_.emplace_back(channel, data.to_string());
          return !stop_;
        }) {}

  std::string Collect(StreamChannel channel) const {
    std::string text;
    for (const auto& piece : pieces_) {
      if (piece.first == channel) {
        text += piece.second;
      }
    }
    return text;
  }

  FrameReader reader_;
  std::vector<std::pair<StreamChannel, std::string>> pieces_;
  bool stop_ = false;
};

TEST_F(FrameReaderTest, SplitsChannels) {
  std::string data = Frame(1, "hello ") + Frame(2, "oops") + Frame(1, "world");
  EXPECT_EQ(FrameReader::FeedResult::kOk, reader_.Feed(data.data(), data.size()));
  EXPECT_EQ("hello world", Collect(StreamChannel::kStdout));
  EXPECT_EQ("oops", Collect(StreamChannel::kStderr));
  EXPECT_TRUE(reader_.at_frame_boundary());
}

TEST_F(FrameReaderTest, HandlesByteAtATime) {
  std::string data = Frame(1, "4\n") + Frame(2, "warning");
  for (char c : data) {
    ASSERT_EQ(FrameReader::FeedResult::kOk, reader_.Feed(&c, 1));
  }
  EXPECT_EQ("4\n", Collect(StreamChannel::kStdout));
  EXPECT_EQ("warning", Collect(StreamChannel::kStderr));
}

TEST_F(FrameReaderTest, ReportsPartialFrame) {
  std::string data = Frame(1, "abcdef");
  EXPECT_EQ(FrameReader::FeedResult::kOk, reader_.Feed(data.data(), 11));
  EXPECT_EQ("abc", Collect(StreamChannel::kStdout));
  EXPECT_FALSE(reader_.at_frame_boundary());
  EXPECT_EQ(FrameReader::FeedResult::kOk,
            reader_.Feed(data.data() + 11, data.size() - 11));
  EXPECT_EQ("abcdef", Collect(StreamChannel::kStdout));
  EXPECT_TRUE(reader_.at_frame_boundary());
}

TEST_F(FrameReaderTest, EmptyFrameIsSkipped) {
  std::string data = Frame(1, "") + Frame(2, "x");
  EXPECT_EQ(FrameReader::FeedResult::kOk, reader_.Feed(data.data(), data.size()));
  EXPECT_EQ("", Collect(StreamChannel::kStdout));
  EXPECT_EQ("x", Collect(StreamChannel::kStderr));
}

TEST_F(FrameReaderTest, RejectsUnknownChannel) {
  std::string data = Frame(7, "bad");
  EXPECT_EQ(FrameReader::FeedResult::kMalformed,
            reader_.Feed(data.data(), data.size()));
  EXPECT_TRUE(pieces_.empty());
}

TEST_F(FrameReaderTest, StopsWhenCallbackRefuses) {
  stop_ = true;
  std::string data = Frame(1, "first") + Frame(1, "second");
  EXPECT_EQ(FrameReader::FeedResult::kStopped,
            reader_.Feed(data.data(), data.size()));
  ASSERT_EQ(1u, pieces_.size());
  EXPECT_EQ("first", pieces_[0].second);
}

}
}
