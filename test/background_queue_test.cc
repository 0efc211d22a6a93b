#include <gtest/gtest.h>
#include <boost/asio/post.hpp>
#include "background_queue.h"
#include "fake_runtime.h"

namespace sandboxd {
namespace {

TEST(BackgroundQueueTest, RunsOnTheNextTurn) {
  EventLoop loop;
  BackgroundQueue queue(loop);
  bool ran = false;
  queue.Submit("noop", [&](StatusHandler done) {
    ran = true;
    done(Status());
  });
  EXPECT_FALSE(ran);
  EXPECT_EQ(1u, queue.pending());
  ASSERT_TRUE(testing::RunUntil(loop, [&]() { return queue.pending() == 0; }));
  EXPECT_TRUE(ran);
  EXPECT_EQ(0u, queue.failures());
}

TEST(BackgroundQueueTest, CountsFailures) {
  EventLoop loop;
  BackgroundQueue queue(loop);
  queue.Submit("broken", [&](StatusHandler done) {
    boost::asio::post(loop, [done]() {
      done(Status(errc::runtime, "boom"));
    });
  });
  queue.Submit("fine", [](StatusHandler done) { done(Status()); });
  ASSERT_TRUE(testing::RunUntil(loop, [&]() { return queue.pending() == 0; }));
  EXPECT_EQ(1u, queue.failures());
}

TEST(BackgroundQueueTest, IgnoresSecondCompletion) {
  EventLoop loop;
  BackgroundQueue queue(loop);
  queue.Submit("twice", [](StatusHandler done) {
    done(Status(errc::runtime, "first"));
    done(Status(errc::runtime, "second"));
  });
  queue.Submit("pending", [](StatusHandler done) {});
  ASSERT_TRUE(testing::RunUntil(loop, [&]() { return queue.failures() == 1; }));
  loop.poll();
  EXPECT_EQ(1u, queue.pending());
  EXPECT_EQ(1u, queue.failures());
}

}
}
