#include <gtest/gtest.h>
#include "fake_runtime.h"
#include "pool_manager.h"

namespace sandboxd {
namespace {

class PoolManagerTest : public ::testing::Test {
 protected:
  PoolManagerTest()
      : config_(testing::TestConfig(scratch_.path())),
        runtime_(loop_),
        ports_(loop_, config_.ports),
        background_(loop_),
        controller_(loop_, config_, runtime_, ports_, background_),
        pool_(controller_, background_, 2) {
    ports_.set_bind_probe([](uint16_t) { return true; });
    python_.language = "python";
    pool_.AddPool(python_);
  }

  void Run(const std::function<void(Callback)>& operation) {
    bool done = false;
    operation([&done]() { done = true; });
    ASSERT_TRUE(testing::RunUntil(loop_, [&]() { return done; }));
  }

  void Initialize() {
    Run([this](Callback done) { pool_.Initialize(done); });
  }

  EventLoop loop_;
  testing::ScratchDir scratch_;
  Config config_;
  testing::FakeRuntime runtime_;
  PortAllocator ports_;
  BackgroundQueue background_;
  SandboxController controller_;
  PoolManager pool_;
  PoolKey python_;
};

TEST_F(PoolManagerTest, InitializeFillsEveryPool) {
  PoolKey ide;
  ide.type = SandboxType::kIde;
  pool_.AddPool(ide);
  Initialize();
  EXPECT_EQ(2u, pool_.ready_count(python_));
  EXPECT_EQ(2u, pool_.ready_count(ide));
  EXPECT_EQ(0u, pool_.in_flight_count(python_));
  EXPECT_EQ(4, runtime_.create_count);
  EXPECT_EQ(4u, runtime_.running_count());
  EXPECT_EQ(2u, pool_.keys().size());
}

TEST_F(PoolManagerTest, AcquireHandsOutAStartedSandbox) {
  Initialize();
  int created = runtime_.create_count;
  Optional<SandboxHandle> handle = pool_.Acquire(python_);
  ASSERT_TRUE(handle);
  EXPECT_EQ(created, runtime_.create_count);
  EXPECT_TRUE(handle->prewarmed);
  EXPECT_EQ("python", handle->language);
  EXPECT_TRUE(runtime_.containers.at(handle->id).running);
  EXPECT_EQ(1u, pool_.ready_count(python_));

  // Replenished in the background.
  ASSERT_TRUE(testing::RunUntil(
      loop_, [this]() { return pool_.ready_count(python_) == 2; }));
  EXPECT_EQ(created + 1, runtime_.create_count);
}

TEST_F(PoolManagerTest, MissesWithoutAPool) {
  PoolKey go;
  go.language = "go";
  EXPECT_FALSE(pool_.Acquire(go));
  EXPECT_FALSE(pool_.Acquire(python_));
}

TEST_F(PoolManagerTest, InitializeSurvivesCreateFailures) {
  runtime_.create_status = Status(errc::infrastructure, "engine down");
  Initialize();
  EXPECT_EQ(0u, pool_.ready_count(python_));
  EXPECT_EQ(0u, pool_.in_flight_count(python_));
}

TEST_F(PoolManagerTest, MaintainEvictsStoppedSandboxes) {
  Initialize();
  std::string dead;
  for (auto& container : runtime_.containers) {
    container.second.running = false;
    dead = container.first;
    break;
  }
  Run([this](Callback done) { pool_.Maintain(done); });
  EXPECT_EQ(2u, pool_.ready_count(python_));
  EXPECT_EQ(3, runtime_.create_count);
  ASSERT_TRUE(testing::RunUntil(
      loop_, [this]() { return background_.pending() == 0; }));
  EXPECT_EQ(0u, runtime_.containers.count(dead));
  EXPECT_EQ(2u, runtime_.running_count());
}

TEST_F(PoolManagerTest, DrainDestroysEverything) {
  Initialize();
  Run([this](Callback done) { pool_.Drain(done); });
  EXPECT_EQ(0u, pool_.ready_count(python_));
  EXPECT_TRUE(runtime_.containers.empty());
  EXPECT_FALSE(pool_.Acquire(python_));
  Run([this](Callback done) { pool_.Maintain(done); });
  EXPECT_EQ(2, runtime_.create_count);
}

}
}
