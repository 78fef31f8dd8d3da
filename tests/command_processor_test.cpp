#include "imagewatch/processor/command_processor.hpp"

#include "imagewatch/core/event_loop.hpp"

#include <chrono>
#include <fstream>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace imagewatch;
using namespace std::chrono_literals;

namespace {

auto drive(FileProcessor processor, std::string path,
           std::shared_ptr<std::promise<Result<void>>> done) -> spawn_task {
  done->set_value(co_await processor(std::move(path)));
}

// Starts `processor(path)` on the loop; the future resolves when it finishes.
auto launch(EventLoop& loop, const FileProcessor& processor, std::string path)
    -> std::future<Result<void>> {
  auto done = std::make_shared<std::promise<Result<void>>>();
  auto future = done->get_future();
  auto handle = drive(processor, std::move(path), done).take();
  if (!loop.schedule(handle)) {
    handle.destroy();
    done->set_value(fail(Error::NotRunning));
  }
  return future;
}

auto await_result(std::future<Result<void>>& future) -> Result<void> {
  if (future.wait_for(10s) != std::future_status::ready) {
    return fail(Error::Timeout);
  }
  return future.get();
}

}  // namespace

class CommandProcessorTest : public test::TempDirTest {
protected:
  void SetUp() override {
    TempDirTest::SetUp();
    loop_.start();
  }

  void TearDown() override {
    loop_.stop();
    TempDirTest::TearDown();
  }

  auto run(const FileProcessor& processor, std::string path = "/d/a.png")
      -> Result<void> {
    auto future = launch(loop_, processor, std::move(path));
    return await_result(future);
  }

  EventLoop loop_;
};

TEST_F(CommandProcessorTest, ZeroExitSucceeds) {
  EXPECT_TRUE(run(make_command_processor("true", 5s)));
}

TEST_F(CommandProcessorTest, NonZeroExitFails) {
  auto result = run(make_command_processor("exit 3", 5s));
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), Error::ProcessingFailed);
}

TEST_F(CommandProcessorTest, PathIsFirstArgument) {
  auto out = test_dir_ / "out.txt";
  auto processor =
      make_command_processor("printf '%s' \"$1\" > '" + out.string() + "'", 5s);

  ASSERT_TRUE(run(processor, "/d/with space.png"));

  std::ifstream in(out);
  std::string written((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  EXPECT_EQ(written, "/d/with space.png");
}

TEST_F(CommandProcessorTest, TimeoutKillsChild) {
  auto start = std::chrono::steady_clock::now();
  auto result = run(make_command_processor("sleep 30", 1s));

  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), Error::Timeout);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST_F(CommandProcessorTest, ChildrenDoNotBlockTheLoop) {
  auto processor = make_command_processor("sleep 1", 10s);

  auto start = std::chrono::steady_clock::now();
  std::vector<std::future<Result<void>>> futures;
  for (int i = 0; i < 3; ++i) {
    futures.push_back(launch(loop_, processor, "/d/" + std::to_string(i)));
  }
  for (auto& future : futures) {
    EXPECT_TRUE(await_result(future));
  }
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2500ms);
}

TEST_F(CommandProcessorTest, LoopShutdownKillsChild) {
  auto future = launch(loop_, make_command_processor("sleep 30", 60s), "/d/a");
  test::sleep_ms(200ms);

  auto start = std::chrono::steady_clock::now();
  loop_.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

  auto result = await_result(future);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), Error::Cancelled);
}

TEST_F(CommandProcessorTest, EmptyCommandLogsOnly) {
  auto processor = make_processor(ProcessorConfig{});
  EXPECT_TRUE(run(processor));
  EXPECT_TRUE(run(make_logging_processor()));
}

TEST_F(CommandProcessorTest, ConfiguredCommandIsUsed) {
  ProcessorConfig config;
  config.command = "exit 1";
  config.timeout = 5s;
  auto result = run(make_processor(config));
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), Error::ProcessingFailed);
}
