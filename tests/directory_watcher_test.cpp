#include "imagewatch/watch/directory_watcher.hpp"
#include "imagewatch/watch/inotify_watcher.hpp"
#include "imagewatch/watch/polling_watcher.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace imagewatch;
using namespace std::chrono_literals;
using test::wait_until;
namespace fs = std::filesystem;

namespace {

class EventLog {
public:
  auto callback() -> WatchCallback {
    return [this](const WatchEvent& event) {
      std::scoped_lock lock(mu_);
      events_.push_back(event);
    };
  }

  [[nodiscard]] auto size() const -> std::size_t {
    std::scoped_lock lock(mu_);
    return events_.size();
  }

  [[nodiscard]] auto events() const -> std::vector<WatchEvent> {
    std::scoped_lock lock(mu_);
    return events_;
  }

  [[nodiscard]] auto count_of(const fs::path& path) const -> int {
    std::scoped_lock lock(mu_);
    int n = 0;
    for (const auto& e : events_) {
      if (e.path == path)
        ++n;
    }
    return n;
  }

private:
  mutable std::mutex mu_;
  std::vector<WatchEvent> events_;
};

}  // namespace

class InotifyWatcherTest : public test::TempDirTest {};

TEST_F(InotifyWatcherTest, InitiallyNotAlive) {
  InotifyWatcher watcher(test_dir_.string());
  EXPECT_FALSE(watcher.is_alive());
  EXPECT_EQ(watcher.directory(), test_dir_);
}

TEST_F(InotifyWatcherTest, StartAndStop) {
  InotifyWatcher watcher(test_dir_.string());
  ASSERT_TRUE(watcher.start({}).has_value());
  EXPECT_TRUE(watcher.is_alive());

  watcher.request_stop();
  EXPECT_TRUE(watcher.wait_stopped(2s));
  EXPECT_FALSE(watcher.is_alive());
}

TEST_F(InotifyWatcherTest, MissingDirectoryFails) {
  InotifyWatcher watcher((test_dir_ / "missing").string());
  auto r = watcher.start({});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::WatchFailed);
  EXPECT_FALSE(watcher.is_alive());
}

TEST_F(InotifyWatcherTest, ReportsCreatedFile) {
  EventLog log;
  InotifyWatcher watcher(test_dir_.string());
  ASSERT_TRUE(watcher.start(log.callback()).has_value());

  auto file = write_png("a.png");
  ASSERT_TRUE(wait_until([&] { return log.size() >= 1; }));

  auto events = log.events();
  EXPECT_EQ(events[0].path, file);
  EXPECT_FALSE(events[0].is_directory);
}

TEST_F(InotifyWatcherTest, ReportsDirectoryAsDirectory) {
  EventLog log;
  InotifyWatcher watcher(test_dir_.string());
  ASSERT_TRUE(watcher.start(log.callback()).has_value());

  fs::create_directory(test_dir_ / "sub");
  ASSERT_TRUE(wait_until([&] { return log.size() >= 1; }));
  EXPECT_TRUE(log.events()[0].is_directory);
}

TEST_F(InotifyWatcherTest, IgnoresModificationOfExistingFile) {
  auto file = write_png("existing.png");

  EventLog log;
  InotifyWatcher watcher(test_dir_.string());
  ASSERT_TRUE(watcher.start(log.callback()).has_value());

  {
    std::ofstream out(file, std::ios::app);
    out << "more bytes";
  }
  test::sleep_ms(300ms);
  EXPECT_EQ(log.size(), 0u);
}

TEST_F(InotifyWatcherTest, IsNotRecursive) {
  fs::create_directory(test_dir_ / "nested");

  EventLog log;
  InotifyWatcher watcher(test_dir_.string());
  ASSERT_TRUE(watcher.start(log.callback()).has_value());

  write_png("nested/deep.png");
  test::sleep_ms(300ms);
  EXPECT_EQ(log.size(), 0u);
}

TEST_F(InotifyWatcherTest, ThrowingCallbackKeepsWatching) {
  std::atomic<int> calls{0};
  InotifyWatcher watcher(test_dir_.string());
  ASSERT_TRUE(watcher
                  .start([&](const WatchEvent&) {
                    calls.fetch_add(1);
                    throw std::runtime_error("callback failed");
                  })
                  .has_value());

  write_png("one.png");
  ASSERT_TRUE(wait_until([&] { return calls.load() >= 1; }));
  write_png("two.png");
  EXPECT_TRUE(wait_until([&] { return calls.load() >= 2; }));
  EXPECT_TRUE(watcher.is_alive());
}

TEST_F(InotifyWatcherTest, SlowCallbackTimesOutAndDetaches) {
  std::atomic<bool> release{false};
  std::atomic<bool> entered{false};
  auto watcher = std::make_unique<InotifyWatcher>(test_dir_.string());
  ASSERT_TRUE(watcher
                  ->start([&](const WatchEvent&) {
                    entered.store(true);
                    while (!release.load()) {
                      std::this_thread::sleep_for(5ms);
                    }
                  })
                  .has_value());

  write_png("stuck.png");
  ASSERT_TRUE(wait_until([&] { return entered.load(); }));

  watcher->request_stop();
  EXPECT_FALSE(watcher->wait_stopped(50ms));
  watcher.reset();

  release.store(true);
  // Give the detached thread time to finish before the flags go away.
  test::sleep_ms(300ms);
}

TEST_F(InotifyWatcherTest, StopsWhenDirectoryRemoved) {
  auto sub = test_dir_ / "watched";
  fs::create_directory(sub);

  InotifyWatcher watcher(sub.string());
  ASSERT_TRUE(watcher.start({}).has_value());
  fs::remove_all(sub);

  EXPECT_TRUE(wait_until([&] { return !watcher.is_alive(); }));
}

class PollingWatcherTest : public test::TempDirTest {};

TEST_F(PollingWatcherTest, MissingDirectoryFails) {
  PollingWatcher watcher((test_dir_ / "missing").string(), 20ms);
  auto r = watcher.start({});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::WatchFailed);
}

TEST_F(PollingWatcherTest, ExistingFilesAreNotReported) {
  write_png("before.png");

  EventLog log;
  PollingWatcher watcher(test_dir_.string(), 20ms);
  ASSERT_TRUE(watcher.start(log.callback()).has_value());

  test::sleep_ms(150ms);
  EXPECT_EQ(log.size(), 0u);
}

TEST_F(PollingWatcherTest, ReportsNewFileOnce) {
  EventLog log;
  PollingWatcher watcher(test_dir_.string(), 20ms);
  ASSERT_TRUE(watcher.start(log.callback()).has_value());

  auto file = write_png("new.png");
  ASSERT_TRUE(wait_until([&] { return log.size() >= 1; }));
  test::sleep_ms(100ms);
  EXPECT_EQ(log.count_of(file), 1);
  EXPECT_FALSE(log.events()[0].is_directory);
}

TEST_F(PollingWatcherTest, RecreatedFileIsReportedAgain) {
  EventLog log;
  PollingWatcher watcher(test_dir_.string(), 20ms);
  ASSERT_TRUE(watcher.start(log.callback()).has_value());

  auto file = write_png("again.png");
  ASSERT_TRUE(wait_until([&] { return log.count_of(file) == 1; }));
  fs::remove(file);
  test::sleep_ms(100ms);
  write_png("again.png");
  EXPECT_TRUE(wait_until([&] { return log.count_of(file) == 2; }));
}

TEST_F(PollingWatcherTest, StopIsPrompt) {
  PollingWatcher watcher(test_dir_.string(), 10s);
  ASSERT_TRUE(watcher.start({}).has_value());
  EXPECT_TRUE(watcher.is_alive());

  auto start = std::chrono::steady_clock::now();
  watcher.request_stop();
  EXPECT_TRUE(watcher.wait_stopped(2s));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
  EXPECT_FALSE(watcher.is_alive());
}

TEST(DirectoryWatcherFactoryTest, PicksImplementationByMode) {
  WatchConfig config;
  config.directory = "/tmp";

  config.mode = WatchMode::Native;
  auto native = create_directory_watcher(config);
  EXPECT_NE(dynamic_cast<InotifyWatcher*>(native.get()), nullptr);

  config.mode = WatchMode::Polling;
  auto polling = create_directory_watcher(config);
  EXPECT_NE(dynamic_cast<PollingWatcher*>(polling.get()), nullptr);
}
