#include "imagewatch/pipeline/dispatcher.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace imagewatch;
using namespace std::chrono_literals;
using test::wait_until;

class DispatcherTest : public ::testing::Test {
protected:
  void SetUp() override {
    sink_->set_subscriber(events_.subscriber());
    loop_.start();
  }

  void TearDown() override {
    loop_.stop();
  }

  // Puts `path` into Processing the way the worker would.
  auto make_processing(const std::string& path) -> void {
    ASSERT_EQ(tracker_->try_admit(path, 10).outcome, AdmissionOutcome::Admitted);
    ASSERT_TRUE(tracker_->begin_verify(path));
    ASSERT_TRUE(tracker_->promote(path));
  }

  EventLoop loop_;
  test::RecordingProcessor instant_;
  test::RecordingProcessor failing_{fail(Error::ProcessingFailed)};
  std::shared_ptr<LifecycleTracker> tracker_ =
      std::make_shared<LifecycleTracker>();
  std::shared_ptr<EventSink> sink_ = std::make_shared<EventSink>();
  test::EventRecorder events_;
};

TEST_F(DispatcherTest, RunsProcessorOnLoopAndReleases) {
  test::RecordingProcessor recorder;
  Dispatcher dispatcher(tracker_, loop_, recorder.processor(), sink_);

  make_processing("/d/a.png");
  dispatcher.dispatch("/d/a.png");

  ASSERT_TRUE(wait_until([&] { return events_.count("processed") == 1; }));
  EXPECT_EQ(recorder.count_of("/d/a.png"), 1);
  EXPECT_TRUE(recorder.ran_on_loop());
  EXPECT_FALSE(tracker_->contains("/d/a.png"));
  EXPECT_EQ(events_.count("dispatched"), 1);
}

TEST_F(DispatcherTest, DispatchedAlwaysPrecedesOutcome) {
  Dispatcher ok_dispatcher(tracker_, loop_, instant_.processor(), sink_);
  Dispatcher failing_dispatcher(tracker_, loop_, failing_.processor(), sink_);

  for (int i = 0; i < 50; ++i) {
    auto good = "/d/good" + std::to_string(i) + ".png";
    auto bad = "/d/bad" + std::to_string(i) + ".png";
    make_processing(good);
    make_processing(bad);
    ok_dispatcher.dispatch(good);
    failing_dispatcher.dispatch(bad);
  }

  ASSERT_TRUE(wait_until([&] {
    return events_.count("processed") == 50 &&
           events_.count("dispatch_failed") == 50;
  }));
  for (int i = 0; i < 50; ++i) {
    EXPECT_EQ(events_.types_for("/d/good" + std::to_string(i) + ".png"),
              (std::vector<std::string>{"dispatched", "processed"}));
    EXPECT_EQ(events_.types_for("/d/bad" + std::to_string(i) + ".png"),
              (std::vector<std::string>{"dispatched", "dispatch_failed"}));
  }
}

TEST_F(DispatcherTest, DispatchDoesNotWaitForProcessor) {
  test::RecordingProcessor recorder(ok(), 300ms);
  Dispatcher dispatcher(tracker_, loop_, recorder.processor(), sink_);

  make_processing("/d/slow.png");
  auto start = std::chrono::steady_clock::now();
  dispatcher.dispatch("/d/slow.png");
  EXPECT_LT(std::chrono::steady_clock::now() - start, 100ms);

  EXPECT_TRUE(tracker_->contains("/d/slow.png"));
  ASSERT_TRUE(wait_until([&] { return !tracker_->contains("/d/slow.png"); }));
  EXPECT_EQ(events_.count("processed"), 1);
}

TEST_F(DispatcherTest, ProcessorErrorIsReportedAndReleased) {
  test::RecordingProcessor recorder(fail(Error::ProcessingFailed));
  Dispatcher dispatcher(tracker_, loop_, recorder.processor(), sink_);

  make_processing("/d/bad.png");
  dispatcher.dispatch("/d/bad.png");

  ASSERT_TRUE(wait_until([&] { return events_.count("dispatch_failed") == 1; }));
  EXPECT_FALSE(tracker_->contains("/d/bad.png"));
  EXPECT_EQ(events_.count("processed"), 0);

  auto event = events_.last("dispatch_failed");
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ((*event)["path"], "/d/bad.png");
  EXPECT_EQ((*event)["error"], make_error_code(Error::ProcessingFailed).message());
}

TEST_F(DispatcherTest, ThrowingCoroutineIsContained) {
  Dispatcher dispatcher(tracker_, loop_,
                        [](std::string) -> task<Result<void>> {
                          throw std::runtime_error("processor crashed");
                          co_return ok();
                        },
                        sink_);

  make_processing("/d/crash.png");
  dispatcher.dispatch("/d/crash.png");

  ASSERT_TRUE(wait_until([&] { return events_.count("dispatch_failed") == 1; }));
  EXPECT_FALSE(tracker_->contains("/d/crash.png"));
  EXPECT_EQ((*events_.last("dispatch_failed"))["error"], "processor crashed");
  EXPECT_TRUE(loop_.is_running());
}

TEST_F(DispatcherTest, ThrowingFactoryIsContained) {
  Dispatcher dispatcher(tracker_, loop_,
                        [](std::string) -> task<Result<void>> {
                          throw std::runtime_error("no task for you");
                        },
                        sink_);

  make_processing("/d/factory.png");
  dispatcher.dispatch("/d/factory.png");

  ASSERT_TRUE(wait_until([&] { return events_.count("dispatch_failed") == 1; }));
  EXPECT_FALSE(tracker_->contains("/d/factory.png"));
}

TEST_F(DispatcherTest, RefusedByStoppedLoop) {
  test::RecordingProcessor recorder;
  Dispatcher dispatcher(tracker_, loop_, recorder.processor(), sink_);
  loop_.stop();

  make_processing("/d/late.png");
  dispatcher.dispatch("/d/late.png");

  EXPECT_FALSE(tracker_->contains("/d/late.png"));
  EXPECT_EQ(events_.count("dispatch_failed"), 1);
  EXPECT_EQ(events_.count("dispatched"), 0);
  EXPECT_EQ(recorder.count(), 0);
}

TEST_F(DispatcherTest, LoopShutdownReleasesSuspendedProcessor) {
  test::RecordingProcessor recorder(ok(), 60s);
  Dispatcher dispatcher(tracker_, loop_, recorder.processor(), sink_);

  make_processing("/d/forever.png");
  dispatcher.dispatch("/d/forever.png");
  ASSERT_TRUE(wait_until([&] { return recorder.count() == 1; }));

  loop_.stop();
  EXPECT_FALSE(tracker_->contains("/d/forever.png"));
}

TEST_F(DispatcherTest, ManyPathsEachProcessedOnce) {
  test::RecordingProcessor recorder(ok(), 5ms);
  Dispatcher dispatcher(tracker_, loop_, recorder.processor(), sink_);

  for (int i = 0; i < 10; ++i) {
    auto path = "/d/" + std::to_string(i) + ".png";
    make_processing(path);
    dispatcher.dispatch(path);
  }

  ASSERT_TRUE(wait_until([&] { return events_.count("processed") == 10; }));
  EXPECT_EQ(recorder.count(), 10);
  EXPECT_EQ(tracker_->processing_count(), 0u);
}

TEST(ProcessingLeaseTest, ReleasesOnce) {
  auto tracker = std::make_shared<LifecycleTracker>();
  (void)tracker->try_admit("/d/a.png", 10);
  (void)tracker->begin_verify("/d/a.png");
  (void)tracker->promote("/d/a.png");

  {
    ProcessingLease lease(tracker, "/d/a.png");
    ProcessingLease moved(std::move(lease));
    moved.release();
    EXPECT_FALSE(tracker->contains("/d/a.png"));

    // A fresh cycle of the same path must survive the old lease going away.
    (void)tracker->try_admit("/d/a.png", 10);
    (void)tracker->begin_verify("/d/a.png");
    (void)tracker->promote("/d/a.png");
  }
  EXPECT_TRUE(tracker->contains("/d/a.png"));
}
