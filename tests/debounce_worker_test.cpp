#include "imagewatch/pipeline/debounce_worker.hpp"

#include "imagewatch/core/event_loop.hpp"
#include "imagewatch/pipeline/dispatcher.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace imagewatch;
using namespace std::chrono_literals;
using test::wait_until;

class DebounceWorkerTest : public test::TempDirTest {
protected:
  void SetUp() override {
    TempDirTest::SetUp();
    sink_->set_subscriber(events_.subscriber());
    loop_.start();
  }

  void TearDown() override {
    loop_.stop();
    TempDirTest::TearDown();
  }

  auto make_worker(std::shared_ptr<const IFileVerifier> verifier,
                   std::chrono::milliseconds debounce = 0ms)
      -> std::shared_ptr<DebounceWorker> {
    auto dispatcher = std::make_shared<Dispatcher>(tracker_, loop_,
                                                   processor_.processor(), sink_);
    return std::make_shared<DebounceWorker>(tracker_, std::move(verifier),
                                            std::move(dispatcher), sink_,
                                            debounce);
  }

  auto admit(const std::string& path) -> void {
    ASSERT_EQ(tracker_->try_admit(path, 10).outcome, AdmissionOutcome::Admitted);
  }

  EventLoop loop_;
  test::RecordingProcessor processor_;
  std::shared_ptr<LifecycleTracker> tracker_ =
      std::make_shared<LifecycleTracker>();
  std::shared_ptr<EventSink> sink_ = std::make_shared<EventSink>();
  test::EventRecorder events_;
};

TEST_F(DebounceWorkerTest, ValidFileIsDispatched) {
  auto verifier = std::make_shared<test::FakeVerifier>();
  auto worker = make_worker(verifier);
  auto photo = write_png("photo.png").string();
  admit(photo);

  worker->run(photo);

  EXPECT_EQ(verifier->calls(), 1);
  ASSERT_TRUE(wait_until([&] { return events_.count("processed") == 1; }));
  EXPECT_EQ(events_.count("dispatched"), 1);
  EXPECT_EQ(processor_.count_of(photo), 1);
  EXPECT_FALSE(tracker_->contains(photo));
}

TEST_F(DebounceWorkerTest, MissingFileIsVanishedNotFailure) {
  auto verifier = std::make_shared<test::FakeVerifier>();
  auto worker = make_worker(verifier);
  auto gone = (test_dir_ / "gone.png").string();
  admit(gone);

  worker->run(gone);

  EXPECT_FALSE(tracker_->contains(gone));
  EXPECT_EQ(events_.count("vanished"), 1);
  EXPECT_EQ(events_.count("verification_failed"), 0);
  EXPECT_EQ(verifier->calls(), 0);
  EXPECT_EQ(processor_.count(), 0);
}

TEST_F(DebounceWorkerTest, DeletedDuringDebounceIsNeverProcessed) {
  auto verifier = std::make_shared<test::FakeVerifier>();
  auto worker = make_worker(verifier, 300ms);
  auto temp = write_png("temp.jpg");
  admit(temp.string());

  std::jthread runner([&] { worker->run(temp.string()); });
  test::sleep_ms(50ms);
  EXPECT_EQ(tracker_->state(temp.string()), FileState::Pending);
  std::filesystem::remove(temp);
  runner.join();

  EXPECT_FALSE(tracker_->contains(temp.string()));
  EXPECT_EQ(events_.count("vanished"), 1);
  EXPECT_EQ(processor_.count(), 0);
}

TEST_F(DebounceWorkerTest, VerifierVanishedIsReportedAsVanished) {
  auto worker =
      make_worker(std::make_shared<test::FakeVerifier>(fail(Error::FileVanished)));
  auto photo = write_png("racy.png").string();
  admit(photo);

  worker->run(photo);

  EXPECT_FALSE(tracker_->contains(photo));
  EXPECT_EQ(events_.count("vanished"), 1);
  EXPECT_EQ(events_.count("verification_failed"), 0);
}

TEST_F(DebounceWorkerTest, InvalidFileIsNeverDispatched) {
  auto worker =
      make_worker(std::make_shared<test::FakeVerifier>(fail(Error::InvalidImage)));
  auto bogus = write_file("bogus.png", "not an image").string();
  admit(bogus);

  worker->run(bogus);

  EXPECT_FALSE(tracker_->contains(bogus));
  auto failed = events_.last("verification_failed");
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ((*failed)["reason"], make_error_code(Error::InvalidImage).message());
  EXPECT_EQ(events_.count("dispatched"), 0);

  test::sleep_ms(50ms);
  EXPECT_EQ(processor_.count(), 0);
}

TEST_F(DebounceWorkerTest, ThrowingVerifierCountsAsInvalid) {
  auto worker = make_worker(std::make_shared<test::ThrowingVerifier>());
  auto photo = write_png("explodes.png").string();
  admit(photo);

  worker->run(photo);

  EXPECT_FALSE(tracker_->contains(photo));
  EXPECT_EQ(events_.count("verification_failed"), 1);
  EXPECT_EQ(processor_.count(), 0);
}

TEST_F(DebounceWorkerTest, SkipsPathThatIsNotPending) {
  auto verifier = std::make_shared<test::FakeVerifier>();
  auto worker = make_worker(verifier);
  auto photo = write_png("stray.png").string();

  worker->run(photo);

  EXPECT_EQ(verifier->calls(), 0);
  EXPECT_FALSE(tracker_->contains(photo));
  EXPECT_EQ(events_.count("dispatched"), 0);
}

TEST_F(DebounceWorkerTest, WaitsForDebounceBeforeVerifying) {
  auto verifier = std::make_shared<test::FakeVerifier>();
  auto worker = make_worker(verifier, 150ms);
  auto photo = write_png("slow.png").string();
  admit(photo);

  auto start = std::chrono::steady_clock::now();
  worker->run(photo);
  EXPECT_GE(std::chrono::steady_clock::now() - start, 150ms);
  EXPECT_EQ(verifier->calls(), 1);
}

// A file created empty and filled in during the debounce is judged on its
// settled contents.
TEST_F(DebounceWorkerTest, WritesSettleDuringDebounce) {
  auto worker = make_worker(create_image_verifier(), 300ms);
  auto photo = write_file("partial.png", "").string();
  admit(photo);

  std::jthread runner([&] { worker->run(photo); });
  test::sleep_ms(50ms);
  write_png("partial.png");
  runner.join();

  ASSERT_TRUE(wait_until([&] { return processor_.count_of(photo) == 1; }));
  EXPECT_EQ(events_.count("verification_failed"), 0);
}

TEST_F(DebounceWorkerTest, StoppedLoopReleasesPath) {
  auto worker = make_worker(std::make_shared<test::FakeVerifier>());
  auto photo = write_png("late.png").string();
  admit(photo);
  loop_.stop();

  worker->run(photo);

  EXPECT_FALSE(tracker_->contains(photo));
  EXPECT_EQ(events_.count("dispatch_failed"), 1);
  EXPECT_EQ(processor_.count(), 0);
}

TEST_F(DebounceWorkerTest, NonStandardThrowFromSubscriberIsContained) {
  sink_->set_subscriber([](const nlohmann::json& event) {
    if (event["type"] == "vanished") {
      throw 42;
    }
  });
  auto worker = make_worker(std::make_shared<test::FakeVerifier>());
  auto gone = (test_dir_ / "gone.png").string();
  admit(gone);

  worker->run(gone);

  EXPECT_FALSE(tracker_->contains(gone));
  EXPECT_EQ(processor_.count(), 0);
}
