#pragma once

#include "imagewatch/monitor/event_sink.hpp"
#include "imagewatch/pipeline/dispatcher.hpp"
#include "imagewatch/pipeline/lifecycle_tracker.hpp"
#include "imagewatch/verify/file_verifier.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace imagewatch {

// Blocking half of the pipeline, run on a WorkerPool thread once per
// admitted path: wait for writes to settle, verify, hand off.
class DebounceWorker {
public:
  DebounceWorker(std::shared_ptr<LifecycleTracker> tracker,
                 std::shared_ptr<const IFileVerifier> verifier,
                 std::shared_ptr<Dispatcher> dispatcher,
                 std::shared_ptr<EventSink> sink,
                 std::chrono::milliseconds debounce);

  DebounceWorker(const DebounceWorker&) = delete;
  DebounceWorker& operator=(const DebounceWorker&) = delete;

  // The debounce is a single fixed sleep; later events for the same path
  // are deduplicated upstream and do not extend it.
  auto run(const std::string& path) noexcept -> void;

  [[nodiscard]] auto debounce() const noexcept -> std::chrono::milliseconds {
    return debounce_;
  }

private:
  auto settle_and_dispatch(const std::string& path) -> void;
  auto abandon(const std::string& path) noexcept -> void;
  [[nodiscard]] auto check(const std::string& path) const noexcept
      -> Result<void>;

  std::shared_ptr<LifecycleTracker> tracker_;
  std::shared_ptr<const IFileVerifier> verifier_;
  std::shared_ptr<Dispatcher> dispatcher_;
  std::shared_ptr<EventSink> sink_;
  std::chrono::milliseconds debounce_;
};

}  // namespace imagewatch
