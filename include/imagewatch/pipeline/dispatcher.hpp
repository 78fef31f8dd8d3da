#pragma once

#include "imagewatch/core/coroutine.hpp"
#include "imagewatch/core/error.hpp"
#include "imagewatch/core/event_loop.hpp"
#include "imagewatch/monitor/event_sink.hpp"
#include "imagewatch/pipeline/lifecycle_tracker.hpp"

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace imagewatch {

// Downstream handler for a verified file. Runs on the EventLoop thread and
// may suspend (async_sleep, child processes); it must not block.
using FileProcessor = std::function<task<Result<void>>(std::string path)>;

// Holds one Processing entry and releases it exactly once, at the latest
// when destroyed. Living in a coroutine frame, it also covers frames that
// are destroyed without ever running.
class ProcessingLease {
public:
  ProcessingLease(std::shared_ptr<LifecycleTracker> tracker, std::string path)
      : tracker_(std::move(tracker)), path_(std::move(path)) {
  }

  ProcessingLease(ProcessingLease&& other) noexcept = default;
  ProcessingLease& operator=(ProcessingLease&&) = delete;
  ProcessingLease(const ProcessingLease&) = delete;
  ProcessingLease& operator=(const ProcessingLease&) = delete;

  ~ProcessingLease() {
    release();
  }

  auto release() -> void {
    if (auto tracker = std::exchange(tracker_, nullptr)) {
      tracker->release(path_);
    }
  }

private:
  std::shared_ptr<LifecycleTracker> tracker_;
  std::string path_;
};

// Hands verified paths to the EventLoop without waiting for them.
class Dispatcher {
public:
  Dispatcher(std::shared_ptr<LifecycleTracker> tracker, EventLoop& loop,
             FileProcessor processor, std::shared_ptr<EventSink> sink);

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  // `path` must be in Processing. It leaves Processing when the processor
  // finishes, or right away when the loop refuses the work.
  auto dispatch(const std::string& path) -> void;

private:
  std::shared_ptr<LifecycleTracker> tracker_;
  EventLoop& loop_;
  std::shared_ptr<FileProcessor> processor_;
  std::shared_ptr<EventSink> sink_;
};

}  // namespace imagewatch
