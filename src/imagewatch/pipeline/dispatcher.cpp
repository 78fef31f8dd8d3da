#include "imagewatch/pipeline/dispatcher.hpp"

#include "imagewatch/util/log.hpp"

#include <coroutine>
#include <exception>

namespace imagewatch {

namespace {

auto run_processor(std::shared_ptr<FileProcessor> processor,
                   std::shared_ptr<EventSink> sink, ProcessingLease lease,
                   std::string path) -> spawn_task {
  // First thing on the loop thread, so it always precedes the outcome.
  sink->emit_dispatched(path);
  std::string error;
  try {
    auto result = co_await (*processor)(path);
    lease.release();
    if (result) {
      sink->emit_processed(path);
      co_return;
    }
    error = result.error().message();
  } catch (const std::exception& e) {
    error = e.what();
  } catch (...) {
    error = "non-standard exception";
  }
  lease.release();
  sink->emit_dispatch_failed(path, error);
}

}  // namespace

Dispatcher::Dispatcher(std::shared_ptr<LifecycleTracker> tracker,
                       EventLoop& loop, FileProcessor processor,
                       std::shared_ptr<EventSink> sink)
    : tracker_(std::move(tracker)),
      loop_(loop),
      processor_(std::make_shared<FileProcessor>(std::move(processor))),
      sink_(std::move(sink)) {
}

auto Dispatcher::dispatch(const std::string& path) -> void {
  std::coroutine_handle<> handle;
  try {
    handle = run_processor(processor_, sink_, ProcessingLease{tracker_, path},
                           path)
                 .take();
  } catch (const std::exception& e) {
    // A lease that got built has released already; release() only touches
    // Processing entries, so this covers the case where it never was.
    tracker_->release(path);
    sink_->emit_dispatch_failed(path, e.what());
    return;
  }

  if (!loop_.schedule(handle)) {
    // Never started, so destroying it runs the lease's release.
    handle.destroy();
    sink_->emit_dispatch_failed(path, "event loop not accepting work");
  }
}

}  // namespace imagewatch
