#include "imagewatch/pipeline/debounce_worker.hpp"

#include "imagewatch/util/log.hpp"

#include <exception>
#include <filesystem>
#include <system_error>
#include <thread>

namespace imagewatch {

DebounceWorker::DebounceWorker(std::shared_ptr<LifecycleTracker> tracker,
                               std::shared_ptr<const IFileVerifier> verifier,
                               std::shared_ptr<Dispatcher> dispatcher,
                               std::shared_ptr<EventSink> sink,
                               std::chrono::milliseconds debounce)
    : tracker_(std::move(tracker)),
      verifier_(std::move(verifier)),
      dispatcher_(std::move(dispatcher)),
      sink_(std::move(sink)),
      debounce_(debounce) {
}

auto DebounceWorker::run(const std::string& path) noexcept -> void {
  if (debounce_.count() > 0) {
    std::this_thread::sleep_for(debounce_);
  }

  try {
    settle_and_dispatch(path);
  } catch (const std::exception& e) {
    log::error("Verification of {} aborted: {}", path, e.what());
    abandon(path);
  } catch (...) {
    log::error("Verification of {} aborted: non-standard exception", path);
    abandon(path);
  }
}

auto DebounceWorker::settle_and_dispatch(const std::string& path) -> void {
  if (!tracker_->begin_verify(path)) {
    log::debug("{} no longer pending, skipping verification", path);
    return;
  }

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    tracker_->discard(path);
    sink_->emit_vanished(path);
    return;
  }

  auto verdict = check(path);
  if (!verdict) {
    tracker_->discard(path);
    if (verdict.error() == Error::FileVanished) {
      sink_->emit_vanished(path);
    } else {
      sink_->emit_verification_failed(path, verdict.error());
    }
    return;
  }

  tracker_->promote(path);
  dispatcher_->dispatch(path);
}

// Whatever state the path reached, it must not stay tracked. A path that was
// already handed to the dispatcher is owned by its lease and is left alone.
auto DebounceWorker::abandon(const std::string& path) noexcept -> void {
  try {
    tracker_->discard(path);
  } catch (const std::exception& e) {
    log::error("Failed to release {}: {}", path, e.what());
  }
}

auto DebounceWorker::check(const std::string& path) const noexcept
    -> Result<void> {
  try {
    return verifier_->verify(path);
  } catch (const std::exception& e) {
    log::warn("Verifier threw on {}: {}", path, e.what());
    return fail(Error::InvalidImage);
  }
}

}  // namespace imagewatch
