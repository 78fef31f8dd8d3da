#include "imagewatch/pipeline/lifecycle_tracker.hpp"

namespace imagewatch {

auto LifecycleTracker::try_admit(std::string_view path,
                                 std::size_t max_in_flight) -> AdmissionResult {
  std::scoped_lock lock(mu_);
  AdmissionResult result;

  if (files_.contains(path)) {
    result.outcome = AdmissionOutcome::Duplicate;
  } else if (pending_ + processing_ >= max_in_flight) {
    ++dropped_;
    result.outcome = AdmissionOutcome::AtCapacity;
  } else {
    std::string key{path};
    files_.emplace(key, TrackedFile{.path = key,
                                    .state = FileState::Pending,
                                    .admitted_at =
                                        std::chrono::steady_clock::now()});
    ++pending_;
    result.outcome = AdmissionOutcome::Admitted;
  }

  result.dropped_total = dropped_;
  result.in_flight = pending_ + processing_;
  return result;
}

auto LifecycleTracker::begin_verify(std::string_view path) -> bool {
  std::scoped_lock lock(mu_);
  return transition(path, FileState::Pending, FileState::Verifying);
}

auto LifecycleTracker::promote(std::string_view path) -> bool {
  std::scoped_lock lock(mu_);
  return transition(path, FileState::Verifying, FileState::Processing);
}

auto LifecycleTracker::discard(std::string_view path) -> bool {
  std::scoped_lock lock(mu_);
  return erase_in(path, FileState::Pending) ||
         erase_in(path, FileState::Verifying);
}

auto LifecycleTracker::release(std::string_view path) -> bool {
  std::scoped_lock lock(mu_);
  return erase_in(path, FileState::Processing);
}

auto LifecycleTracker::contains(std::string_view path) const -> bool {
  std::scoped_lock lock(mu_);
  return files_.contains(path);
}

auto LifecycleTracker::state(std::string_view path) const
    -> std::optional<FileState> {
  std::scoped_lock lock(mu_);
  auto it = files_.find(path);
  if (it == files_.end())
    return std::nullopt;
  return it->second.state;
}

auto LifecycleTracker::pending_count() const -> std::size_t {
  std::scoped_lock lock(mu_);
  return pending_;
}

auto LifecycleTracker::verifying_count() const -> std::size_t {
  std::scoped_lock lock(mu_);
  return verifying_;
}

auto LifecycleTracker::processing_count() const -> std::size_t {
  std::scoped_lock lock(mu_);
  return processing_;
}

auto LifecycleTracker::dropped_count() const -> std::uint64_t {
  std::scoped_lock lock(mu_);
  return dropped_;
}

auto LifecycleTracker::stats() const -> TrackerStats {
  std::scoped_lock lock(mu_);
  return {.pending = pending_,
          .verifying = verifying_,
          .processing = processing_,
          .dropped = dropped_};
}

auto LifecycleTracker::transition(std::string_view path, FileState from,
                                  FileState to) -> bool {
  auto it = files_.find(path);
  if (it == files_.end() || it->second.state != from)
    return false;
  it->second.state = to;
  adjust(from, -1);
  adjust(to, +1);
  return true;
}

auto LifecycleTracker::erase_in(std::string_view path, FileState from) -> bool {
  auto it = files_.find(path);
  if (it == files_.end() || it->second.state != from)
    return false;
  files_.erase(it);
  adjust(from, -1);
  return true;
}

auto LifecycleTracker::adjust(FileState state, int delta) -> void {
  auto apply = [delta](std::size_t& n) {
    n = delta > 0 ? n + 1 : n - 1;
  };
  switch (state) {
    case FileState::Pending: apply(pending_); break;
    case FileState::Verifying: apply(verifying_); break;
    case FileState::Processing: apply(processing_); break;
  }
}

}  // namespace imagewatch
