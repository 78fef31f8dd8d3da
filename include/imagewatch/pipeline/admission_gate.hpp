#pragma once

#include "imagewatch/config/system_config.hpp"
#include "imagewatch/core/worker_pool.hpp"
#include "imagewatch/monitor/event_sink.hpp"
#include "imagewatch/pipeline/debounce_worker.hpp"
#include "imagewatch/pipeline/lifecycle_tracker.hpp"

#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <string_view>

namespace imagewatch {

// Entry point of the pipeline, called on the watcher thread for every
// created file. Decides admission without blocking and hands admitted paths
// to the worker pool.
class AdmissionGate {
public:
  AdmissionGate(const WatchConfig& config,
                std::shared_ptr<LifecycleTracker> tracker,
                std::shared_ptr<DebounceWorker> worker, WorkerPool& pool,
                std::shared_ptr<EventSink> sink);

  AdmissionGate(const AdmissionGate&) = delete;
  AdmissionGate& operator=(const AdmissionGate&) = delete;

  auto on_created(const std::string& path) noexcept -> void;

  [[nodiscard]] auto accepts_extension(std::string_view path) const -> bool;

private:
  auto admit(const std::string& path) -> void;

  std::set<std::string> extensions_;
  std::size_t max_in_flight_;
  std::shared_ptr<LifecycleTracker> tracker_;
  std::shared_ptr<DebounceWorker> worker_;
  WorkerPool& pool_;
  std::shared_ptr<EventSink> sink_;
};

}  // namespace imagewatch
