#include "imagewatch/pipeline/admission_gate.hpp"

#include "imagewatch/config/config.hpp"
#include "imagewatch/util/log.hpp"

#include <exception>
#include <filesystem>

namespace imagewatch {

AdmissionGate::AdmissionGate(const WatchConfig& config,
                             std::shared_ptr<LifecycleTracker> tracker,
                             std::shared_ptr<DebounceWorker> worker,
                             WorkerPool& pool, std::shared_ptr<EventSink> sink)
    : max_in_flight_(config.max_in_flight),
      tracker_(std::move(tracker)),
      worker_(std::move(worker)),
      pool_(pool),
      sink_(std::move(sink)) {
  for (const auto& ext : config.extensions) {
    extensions_.insert(normalize_extension(ext));
  }
}

auto AdmissionGate::accepts_extension(std::string_view path) const -> bool {
  auto ext = std::filesystem::path(path).extension().string();
  if (ext.empty())
    return false;
  return extensions_.contains(normalize_extension(ext));
}

auto AdmissionGate::on_created(const std::string& path) noexcept -> void {
  try {
    admit(path);
  } catch (const std::exception& e) {
    log::error("Admission of {} failed: {}", path, e.what());
  } catch (...) {
    log::error("Admission of {} failed: non-standard exception", path);
  }
}

auto AdmissionGate::admit(const std::string& path) -> void {
  if (!accepts_extension(path)) {
    sink_->emit_rejected(path, RejectReason::Extension);
    return;
  }

  auto admission = tracker_->try_admit(path, max_in_flight_);
  switch (admission.outcome) {
    case AdmissionOutcome::Duplicate:
      sink_->emit_rejected(path, RejectReason::Duplicate);
      return;
    case AdmissionOutcome::AtCapacity:
      sink_->emit_dropped(path, admission.dropped_total, admission.in_flight);
      return;
    case AdmissionOutcome::Admitted:
      break;
  }

  sink_->emit_admitted(path);
  bool submitted = false;
  try {
    submitted = pool_.submit([worker = worker_, path] { worker->run(path); });
  } catch (const std::exception& e) {
    log::error("Failed to queue {}: {}", path, e.what());
  }
  if (!submitted) {
    tracker_->discard(path);
    sink_->emit_rejected(path, RejectReason::PoolUnavailable);
  }
}

}  // namespace imagewatch
