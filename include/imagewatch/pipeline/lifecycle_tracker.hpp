#pragma once

#include "imagewatch/core/error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace imagewatch {

enum class FileState : std::uint8_t { Pending, Verifying, Processing };

[[nodiscard]] constexpr auto to_string_view(FileState state) noexcept
    -> std::string_view {
  switch (state) {
    case FileState::Pending: return "pending";
    case FileState::Verifying: return "verifying";
    case FileState::Processing: return "processing";
  }
  return "unknown";
}

struct TrackedFile {
  std::string path;
  FileState state{FileState::Pending};
  std::chrono::steady_clock::time_point admitted_at;
};

enum class AdmissionOutcome : std::uint8_t { Admitted, Duplicate, AtCapacity };

struct AdmissionResult {
  AdmissionOutcome outcome{AdmissionOutcome::Admitted};
  // Both taken inside the same critical section as the decision.
  std::uint64_t dropped_total{0};
  std::size_t in_flight{0};
};

struct TrackerStats {
  std::size_t pending{0};
  std::size_t verifying{0};
  std::size_t processing{0};
  std::uint64_t dropped{0};
};

// Per-activation record of every path between admission and its terminal
// outcome. A path is in at most one state at a time. Pending and Processing
// count against capacity; every state counts for deduplication.
class LifecycleTracker {
public:
  LifecycleTracker() = default;

  LifecycleTracker(const LifecycleTracker&) = delete;
  LifecycleTracker& operator=(const LifecycleTracker&) = delete;

  // Dedup check, capacity check and insert as one step.
  [[nodiscard]] auto try_admit(std::string_view path, std::size_t max_in_flight)
      -> AdmissionResult;

  // Pending -> Verifying. False when the path was not pending.
  auto begin_verify(std::string_view path) -> bool;
  // Verifying -> Processing. False when the path was not verifying.
  auto promote(std::string_view path) -> bool;
  // Drops a Pending or Verifying entry (vanished, invalid, refused by pool).
  auto discard(std::string_view path) -> bool;
  // Drops a Processing entry once its processor finished.
  auto release(std::string_view path) -> bool;

  [[nodiscard]] auto contains(std::string_view path) const -> bool;
  [[nodiscard]] auto state(std::string_view path) const
      -> std::optional<FileState>;

  [[nodiscard]] auto pending_count() const -> std::size_t;
  [[nodiscard]] auto verifying_count() const -> std::size_t;
  [[nodiscard]] auto processing_count() const -> std::size_t;
  [[nodiscard]] auto dropped_count() const -> std::uint64_t;
  [[nodiscard]] auto stats() const -> TrackerStats;

private:
  auto transition(std::string_view path, FileState from, FileState to) -> bool;
  auto erase_in(std::string_view path, FileState from) -> bool;
  auto adjust(FileState state, int delta) -> void;

  mutable std::mutex mu_;
  std::unordered_map<std::string, TrackedFile, StringHash, StringEqual> files_;
  std::size_t pending_{0};
  std::size_t verifying_{0};
  std::size_t processing_{0};
  std::uint64_t dropped_{0};
};

}  // namespace imagewatch
