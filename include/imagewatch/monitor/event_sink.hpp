#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string_view>
#include <system_error>

namespace imagewatch {

enum class RejectReason : std::uint8_t { Extension, Duplicate, PoolUnavailable };

[[nodiscard]] constexpr auto to_string_view(RejectReason reason) noexcept
    -> std::string_view {
  switch (reason) {
    case RejectReason::Extension: return "extension";
    case RejectReason::Duplicate: return "duplicate";
    case RejectReason::PoolUnavailable: return "pool_unavailable";
  }
  return "unknown";
}

using EventSubscriber = std::function<void(const nlohmann::json&)>;

// Observable side channel of the pipeline. Every event is logged; when a
// subscriber is set it also receives the event as a JSON object with at
// least "type", "path" and "timestamp" (ms since epoch).
class EventSink {
public:
  explicit EventSink(EventSubscriber subscriber = {});

  EventSink(const EventSink&) = delete;
  auto operator=(const EventSink&) -> EventSink& = delete;

  auto set_subscriber(EventSubscriber subscriber) -> void;

  auto emit_admitted(std::string_view path) -> void;
  auto emit_rejected(std::string_view path, RejectReason reason) -> void;
  auto emit_dropped(std::string_view path, std::uint64_t dropped_total,
                    std::size_t in_flight) -> void;
  auto emit_vanished(std::string_view path) -> void;
  auto emit_verification_failed(std::string_view path, std::error_code reason)
      -> void;
  auto emit_dispatched(std::string_view path) -> void;
  auto emit_processed(std::string_view path) -> void;
  auto emit_dispatch_failed(std::string_view path, std::string_view error)
      -> void;

private:
  auto publish(std::string_view type, std::string_view path,
               nlohmann::json extra = nlohmann::json::object()) -> void;

  std::mutex mu_;
  EventSubscriber subscriber_;
};

}  // namespace imagewatch
