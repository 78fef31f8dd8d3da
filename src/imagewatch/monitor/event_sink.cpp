#include "imagewatch/monitor/event_sink.hpp"

#include "imagewatch/util/log.hpp"

#include <chrono>
#include <exception>

namespace imagewatch {

EventSink::EventSink(EventSubscriber subscriber)
    : subscriber_(std::move(subscriber)) {
}

auto EventSink::set_subscriber(EventSubscriber subscriber) -> void {
  std::scoped_lock lock(mu_);
  subscriber_ = std::move(subscriber);
}

auto EventSink::emit_admitted(std::string_view path) -> void {
  log::debug("Admitted {}", path);
  publish("admitted", path);
}

auto EventSink::emit_rejected(std::string_view path, RejectReason reason)
    -> void {
  if (reason == RejectReason::PoolUnavailable) {
    log::warn("Rejected {}: worker pool unavailable", path);
  } else {
    log::debug("Rejected {}: {}", path, to_string_view(reason));
  }
  publish("rejected", path, {{"reason", to_string_view(reason)}});
}

auto EventSink::emit_dropped(std::string_view path, std::uint64_t dropped_total,
                             std::size_t in_flight) -> void {
  log::warn("Dropped {}: at capacity ({} in flight, {} dropped so far)", path,
            in_flight, dropped_total);
  publish("dropped", path,
          {{"dropped_total", dropped_total}, {"in_flight", in_flight}});
}

auto EventSink::emit_vanished(std::string_view path) -> void {
  log::debug("{} vanished before verification", path);
  publish("vanished", path);
}

auto EventSink::emit_verification_failed(std::string_view path,
                                         std::error_code reason) -> void {
  log::warn("Verification failed for {}: {}", path, reason.message());
  publish("verification_failed", path, {{"reason", reason.message()}});
}

auto EventSink::emit_dispatched(std::string_view path) -> void {
  log::debug("Dispatched {}", path);
  publish("dispatched", path);
}

auto EventSink::emit_processed(std::string_view path) -> void {
  log::info("Processed {}", path);
  publish("processed", path);
}

auto EventSink::emit_dispatch_failed(std::string_view path,
                                     std::string_view error) -> void {
  log::error("Processing {} failed: {}", path, error);
  publish("dispatch_failed", path, {{"error", error}});
}

auto EventSink::publish(std::string_view type, std::string_view path,
                        nlohmann::json extra) -> void {
  EventSubscriber subscriber;
  {
    std::scoped_lock lock(mu_);
    subscriber = subscriber_;
  }
  if (!subscriber)
    return;

  try {
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();
    nlohmann::json j = {{"type", type}, {"path", path}, {"timestamp", now}};
    j.update(extra);
    subscriber(j);
  } catch (const std::exception& e) {
    log::error("Event subscriber failed on {}: {}", type, e.what());
  } catch (...) {
    log::error("Event subscriber failed on {}: non-standard exception", type);
  }
}

}  // namespace imagewatch
