#pragma once

#include <chrono>
#include <cstdint>

#include <liburing.h>

namespace imagewatch {

inline constexpr std::uint32_t kRingSize = 256;

// Thin owner of one io_uring instance. Construction never fails; callers
// check valid() and fall back to poll()-based waiting when the kernel (or a
// sandbox) refuses io_uring.
class IoRing {
public:
  IoRing();
  ~IoRing();

  IoRing(const IoRing&) = delete;
  IoRing& operator=(const IoRing&) = delete;

  [[nodiscard]] auto valid() const noexcept -> bool {
    return initialized_;
  }

  [[nodiscard]] auto prepare_timeout(void* user_data, __kernel_timespec* ts)
      -> bool;
  [[nodiscard]] auto prepare_poll_multishot(void* user_data, int fd) -> bool;
  [[nodiscard]] auto prepare_cancel(void* target) -> bool;

  auto submit() -> int;
  auto wait(std::chrono::milliseconds timeout) -> void;

  template <typename Callback>
  auto process_completions(Callback&& cb) -> unsigned {
    if (!initialized_)
      return 0;

    io_uring_cqe* cqe = nullptr;
    unsigned head = 0;
    unsigned count = 0;

    io_uring_for_each_cqe(&ring_, head, cqe) {
      cb(io_uring_cqe_get_data(cqe), cqe->res, cqe->flags);
      ++count;
    }
    io_uring_cq_advance(&ring_, count);
    return count;
  }

private:
  [[nodiscard]] auto acquire_sqe() -> io_uring_sqe*;

  io_uring ring_{};
  bool initialized_ = false;
  std::uint32_t unsubmitted_ = 0;
};

}  // namespace imagewatch
