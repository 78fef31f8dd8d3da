#include "imagewatch/core/io_ring.hpp"

#include <poll.h>

namespace imagewatch {

IoRing::IoRing() {
  if (io_uring_queue_init(kRingSize, &ring_, 0) == 0) {
    initialized_ = true;
  }
}

IoRing::~IoRing() {
  if (initialized_) {
    io_uring_queue_exit(&ring_);
  }
}

auto IoRing::acquire_sqe() -> io_uring_sqe* {
  if (!initialized_)
    return nullptr;

  auto* sqe = io_uring_get_sqe(&ring_);
  if (!sqe) {
    submit();
    sqe = io_uring_get_sqe(&ring_);
  }
  return sqe;
}

auto IoRing::prepare_timeout(void* user_data, __kernel_timespec* ts) -> bool {
  auto* sqe = acquire_sqe();
  if (!sqe)
    return false;

  io_uring_prep_timeout(sqe, ts, 0, 0);
  io_uring_sqe_set_data(sqe, user_data);
  ++unsubmitted_;
  return true;
}

auto IoRing::prepare_poll_multishot(void* user_data, int fd) -> bool {
  if (fd < 0)
    return false;

  auto* sqe = acquire_sqe();
  if (!sqe)
    return false;

  io_uring_prep_poll_multishot(sqe, fd, POLLIN);
  io_uring_sqe_set_data(sqe, user_data);
  ++unsubmitted_;
  return true;
}

auto IoRing::prepare_cancel(void* target) -> bool {
  auto* sqe = acquire_sqe();
  if (!sqe)
    return false;

  io_uring_prep_cancel(sqe, target, 0);
  io_uring_sqe_set_data(sqe, nullptr);
  ++unsubmitted_;
  return true;
}

auto IoRing::submit() -> int {
  if (!initialized_ || unsubmitted_ == 0)
    return 0;

  unsubmitted_ = 0;
  return io_uring_submit(&ring_);
}

auto IoRing::wait(std::chrono::milliseconds timeout) -> void {
  if (!initialized_)
    return;

  __kernel_timespec ts{.tv_sec = timeout.count() / 1000,
                       .tv_nsec = (timeout.count() % 1000) * 1000000};
  io_uring_cqe* cqe = nullptr;
  // -ETIME and -EINTR both just mean "go around the loop again".
  (void)io_uring_wait_cqe_timeout(&ring_, &cqe, &ts);
}

}  // namespace imagewatch
