/**
 * Zeroconf Service Advertisement Daemon
 * Copyright (C) 2024 The zeroconfd authors
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301 USA
 */

#include <cstdint>
#include <errno.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <zeroconfd/exceptions.hpp>
#include <zeroconfd/logger.hpp>
#include <zeroconfd/waiter.hpp>

namespace zeroconfd {

poller_waiter_t::poller_waiter_t() {
  wakeup_fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wakeup_fd < 0) {
    throw system_exception("eventfd", errno);
  }
  wakeup_listener = poller.add_fd_in(wakeup_fd, [](int fd) {
    uint64_t count = 0;
    // Just drain it. The flag says why we woke up.
    if (::read(fd, &count, sizeof(count)) < 0 && errno != EAGAIN) {
      WARNING("Could not read wakeup eventfd: {}", strerror(errno));
    }
  });
}

poller_waiter_t::~poller_waiter_t() {
  wakeup_listener.stop();
  ::close(wakeup_fd);
}

bool poller_waiter_t::wait(std::chrono::milliseconds interval) {
  if (cancelled) {
    return false;
  }

  bool expired = false;
  auto timer = poller.add_timer_event(interval, [&expired] { expired = true; });

  while (!expired && !cancelled && poller.is_open()) {
    poller.wait();
  }

  if (cancelled || !poller.is_open()) {
    DEBUG("Wait of {}ms cancelled", interval.count());
    return false;
  }
  return true;
}

// Signal handler context: atomics and write(2) only
void poller_waiter_t::cancel() {
  cancelled = true;
  uint64_t one = 1;
  auto res = ::write(wakeup_fd, &one, sizeof(one));
  (void)res; // can not log here. A full counter is still readable.
}

} // namespace zeroconfd
