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

#pragma once
#include "logger.hpp"
#include "utils.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace zeroconfd {
struct poller_private_data_t;

/**
 * Simplified fd poller
 *
 * Internally uses epoll, it is level triggered, so data must be read or
 * will retrigger.
 *
 * The avahi client and the interval waiter both live on it, so while the
 * daemon sleeps it still answers avahi.
 */
class poller_t {
  NON_COPYABLE_NOR_MOVABLE(poller_t)
  std::unique_ptr<poller_private_data_t> private_data;

public:
  class timer_t;
  class listener_t;

  poller_t();
  ~poller_t();

  // Call this function in X ms
  [[nodiscard]] timer_t add_timer_event(std::chrono::milliseconds ms,
                                        std::function<void(void)> event_f);
  void remove_timer(timer_t &tid);
  void clear_timers();

  // Just call it later. after finishing current round of event loop
  void call_later(std::function<void(void)> later_f);

  [[nodiscard]] listener_t add_fd_in(int fd, std::function<void(int)> event_f);
  [[nodiscard]] listener_t add_fd_out(int fd, std::function<void(int)> event_f);
  [[nodiscard]] listener_t add_fd_inout(int fd,
                                        std::function<void(int)> event_f);
  /// Gets the epoll events that happened (EPOLLIN, EPOLLOUT, EPOLLERR...)
  [[nodiscard]] listener_t
  add_fd_events(int fd, uint32_t events,
                std::function<void(int, uint32_t)> event_f);
  void update_fd_events(int fd, uint32_t events);
  void __remove_fd(int fd);

  /// One round of the loop: waits for fd events or the next timer
  void wait(std::optional<std::chrono::milliseconds> wait_ms = {});

  void close();
  bool is_open() const;
};
// Singleton for all events on the system.
extern poller_t poller;

class poller_t::timer_t {
public:
  int id;

  timer_t();
  timer_t(int id_);
  timer_t(timer_t &&) noexcept;
  ~timer_t();
  timer_t &operator=(timer_t &&other) noexcept;
  void disable();

  timer_t(const timer_t &) = delete;
  timer_t &operator=(const timer_t &) = delete;
};

class poller_t::listener_t {
public:
  int fd = -1;

  listener_t(int fd_) : fd(fd_) {}
  listener_t() : fd(-1) {}
  listener_t(listener_t &&other) noexcept : fd(other.fd) { other.fd = -1; }
  ~listener_t() { stop(); }

  listener_t &operator=(const listener_t &other) = delete;
  listener_t &operator=(listener_t &&other) noexcept {
    stop();
    fd = other.fd;
    other.fd = -1;
    return *this;
  }
  void stop() {
    if (fd >= 0)
      poller.__remove_fd(fd);
    fd = -1;
  }
};
} // namespace zeroconfd
