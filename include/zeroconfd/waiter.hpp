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

#include "poller.hpp"
#include "utils.hpp"
#include <atomic>
#include <chrono>

namespace zeroconfd {

/**
 * @short Cancellable sleep
 *
 * Once cancelled it stays cancelled, every later wait returns at once.
 */
class waiter_t {
public:
  virtual ~waiter_t() = default;

  /// true if the full interval passed, false if cancelled
  virtual bool wait(std::chrono::milliseconds interval) = 0;
  virtual void cancel() = 0;
  virtual bool is_cancelled() const = 0;
};

/**
 * @short Waits by running the poller
 *
 * Other poller users (the avahi client) keep running during the wait.
 * cancel() only sets an atomic flag and writes to an eventfd, so it can be
 * called from a signal handler.
 */
class poller_waiter_t : public waiter_t {
  NON_COPYABLE_NOR_MOVABLE(poller_waiter_t)
  int wakeup_fd = -1;
  std::atomic<bool> cancelled{false};
  poller_t::listener_t wakeup_listener;

public:
  poller_waiter_t();
  ~poller_waiter_t() override;

  bool wait(std::chrono::milliseconds interval) override;
  void cancel() override;
  bool is_cancelled() const override { return cancelled; }
};
} // namespace zeroconfd
