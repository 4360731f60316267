/**
 * Zeroconf Service Advertisement Daemon
 * Copyright (C) 2024 The zeroconfd authors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <optional>
#include <zeroconfd/advertisement.hpp>
#include <zeroconfd/responder.hpp>
#include <zeroconfd/utils.hpp>
#include <zeroconfd/waiter.hpp>

namespace zeroconfd {

/**
 * @short Keeps one service advertised until told to stop
 *
 * Registers at startup, then every interval withdraws and publishes the
 * record again. Withdraw comes first so there are never two records for the
 * same name. A failed refresh is logged and retried at the next interval.
 */
class supervisor_t {
  NON_COPYABLE_NOR_MOVABLE(supervisor_t)
public:
  enum state_e {
    STARTING,
    REGISTERED,
    REFRESHING,
    UNREGISTERING,
    STOPPED,
  };

  supervisor_t(responder_t &responder, waiter_t &waiter,
               advertisement_t advertisement);

  /**
   * @brief Registers and refreshes until stop()
   *
   * @throws registration_error if the first registration fails. The
   * responder is closed before the error propagates.
   */
  void run();
  /// One refresh cycle. Failures are logged, never thrown.
  void refresh();
  /// Makes run() return after withdrawing the record
  void stop();

  state_e state() const { return current_state; }
  bool is_registered() const { return registration.has_value(); }
  int refresh_count() const { return refreshes; }
  int failed_refresh_count() const { return failed_refreshes; }
  const advertisement_t &get_advertisement() const { return advertisement; }

private:
  responder_t &responder;
  waiter_t &waiter;
  const advertisement_t advertisement;
  std::optional<registration_t> registration;
  state_e current_state = STARTING;
  int refreshes = 0;
  int failed_refreshes = 0;

  void set_state(state_e state);
  void startup();
  void shutdown();
};
} // namespace zeroconfd

ENUM_FORMATTER_BEGIN(zeroconfd::supervisor_t::state_e);
ENUM_FORMATTER_ELEMENT(zeroconfd::supervisor_t::STARTING, "STARTING");
ENUM_FORMATTER_ELEMENT(zeroconfd::supervisor_t::REGISTERED, "REGISTERED");
ENUM_FORMATTER_ELEMENT(zeroconfd::supervisor_t::REFRESHING, "REFRESHING");
ENUM_FORMATTER_ELEMENT(zeroconfd::supervisor_t::UNREGISTERING,
                       "UNREGISTERING");
ENUM_FORMATTER_ELEMENT(zeroconfd::supervisor_t::STOPPED, "STOPPED");
ENUM_FORMATTER_END();
