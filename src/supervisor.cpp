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

#include "supervisor.hpp"
#include <zeroconfd/exceptions.hpp>
#include <zeroconfd/logger.hpp>

namespace zeroconfd {

supervisor_t::supervisor_t(responder_t &responder, waiter_t &waiter,
                           advertisement_t advertisement)
    : responder(responder), waiter(waiter),
      advertisement(std::move(advertisement)) {}

void supervisor_t::set_state(state_e state) {
  DEBUG("Supervisor state {} -> {}", current_state, state);
  current_state = state;
}

void supervisor_t::run() {
  startup();

  auto interval = advertisement.interval();
  INFO("Advertising {} on port {}. Refresh every {}ms.",
       advertisement.instance_name, advertisement.port, interval.count());
  while (waiter.wait(interval)) {
    refresh();
  }

  shutdown();
}

void supervisor_t::startup() {
  set_state(STARTING);
  responder.open();
  try {
    registration = responder.register_service(advertisement);
  } catch (const registration_error &e) {
    ERROR("Could not register {}: {}", advertisement.instance_name, e.what());
    try {
      responder.close();
    } catch (const shutdown_error &close_error) {
      ERROR("Error closing {}: {}", responder.get_type(), close_error.what());
    }
    set_state(STOPPED);
    throw;
  }
  INFO("Registered {} as {}", advertisement.instance_name, *registration);
  set_state(REGISTERED);
}

void supervisor_t::refresh() {
  set_state(REFRESHING);
  refreshes++;
  INFO("Refreshing registration of {}", advertisement.instance_name);

  if (registration.has_value()) {
    try {
      responder.unregister_service(*registration);
    } catch (const registration_error &e) {
      WARNING("Could not unregister {}, registering anyway: {}",
              *registration, e.what());
    }
    registration.reset();
  }

  try {
    registration = responder.register_service(advertisement);
    DEBUG("Registered again as {}", *registration);
  } catch (const registration_error &e) {
    failed_refreshes++;
    ERROR("Could not register {}, will retry in {}s: {}",
          advertisement.instance_name, advertisement.interval_seconds,
          e.what());
  }

  set_state(REGISTERED);
}

void supervisor_t::stop() { waiter.cancel(); }

void supervisor_t::shutdown() {
  set_state(UNREGISTERING);
  INFO("Withdrawing {}", advertisement.instance_name);

  if (registration.has_value()) {
    try {
      responder.unregister_service(*registration);
    } catch (const registration_error &e) {
      ERROR("Could not unregister {}: {}", *registration, e.what());
    }
    registration.reset();
  }

  try {
    responder.close();
  } catch (const shutdown_error &e) {
    ERROR("Error closing {}: {}", responder.get_type(), e.what());
  }

  set_state(STOPPED);
  INFO("Stopped after {} refreshes, {} failed", refreshes, failed_refreshes);
}

} // namespace zeroconfd
