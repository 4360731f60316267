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

#include "settings.hpp"
#include <zeroconfd/responder.hpp>
#include <zeroconfd/waiter.hpp>

namespace zeroconfd {
/**
 * @brief Loads the configuration and keeps the service advertised
 *
 * Returns when the waiter is cancelled.
 *
 * @return the process exit status. 0 after a normal shutdown, even if
 * withdrawing the record failed. 1 on configuration or startup
 * registration errors.
 */
int daemon_main(const settings_t &settings, responder_t &responder,
                waiter_t &waiter);
} // namespace zeroconfd
