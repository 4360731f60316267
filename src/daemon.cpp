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

#include "daemon.hpp"
#include "config.hpp"
#include "supervisor.hpp"
#include <iostream>
#include <zeroconfd/exceptions.hpp>
#include <zeroconfd/logger.hpp>

namespace zeroconfd {

static void print_advertisement(const advertisement_t &advertisement) {
  std::cout << FMT::format("type:     {}\n", advertisement.service_type)
            << FMT::format("name:     {}\n", advertisement.instance_name)
            << FMT::format("port:     {}\n", advertisement.port)
            << FMT::format("interval: {}s\n", advertisement.interval_seconds);
  for (auto &entry : advertisement.txt_entries()) {
    std::cout << FMT::format("txt:      {}\n", entry);
  }
}

int daemon_main(const settings_t &settings, responder_t &responder,
                waiter_t &waiter) {
  advertisement_t advertisement;
  try {
    advertisement = load_config(settings.config_filename);
  } catch (const configuration_error &e) {
    ERROR("Invalid configuration: {}", e.what());
    return 1;
  }

  if (settings.check_only) {
    print_advertisement(advertisement);
    return 0;
  }

  INFO("Configuration loaded from {}: {}", settings.config_filename,
       advertisement);

  supervisor_t supervisor(responder, waiter, std::move(advertisement));
  try {
    supervisor.run();
  } catch (const registration_error &e) {
    ERROR("Error on startup: {}", e.what());
    return 1;
  }

  return 0;
}

} // namespace zeroconfd
