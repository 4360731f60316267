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
#include "settings.hpp"
#include <atomic>
#include <csignal>
#include <unistd.h>
#include <zeroconfd/avahi_responder.hpp>
#include <zeroconfd/exceptions.hpp>
#include <zeroconfd/logger.hpp>
#include <zeroconfd/poller.hpp>
#include <zeroconfd/waiter.hpp>

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static volatile sig_atomic_t exiting = 0;
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static std::atomic<zeroconfd::waiter_t *> signal_waiter{nullptr};

// Only async signal safe calls here. The supervisor logs the shutdown.
static void stop_f(int) {
  if (exiting) {
    _exit(1);
  }
  exiting = 1;
  auto *waiter = signal_waiter.load();
  if (waiter) {
    waiter->cancel();
  }
}

// Signals cancel the waiter only while it is alive
class signal_target_t {
public:
  explicit signal_target_t(zeroconfd::waiter_t *waiter) {
    signal_waiter = waiter;
    signal(SIGINT, stop_f);
    signal(SIGTERM, stop_f);
  }
  ~signal_target_t() { signal_waiter = nullptr; }
};

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, char **argv) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; i++) {
    args.push_back(argv[i]);
  }

  zeroconfd::settings_t settings;
  try {
    zeroconfd::parse_argv(args, &settings);
  } catch (const std::exception &exc) {
    ERROR("Invalid arguments: {}", exc.what());
    return 1;
  }
  zeroconfd::logger2.set_log_level(settings.log_level);

  int ret = 1;
  try {
    zeroconfd::avahi_responder_t responder;
    zeroconfd::poller_waiter_t waiter;
    signal_target_t signal_target(&waiter);

    ret = zeroconfd::daemon_main(settings, responder, waiter);
  } catch (const std::exception &exc) {
    ERROR("Unhandled exception: {}!", exc.what());
    ret = 1;
  }

  zeroconfd::poller.close();

  INFO("FIN");
  return ret;
}
