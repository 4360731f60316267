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

#include "settings.hpp"
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <vector>
#include <zeroconfd/exceptions.hpp>
#include <zeroconfd/logger.hpp>

namespace zeroconfd {

#ifndef ZEROCONFD_VERSION
// NOLINTNEXTLINE
#define ZEROCONFD_VERSION "unknown"
#endif

// NOLINTNEXTLINE
const char *VERSION = ZEROCONFD_VERSION;

// NOLINTNEXTLINE (cppcoreguidelines-pro-bounds-pointer-arithmetic)
constexpr const char *const CMDLINE_HELP = &R"(
Zeroconf Service Advertisement Daemon v{}
(C) 2024 The zeroconfd authors
Advertises one service over mDNS through the Avahi daemon, and refreshes
the advertisement periodically until stopped.

The configuration is a JSON file:

  {{
    "type": "_http._tcp.local.",
    "name": "my-service._http._tcp.local.",
    "port": 8080,
    "properties": {{"description": "My Zeroconf Service"}},
    "interval": 60
  }}

Options:
)"[1];

struct argument_t {
  std::string arg;
  std::string comment;
  std::function<void(const std::string &)> fn;
  bool has_second_argument = true;

  // NOLINTNEXTLINE
  argument_t(const std::string &arg, const std::string &comment,
             std::function<void(const std::string &)> fn,
             bool has_second_argument = true)
      : arg(arg), comment(comment), fn(fn),
        has_second_argument(has_second_argument) {}
};

static void help(const std::vector<argument_t> &arguments) {
  std::cout << FMT::format(CMDLINE_HELP, VERSION);
  for (auto &argument : arguments) {
    std::cout << FMT::format("  {:<30} {}\n", argument.arg, argument.comment);
  }
}

// Setup the argument options. --help prints the list, so it keeps a
// reference to it.
static void setup_arguments(std::vector<argument_t> &arguments,
                            settings_t *settings) {
  arguments.emplace_back( //
      "--config",         //
      FMT::format("JSON configuration file. Default `{}`",
                  DEFAULT_CONFIG_FILENAME),
      [settings](const std::string &value) {
        if (value.empty()) {
          throw exception("Empty configuration file name");
        }
        settings->config_filename = value;
      });
  arguments.emplace_back( //
      "--log-level",      //
      "debug | info | warning | error. Default info",
      [settings](const std::string &value) {
        settings->log_level = str_to_log_level(value);
      });
  arguments.emplace_back( //
      "--check",          //
      "Load and print the configuration, then exit",
      [settings](const std::string &) { settings->check_only = true; }, false);
  arguments.emplace_back( //
      "--version",        //
      "Show version",
      [](const std::string &) {
        std::cout << FMT::format("zeroconfd version {}\n", VERSION);
        exit(0);
      },
      false);
  arguments.emplace_back( //
      "--help",           //
      "Show this help",
      [&](const std::string &) {
        help(arguments);
        exit(0);
      },
      false);
}

// Parses the argv and sets up the settings_t struct.
// Throws zeroconfd::exception on invalid values.
void parse_argv(const std::vector<std::string> &argv, settings_t *settings) {
  std::vector<argument_t> arguments;
  setup_arguments(arguments, settings);
  // Necesary for two part arguments
  argument_t *current_argument = nullptr;

  for (auto &key : argv) {
    auto parsed = false;
    if (current_argument) {
      current_argument->fn(key);
      parsed = true;
      current_argument = nullptr;
    } else {
      // Checks all arguments
      for (auto &argument : arguments) {
        if (argument.has_second_argument) {
          auto keyeq = FMT::format("{}=", argument.arg);
          if (key.substr(0, keyeq.length()) == keyeq) {
            argument.fn(key.substr(keyeq.length()));
            parsed = true;
            break;
          }
        }
        if (key == argument.arg) {
          if (argument.has_second_argument) {
            current_argument = &argument;
          } else {
            argument.fn("");
          }
          parsed = true;
          break;
        }
      }
    }
    // If none parsed, error
    if (!parsed) {
      ERROR("Unknown argument: {}. Try help with --help.", key);
      exit(1);
    }
  }
  if (current_argument) {
    ERROR("Missing value for {}. Try help with --help.", current_argument->arg);
    exit(1);
  }

  DEBUG("settings after argument parsing: {}", *settings);
}

} // namespace zeroconfd
