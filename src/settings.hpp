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

#include <string>
#include <vector>
#include <zeroconfd/logger.hpp>

namespace zeroconfd {

extern const char *VERSION;

constexpr const char *DEFAULT_CONFIG_FILENAME = "/etc/zeroconfd/zeroconfd.json";

struct settings_t {
  std::string config_filename = DEFAULT_CONFIG_FILENAME;
  logger_level_t log_level = logger_level_t::INFO;
  // Only load and print the configuration
  bool check_only = false;
};

// Exits on --help, --version and unknown arguments
void parse_argv(const std::vector<std::string> &argv, settings_t *settings);
} // namespace zeroconfd

BASIC_FORMATTER(zeroconfd::settings_t, "settings_t[{}, {}, check_only={}]",
                v.config_filename, v.log_level, v.check_only);
