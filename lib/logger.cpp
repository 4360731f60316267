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

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>
#include <unistd.h>
#include <zeroconfd/exceptions.hpp>
#include <zeroconfd/logger.hpp>

namespace zeroconfd {
logger_t logger2;

static constexpr const char *ansi_color(logger_level_t level) {
  switch (level) {
  case DEBUG:
    return "\033[1;34m";
  case WARNING:
    return "\033[1;33m";
  case ERROR:
    return "\033[1;31m";
  default:
    return "";
  }
}

static constexpr const char *basename(const char *filename) {
  const char *p = filename;
  while (*filename) {
    if (*filename == '/') {
      p = filename + 1;
    }
    filename++;
  }
  return p;
}

logger_t::logger_t() : use_color(isatty(STDOUT_FILENO) == 1) {}

logger_t::buffer_t::iterator
logger_t::log_preamble(logger_level_t level, const char *filename, int lineno) {
  auto it = buffer.begin();
  const char *color = use_color ? ansi_color(level) : "";

  it = FMT::format_to(it, "{}", color);
  auto text_start = it;
  it = FMT::format_to(it, "[{}] {}:{}", level, basename(filename), lineno);
  // align messages, file:line is variable width
  while (it - text_start < 32) {
    *it = ' ';
    it++;
  }
  it = FMT::format_to(it, " | ");
  return it;
}

void logger_t::log_postamble(buffer_t::iterator it) {
  if (use_color) {
    it = FMT::format_to(it, "\033[0m");
  }
  *it = '\0';
  std::cout << buffer.data() << std::endl;
}

logger_level_t str_to_log_level(const std::string &value) {
  if (value == "0") {
    return logger_level_t::DEBUG;
  }
  if (value == "1") {
    return logger_level_t::INFO;
  }
  if (value == "2") {
    return logger_level_t::WARNING;
  }
  if (value == "3") {
    return logger_level_t::ERROR;
  }

  std::string value_lowercase = value;
  std::transform(value_lowercase.begin(), value_lowercase.end(),
                 value_lowercase.begin(),
                 [](unsigned char c) { return char(std::tolower(c)); });

  if (value_lowercase == "debug") {
    return logger_level_t::DEBUG;
  }
  if (value_lowercase == "info") {
    return logger_level_t::INFO;
  }
  if (value_lowercase == "warning") {
    return logger_level_t::WARNING;
  }
  if (value_lowercase == "error") {
    return logger_level_t::ERROR;
  }
  throw zeroconfd::exception("Invalid log level value: {}. Valid values: "
                             "debug, info, warning, error, or 0-3",
                             value);
}

} // namespace zeroconfd
