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
#include "formatterhelper.hpp"
#include <array>
#include <string>

namespace zeroconfd {
enum logger_level_t { DEBUG, INFO, WARNING, ERROR };
}

ENUM_FORMATTER_BEGIN(zeroconfd::logger_level_t);
ENUM_FORMATTER_ELEMENT(zeroconfd::logger_level_t::DEBUG, "DEBUG");
ENUM_FORMATTER_ELEMENT(zeroconfd::logger_level_t::INFO, "INFO ");
ENUM_FORMATTER_ELEMENT(zeroconfd::logger_level_t::WARNING, "WARN ");
ENUM_FORMATTER_ELEMENT(zeroconfd::logger_level_t::ERROR, "ERROR");
ENUM_FORMATTER_END();

namespace zeroconfd {

/**
 * @short Line logger
 *
 * Writes `[LEVEL] file:line | message` to stdout. Under systemd stdout goes
 * to the journal, so colors are only used when stdout is a terminal.
 */
class logger_t {
  using buffer_t = std::array<char, 1024>;
  // preallocated, no allocation per log line
  buffer_t buffer;
  logger_level_t current_log_level = logger_level_t::INFO;
  bool use_color;

public:
  logger_t();

  buffer_t::iterator log_preamble(logger_level_t level, const char *filename,
                                  int lineno);
  void log_postamble(buffer_t::iterator it);
  void set_log_level(logger_level_t level) { current_log_level = level; }
  logger_level_t get_log_level() const { return current_log_level; }
  void set_color(bool color) { use_color = color; }

  template <typename... Args>
  void log(logger_level_t level, const char *filename, int lineno,
           FMT::format_string<Args...> message, Args &&...args) {
    if (level < current_log_level) {
      return;
    }

    auto it = log_preamble(level, filename, lineno);

    auto max_size = buffer.size() - (it - buffer.begin()) - 16;
    auto res =
        FMT::format_to_n(it, max_size, message, std::forward<Args>(args)...);
    it = res.out;

    log_postamble(it);
  }
};

extern logger_t logger2;

// Accepts "debug"/"info"/"warning"/"error" in any case, or "0".."3"
logger_level_t str_to_log_level(const std::string &value);
} // namespace zeroconfd

#ifdef DEBUG
#undef DEBUG
#endif
#ifdef INFO
#undef INFO
#endif
#ifdef ERROR
#undef ERROR
#endif
#ifdef WARNING
#undef WARNING
#endif

#ifndef LOG_LEVEL
#define LOG_LEVEL 1 // 1: debug, 2: info, 3: warning, 4: error
#endif

#if LOG_LEVEL <= 1
#define DEBUG(...)                                                             \
  ::zeroconfd::logger2.log(zeroconfd::logger_level_t::DEBUG, __FILE__,         \
                           __LINE__, __VA_ARGS__)
#else
#define DEBUG(...)
#endif
#if LOG_LEVEL <= 2
#define INFO(...)                                                              \
  ::zeroconfd::logger2.log(zeroconfd::logger_level_t::INFO, __FILE__,          \
                           __LINE__, __VA_ARGS__)
#else
#define INFO(...)
#endif
#if LOG_LEVEL <= 3
#define WARNING(...)                                                           \
  ::zeroconfd::logger2.log(zeroconfd::logger_level_t::WARNING, __FILE__,       \
                           __LINE__, __VA_ARGS__)
#else
#define WARNING(...)
#endif
#if LOG_LEVEL <= 4
#define ERROR(...)                                                             \
  ::zeroconfd::logger2.log(zeroconfd::logger_level_t::ERROR, __FILE__,         \
                           __LINE__, __VA_ARGS__)
#else
#define ERROR(...)
#endif

#define ERROR_ONCE(...)                                                        \
  {                                                                            \
    static bool __error_once_unseen_##__LINE__ = true;                         \
    if (__error_once_unseen_##__LINE__) {                                      \
      __error_once_unseen_##__LINE__ = false;                                  \
      ERROR(__VA_ARGS__);                                                      \
    }                                                                          \
  }
