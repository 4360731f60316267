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
#include <cstring>
#include <exception>
#include <string>

namespace zeroconfd {
class exception : public std::exception {
  std::string msg;

public:
  template <typename... Args>
  exception(FMT::format_string<Args...> msg, Args &&...args)
      : msg(FMT::format(msg, std::forward<Args>(args)...)) {}
  const char *what() const noexcept override { return msg.c_str(); }
};

/// Missing or invalid configuration. Always fatal, before any network use.
class configuration_error : public exception {
public:
  template <typename... Args>
  configuration_error(FMT::format_string<Args...> msg, Args &&...args)
      : exception(msg, std::forward<Args>(args)...) {}
};

/// The responder could not open, publish or withdraw a service
class registration_error : public exception {
public:
  template <typename... Args>
  registration_error(FMT::format_string<Args...> msg, Args &&...args)
      : exception(msg, std::forward<Args>(args)...) {}
};

/// Cleanup failed while closing the responder session
class shutdown_error : public exception {
public:
  template <typename... Args>
  shutdown_error(FMT::format_string<Args...> msg, Args &&...args)
      : exception(msg, std::forward<Args>(args)...) {}
};

class system_exception : public std::exception {
  std::string str;
  int errno_ = 0;

public:
  system_exception(const char *call, int _errno) : errno_(_errno) {
    str = FMT::format("{} failed: {} ({})", call, strerror(errno_), errno_);
  }
  int get_errno() const { return errno_; }
  const char *what() const noexcept override { return str.c_str(); }
};
} // namespace zeroconfd
