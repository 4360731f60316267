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

#include "advertisement.hpp"
#include "formatterhelper.hpp"

namespace zeroconfd {

/// Handle to one published record. Only meaningful to the responder that
/// returned it.
struct registration_t {
  int id = 0;
};

/**
 * @short A session with an mDNS responder
 *
 * Must be inherited by the real responders. All methods report failures
 * with exceptions.
 */
class responder_t {
public:
  virtual ~responder_t() = default;

  /**
   * @brief Opens the session
   *
   * @throws registration_error if the responder is not reachable
   */
  virtual void open() = 0;
  /**
   * @brief Publishes the record
   *
   * Returns once the responder reports the record as established.
   *
   * @throws registration_error on any failure, name collisions included
   */
  virtual registration_t register_service(const advertisement_t &) = 0;
  /**
   * @brief Withdraws a published record
   *
   * @throws registration_error
   */
  virtual void unregister_service(const registration_t &) = 0;
  /**
   * @brief Closes the session, withdrawing anything still published
   *
   * @throws shutdown_error
   */
  virtual void close() = 0;

  virtual const char *get_type() const = 0;
};
} // namespace zeroconfd

BASIC_FORMATTER(zeroconfd::registration_t, "registration_t[{}]", v.id);
