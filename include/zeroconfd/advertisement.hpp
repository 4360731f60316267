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
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace zeroconfd {

/// Domain all advertisements live in
constexpr const char *MDNS_LOCAL_SUFFIX = ".local.";
constexpr const char *MDNS_LOCAL_DOMAIN = "local";
constexpr size_t DNS_LABEL_MAX_LENGTH = 63;
constexpr size_t TXT_ENTRY_MAX_LENGTH = 255;
/// One year
constexpr double MAX_INTERVAL_SECONDS = 365.0 * 24 * 3600;

/**
 * @short One service record to publish via mDNS
 *
 * Names are written fully qualified, as in `_http._tcp.local.` and
 * `my-service._http._tcp.local.`. Avahi wants the parts split, which is
 * what the derived accessors return.
 */
struct advertisement_t {
  std::string service_type;
  std::string instance_name;
  int port = 0;
  std::map<std::string, std::string> properties;
  double interval_seconds = 0;

  /// Throws configuration_error at the first broken invariant
  void validate() const;

  /// `_http._tcp.local.` -> `_http._tcp`
  std::string service_type_label() const;
  /// `my-service._http._tcp.local.` -> `my-service`
  std::string instance_label() const;
  /// Refresh period, between 1ms and MAX_INTERVAL_SECONDS
  std::chrono::milliseconds interval() const;
  /// TXT record entries, `key=value`, sorted by key
  std::vector<std::string> txt_entries() const;
};

} // namespace zeroconfd

MAP_FORMATTER(std::string, std::string);

BASIC_FORMATTER(zeroconfd::advertisement_t,
                "advertisement_t[type={}, name={}, port={}, properties={}, "
                "interval={}s]",
                v.service_type, v.instance_name, v.port, v.properties,
                v.interval_seconds);
