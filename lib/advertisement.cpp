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
#include <cmath>
#include <string_view>
#include <zeroconfd/advertisement.hpp>
#include <zeroconfd/exceptions.hpp>
#include <zeroconfd/stringpp.hpp>

namespace zeroconfd {

std::string advertisement_t::service_type_label() const {
  std::string_view suffix = MDNS_LOCAL_SUFFIX;
  if (!endswith(service_type, suffix)) {
    return service_type;
  }
  return service_type.substr(0, service_type.size() - suffix.size());
}

std::string advertisement_t::instance_label() const {
  // my-service._http._tcp.local. -> ._http._tcp.local.
  auto suffix = "." + service_type;
  if (endswith(instance_name, suffix)) {
    return instance_name.substr(0, instance_name.size() - suffix.size());
  }
  // Not fully qualified, the name is already the label
  if (endswith(instance_name, ".")) {
    return instance_name.substr(0, instance_name.size() - 1);
  }
  return instance_name;
}

std::chrono::milliseconds advertisement_t::interval() const {
  // out of range doubles do not survive the cast to integer ms
  auto seconds = std::min(interval_seconds, MAX_INTERVAL_SECONDS);
  if (!(seconds > 0)) {
    return std::chrono::milliseconds(1);
  }
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::duration<double>(seconds));
  if (ms.count() < 1) {
    return std::chrono::milliseconds(1);
  }
  return ms;
}

std::vector<std::string> advertisement_t::txt_entries() const {
  std::vector<std::string> entries;
  entries.reserve(properties.size());
  for (auto &[key, value] : properties) {
    entries.push_back(key + "=" + value);
  }
  return entries;
}

void advertisement_t::validate() const {
  if (service_type.empty()) {
    throw configuration_error("Service type can not be empty");
  }
  if (!endswith(service_type, MDNS_LOCAL_SUFFIX)) {
    throw configuration_error("Service type \"{}\" must end with \"{}\"",
                              service_type, MDNS_LOCAL_SUFFIX);
  }
  if (service_type_label().empty()) {
    throw configuration_error("Service type \"{}\" has no protocol label",
                              service_type);
  }
  if (instance_name.empty()) {
    throw configuration_error("Instance name can not be empty");
  }
  auto label = instance_label();
  if (label.empty()) {
    throw configuration_error("Instance name \"{}\" has no instance label",
                              instance_name);
  }
  if (label.size() > DNS_LABEL_MAX_LENGTH) {
    throw configuration_error(
        "Instance label \"{}\" is {} bytes long, the maximum is {}", label,
        label.size(), DNS_LABEL_MAX_LENGTH);
  }
  if (port < 1 || port > 65535) {
    throw configuration_error("Port {} out of range 1-65535", port);
  }
  if (!std::isfinite(interval_seconds) || interval_seconds <= 0) {
    throw configuration_error("Interval must be a positive number of seconds, "
                              "got {}",
                              interval_seconds);
  }
  if (interval_seconds > MAX_INTERVAL_SECONDS) {
    throw configuration_error("Interval of {}s is too long, the maximum is {}s",
                              interval_seconds, MAX_INTERVAL_SECONDS);
  }
  for (auto &[key, value] : properties) {
    if (key.empty()) {
      throw configuration_error("Property keys can not be empty");
    }
    if (key.find('=') != std::string::npos) {
      throw configuration_error("Property key \"{}\" can not contain '='",
                                key);
    }
    if (key.size() + 1 + value.size() > TXT_ENTRY_MAX_LENGTH) {
      throw configuration_error(
          "Property \"{}\" is too long for a TXT record, max {} bytes for "
          "key=value",
          key, TXT_ENTRY_MAX_LENGTH);
    }
  }
}

} // namespace zeroconfd
