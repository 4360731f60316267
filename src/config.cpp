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

#include "config.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <zeroconfd/exceptions.hpp>
#include <zeroconfd/logger.hpp>

namespace zeroconfd {

static constexpr std::array<const char *, 5> KNOWN_KEYS = {
    "type", "name", "port", "properties", "interval"};

static const json_t &required(const json_t &json, const char *key) {
  auto *value = json.find(key);
  if (value == nullptr) {
    throw configuration_error("Missing required field \"{}\"", key);
  }
  return *value;
}

static std::string get_string(const json_t &json, const char *key) {
  auto &value = required(json, key);
  if (!value.is_string()) {
    throw configuration_error("Field \"{}\" must be a string, got {}", key,
                              value.type_name());
  }
  return value.as_string();
}

static int get_port(const json_t &json) {
  auto &value = required(json, "port");
  if (!value.is_int()) {
    throw configuration_error("Field \"port\" must be an integer, got {}",
                              value.type_name());
  }
  auto port = value.as_int();
  if (port < 1 || port > 65535) {
    throw configuration_error("Field \"port\" out of range 1..65535: {}",
                              port);
  }
  return int(port);
}

static double get_interval(const json_t &json) {
  auto &value = required(json, "interval");
  if (!value.is_number()) {
    throw configuration_error("Field \"interval\" must be a number, got {}",
                              value.type_name());
  }
  return value.as_number();
}

static std::map<std::string, std::string> get_properties(const json_t &json) {
  auto &value = required(json, "properties");
  if (!value.is_object()) {
    throw configuration_error("Field \"properties\" must be an object, got {}",
                              value.type_name());
  }
  std::map<std::string, std::string> properties;
  for (auto &[key, item] : value.as_object()) {
    if (!item.is_string()) {
      throw configuration_error(
          "Field \"properties.{}\" must be a string, got {}", key,
          item.type_name());
    }
    properties[key] = item.as_string();
  }
  return properties;
}

advertisement_t advertisement_from_json(const json_t &json) {
  if (!json.is_object()) {
    throw configuration_error("Configuration must be a JSON object, got {}",
                              json.type_name());
  }
  for (auto &item : json.as_object()) {
    if (std::find(KNOWN_KEYS.begin(), KNOWN_KEYS.end(), item.first) ==
        KNOWN_KEYS.end()) {
      throw configuration_error("Unknown field \"{}\"", item.first);
    }
  }

  advertisement_t advertisement;
  advertisement.service_type = get_string(json, "type");
  advertisement.instance_name = get_string(json, "name");
  advertisement.port = get_port(json);
  advertisement.properties = get_properties(json);
  advertisement.interval_seconds = get_interval(json);

  advertisement.validate();
  return advertisement;
}

advertisement_t parse_config(const std::string &json_text) {
  json_t json;
  try {
    json = json_t::parse(json_text);
  } catch (const json_exception &e) {
    throw configuration_error("{}", e.what());
  }
  return advertisement_from_json(json);
}

advertisement_t load_config(const std::string &filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw configuration_error("Can not open {}: {}", filename,
                              strerror(errno));
  }
  std::stringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    throw configuration_error("Error reading {}", filename);
  }

  try {
    auto advertisement = parse_config(contents.str());
    DEBUG("Loaded {}: {}", filename, advertisement);
    return advertisement;
  } catch (const configuration_error &e) {
    throw configuration_error("{}: {}", filename, e.what());
  }
}

} // namespace zeroconfd
