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

#include "json.hpp"
#include <string>
#include <zeroconfd/advertisement.hpp>

namespace zeroconfd {

/**
 * @short Reads and validates the advertisement configuration
 *
 * Accepted keys are `type`, `name`, `port`, `properties` and `interval`, all
 * required. Anything else is an error.
 *
 * @throws configuration_error naming the file and the offending field
 */
advertisement_t load_config(const std::string &filename);
/// Same as load_config, from a JSON text
advertisement_t parse_config(const std::string &json_text);
advertisement_t advertisement_from_json(const json_t &json);

} // namespace zeroconfd
