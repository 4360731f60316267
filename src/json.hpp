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

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <zeroconfd/exceptions.hpp>

namespace zeroconfd {

class json_exception : public exception {
public:
  int line;
  int column;

  json_exception(int line, int column, const std::string &error)
      : exception("Error parsing JSON at {}:{}: {}", line, column, error),
        line(line), column(column) {}
};

/**
 * @short JSON value
 *
 * Only what the configuration needs: parse, inspect, print. Objects keep
 * the keys in file order, a repeated key replaces the previous value.
 */
class json_t {
public:
  enum type_e { NULL_, BOOL, INT, FLOAT, STRING, ARRAY, OBJECT };
  using array_t = std::vector<json_t>;
  using object_t = std::vector<std::pair<std::string, json_t>>;

private:
  type_e m_type = NULL_;
  bool m_bool = false;
  int64_t m_int = 0;
  double m_float = 0;
  std::string m_string;
  array_t m_array;
  object_t m_object;

public:
  // can not plain copy. Use std::move or explicit dup()
  json_t(const json_t &) = delete;
  json_t &operator=(const json_t &) = delete;
  json_t(json_t &&other) = default;
  json_t &operator=(json_t &&other) = default;
  ~json_t() = default;

  json_t() = default;
  json_t(std::nullptr_t) {}

  static json_t from_bool(bool value);
  static json_t from_int(int64_t value);
  static json_t from_float(double value);
  static json_t from_string(const std::string &value);
  static json_t from_array();
  static json_t from_object();

  json_t dup() const;

  type_e type() const { return m_type; }
  const char *type_name() const;

  bool is_null() const { return m_type == NULL_; }
  bool is_bool() const { return m_type == BOOL; }
  bool is_int() const { return m_type == INT; }
  bool is_float() const { return m_type == FLOAT; }
  bool is_number() const { return is_int() || is_float(); }
  bool is_string() const { return m_type == STRING; }
  bool is_array() const { return m_type == ARRAY; }
  bool is_object() const { return m_type == OBJECT; }

  // All throw json_exception on the wrong type
  bool as_bool() const;
  int64_t as_int() const;
  double as_float() const;
  /// int or float, as double
  double as_number() const;
  const std::string &as_string() const;
  const array_t &as_array() const;
  array_t &as_array();
  const object_t &as_object() const;
  object_t &as_object();

  void push_back(json_t &&value);
  void insert(const std::string &key, json_t &&value);

  /// nullptr if not an object or no such key
  const json_t *find(const std::string &key) const;
  bool contains(const std::string &key) const { return find(key) != nullptr; }
  /// Throws json_exception if the key is missing
  const json_t &operator[](const std::string &key) const;
  const json_t &operator[](size_t index) const;

  std::string to_string() const;
  std::string dump() const { return to_string(); }

  static json_t parse(const std::string &json);
};

} // namespace zeroconfd
