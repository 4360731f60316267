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

#include "../src/config.hpp"
#include "./test_case.hpp"
#include <cstdio>
#include <fstream>
#include <unistd.h>
#include <zeroconfd/advertisement.hpp>
#include <zeroconfd/exceptions.hpp>
#include <zeroconfd/logger.hpp>

using zeroconfd::configuration_error;
using zeroconfd::parse_config;

static const char *VALID_CONFIG = R"({
  "type": "_http._tcp.local.",
  "name": "my-service._http._tcp.local.",
  "port": 8080,
  "properties": {"description": "My Zeroconf Service", "path": "/"},
  "interval": 60
})";

// Valid config with one field replaced by raw JSON, or removed if empty
static std::string config_with(const std::string &key,
                               const std::string &value) {
  auto json = zeroconfd::json_t::parse(VALID_CONFIG);
  auto result = zeroconfd::json_t::from_object();
  for (auto &[k, v] : json.as_object()) {
    if (k != key) {
      result.insert(k, v.dup());
    } else if (!value.empty()) {
      result.insert(k, zeroconfd::json_t::parse(value));
    }
  }
  if (!json.contains(key) && !value.empty()) {
    result.insert(key, zeroconfd::json_t::parse(value));
  }
  return result.to_string();
}

static void assert_invalid(const std::string &key, const std::string &value) {
  auto config = config_with(key, value);
  DEBUG("Checking invalid: {}", config);
  ASSERT_THROWS(parse_config(config), configuration_error);
}

void test_valid_config() {
  auto advertisement = parse_config(VALID_CONFIG);
  ASSERT_EQUAL(advertisement.service_type, "_http._tcp.local.");
  ASSERT_EQUAL(advertisement.instance_name, "my-service._http._tcp.local.");
  ASSERT_EQUAL(advertisement.port, 8080);
  ASSERT_EQUAL(advertisement.interval_seconds, 60.0);
  ASSERT_EQUAL(advertisement.properties.size(), size_t(2));
  ASSERT_EQUAL(advertisement.properties["description"], "My Zeroconf Service");
}

void test_derived_values() {
  auto advertisement = parse_config(VALID_CONFIG);
  ASSERT_EQUAL(advertisement.service_type_label(), "_http._tcp");
  ASSERT_EQUAL(advertisement.instance_label(), "my-service");
  ASSERT_EQUAL(advertisement.interval().count(), 60000);

  auto txt = advertisement.txt_entries();
  ASSERT_EQUAL(txt.size(), size_t(2));
  ASSERT_EQUAL(txt[0], "description=My Zeroconf Service");
  ASSERT_EQUAL(txt[1], "path=/");

  // not fully qualified names are the label
  advertisement.instance_name = "Living Room.";
  ASSERT_EQUAL(advertisement.instance_label(), "Living Room");
  advertisement.instance_name = "printer";
  ASSERT_EQUAL(advertisement.instance_label(), "printer");
}

void test_interval_values() {
  ASSERT_EQUAL(parse_config(config_with("interval", "0.5")).interval().count(),
               500);
  ASSERT_EQUAL(parse_config(config_with("interval", "1")).interval().count(),
               1000);
  // never a busy loop
  ASSERT_EQUAL(
      parse_config(config_with("interval", "0.0000001")).interval().count(), 1);
}

void test_long_intervals() {
  // 30 days does not fit in 32 bit milliseconds
  ASSERT_EQUAL(
      parse_config(config_with("interval", "2592000")).interval().count(),
      int64_t(2592000000));
  ASSERT_EQUAL(
      parse_config(config_with("interval", "31536000")).interval().count(),
      int64_t(31536000000));
  assert_invalid("interval", "31536001");
  assert_invalid("interval", "1e18");
  assert_invalid("interval", "1e300");

  // never validated, still no busy loop
  zeroconfd::advertisement_t advertisement;
  advertisement.interval_seconds = 1e18;
  ASSERT_EQUAL(advertisement.interval().count(), int64_t(31536000000));
}

void test_log_level_names() {
  ASSERT_EQUAL(zeroconfd::str_to_log_level("DEBUG"),
               zeroconfd::logger_level_t::DEBUG);
  ASSERT_EQUAL(zeroconfd::str_to_log_level("Warning"),
               zeroconfd::logger_level_t::WARNING);
  ASSERT_EQUAL(zeroconfd::str_to_log_level("3"),
               zeroconfd::logger_level_t::ERROR);
  ASSERT_THROWS(zeroconfd::str_to_log_level("verbose"), zeroconfd::exception);
  // UTF-8 bytes are negative chars
  ASSERT_THROWS(zeroconfd::str_to_log_level("d\xc3\xa9" "bug"),
                zeroconfd::exception);
  ASSERT_THROWS(zeroconfd::str_to_log_level("\xff\xfe"), zeroconfd::exception);
}

void test_port_limits() {
  ASSERT_EQUAL(parse_config(config_with("port", "1")).port, 1);
  ASSERT_EQUAL(parse_config(config_with("port", "65535")).port, 65535);
  assert_invalid("port", "0");
  assert_invalid("port", "65536");
  assert_invalid("port", "-1");
  assert_invalid("port", "80.0");
  assert_invalid("port", "\"80\"");
  assert_invalid("port", "true");
}

void test_invalid_interval() {
  assert_invalid("interval", "0");
  assert_invalid("interval", "-5");
  assert_invalid("interval", "-0.1");
  assert_invalid("interval", "\"60\"");
  assert_invalid("interval", "false");
  assert_invalid("interval", "null");
}

void test_invalid_names() {
  assert_invalid("type", "\"\"");
  assert_invalid("type", "\"_http._tcp\"");
  assert_invalid("type", "\"_http._tcp.local\"");
  assert_invalid("type", "\".local.\"");
  assert_invalid("type", "42");
  assert_invalid("name", "\"\"");
  assert_invalid("name", "\"._http._tcp.local.\"");
  assert_invalid("name", FMT::format("\"{}._http._tcp.local.\"",
                                     std::string(64, 'x')));
  assert_invalid("name", "[]");

  // 63 is fine
  auto name = FMT::format("\"{}._http._tcp.local.\"", std::string(63, 'x'));
  ASSERT_EQUAL(parse_config(config_with("name", name)).instance_label().size(),
               size_t(63));
}

void test_invalid_properties() {
  assert_invalid("properties", "[]");
  assert_invalid("properties", "\"a=b\"");
  assert_invalid("properties", R"({"version": 1})");
  assert_invalid("properties", R"({"enabled": true})");
  assert_invalid("properties", R"({"": "empty"})");
  assert_invalid("properties", R"({"a=b": "c"})");
  assert_invalid("properties",
                 FMT::format(R"({{"k": "{}"}})", std::string(254, 'v')));

  // key=value of exactly 255 bytes
  auto config = config_with(
      "properties", FMT::format(R"({{"k": "{}"}})", std::string(253, 'v')));
  ASSERT_EQUAL(parse_config(config).txt_entries()[0].size(), size_t(255));

  auto empty = parse_config(config_with("properties", "{}"));
  ASSERT_TRUE(empty.properties.empty());
  ASSERT_TRUE(empty.txt_entries().empty());
}

void test_missing_fields() {
  for (auto key : {"type", "name", "port", "properties", "interval"}) {
    assert_invalid(key, "");
  }
}

void test_unknown_field() { assert_invalid("host", "\"myhost.local.\""); }

void test_not_an_object() {
  ASSERT_THROWS(parse_config("[]"), configuration_error);
  ASSERT_THROWS(parse_config("\"config\""), configuration_error);
  ASSERT_THROWS(parse_config(""), configuration_error);
  ASSERT_THROWS(parse_config("{\"type\": "), configuration_error);
}

void test_load_file() {
  char filename[] = "/tmp/zeroconfd-test-XXXXXX";
  int fd = mkstemp(filename);
  ASSERT_GTE(fd, 0);
  close(fd);

  {
    std::ofstream file(filename);
    file << VALID_CONFIG;
  }
  auto advertisement = zeroconfd::load_config(filename);
  ASSERT_EQUAL(advertisement.port, 8080);

  {
    std::ofstream file(filename);
    file << "{\"type\": \"_http._tcp.local.\",\n oops}";
  }
  try {
    zeroconfd::load_config(filename);
    FAIL("Broken JSON accepted");
  } catch (const configuration_error &e) {
    std::string msg = e.what();
    DEBUG("Error: {}", msg);
    // the message says where the problem is
    ASSERT_NOT_EQUAL(msg.find(filename), std::string::npos);
    ASSERT_NOT_EQUAL(msg.find("2:2"), std::string::npos);
  }

  unlink(filename);
  ASSERT_THROWS(zeroconfd::load_config(filename), configuration_error);
}

void test_error_names_field() {
  try {
    parse_config(config_with("port", "\"80\""));
    FAIL("String port accepted");
  } catch (const configuration_error &e) {
    std::string msg = e.what();
    ASSERT_NOT_EQUAL(msg.find("port"), std::string::npos);
  }
}

int main(int argc, char **argv) {
  test_case_t testcase{
      TEST(test_valid_config),       TEST(test_derived_values),
      TEST(test_interval_values),    TEST(test_port_limits),
      TEST(test_invalid_interval),   TEST(test_invalid_names),
      TEST(test_invalid_properties), TEST(test_missing_fields),
      TEST(test_unknown_field),      TEST(test_not_an_object),
      TEST(test_load_file),          TEST(test_error_names_field),
      TEST(test_long_intervals),     TEST(test_log_level_names),
  };

  testcase.run(argc, argv);

  return testcase.exit_code();
}
