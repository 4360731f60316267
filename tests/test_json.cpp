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

#include "../src/json.hpp"
#include "./test_case.hpp"

using zeroconfd::json_exception;
using zeroconfd::json_t;

void test_parse_scalars() {
  ASSERT_TRUE(json_t::parse("null").is_null());
  ASSERT_EQUAL(json_t::parse("true").as_bool(), true);
  ASSERT_EQUAL(json_t::parse("false").as_bool(), false);
  ASSERT_EQUAL(json_t::parse("8080").as_int(), 8080);
  ASSERT_EQUAL(json_t::parse("-12").as_int(), -12);
  ASSERT_EQUAL(json_t::parse("0").as_int(), 0);
  ASSERT_EQUAL(json_t::parse("2.5").as_float(), 2.5);
  ASSERT_EQUAL(json_t::parse("-0.25").as_float(), -0.25);
  ASSERT_EQUAL(json_t::parse("1e3").as_float(), 1000.0);
  ASSERT_EQUAL(json_t::parse("15E-1").as_float(), 1.5);
  ASSERT_EQUAL(json_t::parse("  \"hello\"  ").as_string(), "hello");
}

void test_int_and_float_are_different() {
  auto i = json_t::parse("60");
  ASSERT_TRUE(i.is_int());
  ASSERT_FALSE(i.is_float());
  ASSERT_EQUAL(i.as_number(), 60.0);

  auto f = json_t::parse("60.0");
  ASSERT_TRUE(f.is_float());
  ASSERT_FALSE(f.is_int());
  ASSERT_THROWS(f.as_int(), json_exception);
}

void test_parse_object() {
  auto json = json_t::parse(R"({
    "type": "_http._tcp.local.",
    "port": 8080,
    "properties": {"a": "1", "b": "2"},
    "list": [1, 2, [3]],
    "empty": {},
    "nothing": []
  })");

  ASSERT_TRUE(json.is_object());
  ASSERT_EQUAL(json["type"].as_string(), "_http._tcp.local.");
  ASSERT_EQUAL(json["port"].as_int(), 8080);
  ASSERT_EQUAL(json["properties"]["b"].as_string(), "2");
  ASSERT_EQUAL(json["list"].as_array().size(), size_t(3));
  ASSERT_EQUAL(json["list"][2][0].as_int(), 3);
  ASSERT_TRUE(json["empty"].as_object().empty());
  ASSERT_TRUE(json["nothing"].as_array().empty());
  ASSERT_FALSE(json.contains("missing"));
  ASSERT_TRUE(json.find("missing") == nullptr);
  ASSERT_THROWS(json["missing"], json_exception);

  // file order is kept
  auto &object = json.as_object();
  ASSERT_EQUAL(object[0].first, "type");
  ASSERT_EQUAL(object[5].first, "nothing");
}

void test_repeated_key_replaces() {
  auto json = json_t::parse(R"({"port": 1, "port": 2})");
  ASSERT_EQUAL(json.as_object().size(), size_t(1));
  ASSERT_EQUAL(json["port"].as_int(), 2);
}

void test_string_escapes() {
  auto json = json_t::parse(R"("a\"b\\c\/d\n\t\u0041\u00e9\ud83d\ude00")");
  ASSERT_EQUAL(json.as_string(), "a\"b\\c/d\n\tA\xc3\xa9\xf0\x9f\x98\x80");
}

void test_to_string() {
  auto json = json_t::from_object();
  json.insert("name", json_t::from_string("say \"hi\"\n"));
  json.insert("port", json_t::from_int(80));
  auto list = json_t::from_array();
  list.push_back(json_t::from_bool(true));
  list.push_back(json_t());
  json.insert("list", std::move(list));

  ASSERT_EQUAL(json.to_string(),
               R"({"name": "say \"hi\"\n", "port": 80, "list": [true, null]})");

  // and back
  auto parsed = json_t::parse(json.to_string());
  ASSERT_EQUAL(parsed["name"].as_string(), "say \"hi\"\n");

  auto copy = parsed.dup();
  ASSERT_EQUAL(copy.to_string(), parsed.to_string());
}

static void assert_parse_error(const std::string &text, int line,
                               int column) {
  try {
    json_t::parse(text);
  } catch (const json_exception &e) {
    DEBUG("{}", e.what());
    ASSERT_EQUAL(e.line, line);
    ASSERT_EQUAL(e.column, column);
    return;
  }
  FAIL(FMT::format("No error parsing: {}", text));
}

void test_parse_errors() {
  assert_parse_error("", 1, 1);
  assert_parse_error("{", 1, 2);
  assert_parse_error("\"unterminated", 1, 14);
  assert_parse_error("[1, 2", 1, 6);
  assert_parse_error("[1 2]", 1, 4);
  assert_parse_error("{\"a\" 1}", 1, 6);
  assert_parse_error("{1: 2}", 1, 2);
  assert_parse_error("{\n  \"a\": @\n}", 2, 8);
  assert_parse_error("{} {}", 1, 4);
  assert_parse_error("tru", 1, 1);
  assert_parse_error("-", 1, 2);
  assert_parse_error("1.", 1, 3);
  assert_parse_error("\"\\x\"", 1, 3);
  assert_parse_error("\"\\ud83d\"", 1, 8);
  assert_parse_error("99999999999999999999", 1, 1);
}

void test_deep_nesting() {
  std::string deep(10000, '[');
  ASSERT_THROWS(json_t::parse(deep), json_exception);
}

int main(int argc, char **argv) {
  test_case_t testcase{
      TEST(test_parse_scalars),
      TEST(test_int_and_float_are_different),
      TEST(test_parse_object),
      TEST(test_repeated_key_replaces),
      TEST(test_string_escapes),
      TEST(test_to_string),
      TEST(test_parse_errors),
      TEST(test_deep_nesting),
  };

  testcase.run(argc, argv);

  return testcase.exit_code();
}
