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

#include <zeroconfd/stringpp.hpp>
#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include <zeroconfd/logger.hpp>

// NOLINTNEXTLINE
#define TEST(fn) {#fn, fn}

class test_exception : public std::exception {
public:
  std::string msg;
  const char *filename;
  int line;
  std::string error;

  test_exception(const char *file, int line, const std::string &error)
      : filename(file), line(line), error(error) {
    msg = FMT::format("{}:{} Test Fail: {}{}{}", file, line, "\033[1;31m",
                      error, "\033[0m");
  }
  const char *what() const noexcept override { return msg.c_str(); }
};

struct test_t {
  std::string name;
  std::function<void(void)> fn;
};

class test_case_t {
public:
  std::vector<test_t> tests;
  std::vector<std::string> failed;

  test_case_t(std::initializer_list<test_t> tests_) : tests(tests_) {}

  bool string_in_argv(const std::vector<std::string> &args,
                      const std::string &name) {
    if (args.size() == 0)
      return true;

    for (auto &item : args) {
      if (name.find(item) != name.npos)
        return true;
    }
    return false;
  }

  void help(const char *cmdname) {
    INFO("{} [--failfast] [--debug] [--help] [testname...]", cmdname);
  }

  bool run(int argc = 0, char **argv = nullptr) {
    std::vector<std::string> args;
    bool failfast = false;
    ::zeroconfd::logger2.set_log_level(::zeroconfd::logger_level_t::INFO);
    for (auto i = 1; i < argc; i++) {
      std::string opt = argv[i];
      if (opt == "--help") {
        help(argv[0]);
        return true;
      }
      if (opt == "--failfast") {
        failfast = true;
      } else if (opt == "--debug") {
        ::zeroconfd::logger2.set_log_level(::zeroconfd::logger_level_t::DEBUG);
      } else if (zeroconfd::startswith(opt, "--")) {
        ERROR("Unknown argument {}", opt);
        help(argv[0]);
        return false;
      } else {
        args.push_back(std::move(opt));
      }
    }

    auto total = tests.size();
    int count = 0;
    for (auto &tcase : tests) {
      count += 1;
      if (!string_in_argv(args, tcase.name)) {
        continue;
      }
      INFO("*******************************************************************"
           "**************************");
      INFO("Test ({}/{}) {} Run", count, total, tcase.name);
      auto start = std::chrono::steady_clock::now();
      try {
        tcase.fn();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - start)
                      .count();
        INFO("Test {} OK ({}ms)", tcase.name, ms);
      } catch (const test_exception &e) {
        ::zeroconfd::logger2.log(::zeroconfd::logger_level_t::ERROR,
                                 e.filename, e.line, "{}", e.error);
        ERROR("FAIL TEST {}: {}", tcase.name, e.what());
        failed.push_back(tcase.name);
      } catch (const std::exception &e) {
        ERROR("FAIL TEST {}: {}", tcase.name, e.what());
        failed.push_back(tcase.name);
      }

      if (failfast && !failed.empty()) {
        return false;
      }
    }
    if (failed.empty()) {
      INFO("No errors.");
      return true;
    }
    for (auto &name : failed) {
      ERROR("Failed: {}", name);
    }
    ERROR("{} Errors", failed.size());
    return false;
  }

  int exit_code() { return failed.empty() ? 0 : 1; }
};

// NOLINTNEXTLINE
#define ASSERT_TRUE(A)                                                         \
  if (!(A)) {                                                                  \
    throw test_exception(__FILE__, __LINE__, "Assert [" #A "] failed");        \
  }
// NOLINTNEXTLINE
#define ASSERT_FALSE(A)                                                        \
  if (A) {                                                                     \
    throw test_exception(__FILE__, __LINE__, "Assert ![" #A "] failed");       \
  }
// NOLINTNEXTLINE
#define ASSERT_EQUAL(A, B)                                                     \
  if ((A) != (B)) {                                                            \
    ERROR("{} != {}", A, B);                                                   \
    throw test_exception(__FILE__, __LINE__,                                   \
                         "Assert [" #A " == " #B "] failed");                  \
  }
// NOLINTNEXTLINE
#define ASSERT_NOT_EQUAL(A, B)                                                 \
  if ((A) == (B)) {                                                            \
    ERROR("{} == {}", A, B);                                                   \
    throw test_exception(__FILE__, __LINE__,                                   \
                         "Assert [" #A " != " #B "] failed");                  \
  }
// NOLINTNEXTLINE
#define ASSERT_GT(A, B)                                                        \
  if ((A) <= (B)) {                                                            \
    ERROR("{} <= {}", A, B);                                                   \
    throw test_exception(__FILE__, __LINE__,                                   \
                         "Assert [" #A " > " #B "] failed");                   \
  }
// NOLINTNEXTLINE
#define ASSERT_GTE(A, B)                                                       \
  if ((A) < (B)) {                                                             \
    ERROR("{} < {}", A, B);                                                    \
    throw test_exception(__FILE__, __LINE__,                                   \
                         "Assert [" #A " >= " #B "] failed");                  \
  }
// NOLINTNEXTLINE
#define ASSERT_LT(A, B)                                                        \
  if ((A) >= (B)) {                                                            \
    ERROR("{} >= {}", A, B);                                                   \
    throw test_exception(__FILE__, __LINE__,                                   \
                         "Assert [" #A " < " #B "] failed");                   \
  }
// NOLINTNEXTLINE
#define ASSERT_LTE(A, B)                                                       \
  if ((A) > (B)) {                                                             \
    ERROR("{} > {}", A, B);                                                    \
    throw test_exception(__FILE__, __LINE__,                                   \
                         "Assert [" #A " <= " #B "] failed");                  \
  }
// Runs the statement, which must throw ExceptionType. Logs the message.
// NOLINTNEXTLINE
#define ASSERT_THROWS(STATEMENT, ExceptionType)                                \
  {                                                                            \
    bool thrown = false;                                                       \
    try {                                                                      \
      STATEMENT;                                                               \
    } catch (const ExceptionType &e) {                                         \
      DEBUG("Expected exception: {}", e.what());                               \
      thrown = true;                                                           \
    }                                                                          \
    if (!thrown) {                                                             \
      throw test_exception(__FILE__, __LINE__,                                 \
                           "[" #STATEMENT "] did not throw " #ExceptionType);  \
    }                                                                          \
  }
// NOLINTNEXTLINE
#define FAIL(msg)                                                              \
  { throw test_exception(__FILE__, __LINE__, msg); }
