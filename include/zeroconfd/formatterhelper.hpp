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

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#ifdef USE_LIBFMT
#define FMT fmt
#include <fmt/core.h>
#else
#define FMT std
#include <format>
#endif

#define BASIC_FORMATTER(T, FORMAT, ...)                                        \
  template <> struct FMT::formatter<T> {                                       \
    constexpr auto parse(FMT::format_parse_context &ctx) {                     \
      return ctx.begin();                                                      \
    }                                                                          \
    auto format(const T &v, FMT::format_context &ctx) const {                  \
      return FMT::format_to(ctx.out(), FORMAT, __VA_ARGS__);                   \
    }                                                                          \
  }

#define ENUM_FORMATTER_BEGIN(EnumType)                                         \
  template <> struct FMT::formatter<EnumType> {                                \
    constexpr auto parse(FMT::format_parse_context &ctx) {                     \
      return ctx.begin();                                                      \
    }                                                                          \
    auto format(const EnumType &v, FMT::format_context &ctx) const {           \
      switch (v) {

#define ENUM_FORMATTER_ELEMENT(EnumValue, Str)                                 \
  case EnumValue:                                                              \
    return FMT::format_to(ctx.out(), Str);

#define ENUM_FORMATTER_END()                                                   \
  }                                                                            \
  return FMT::format_to(ctx.out(), "Unknown");                                 \
  }                                                                            \
  }

#define VECTOR_FORMATTER(T)                                                    \
  template <> struct FMT::formatter<std::vector<T>> {                          \
    constexpr auto parse(FMT::format_parse_context &ctx) {                     \
      return ctx.begin();                                                      \
    }                                                                          \
    auto format(const std::vector<T> &v, FMT::format_context &ctx) const {     \
      auto it = ::FMT::format_to(ctx.out(), "[");                              \
      for (auto &item : v) {                                                   \
        it = ::FMT::format_to(it, "{}", item);                                 \
        if (&item != &v.back()) {                                              \
          it = ::FMT::format_to(it, ", ");                                     \
        }                                                                      \
      }                                                                        \
      return ::FMT::format_to(it, "]");                                        \
    }                                                                          \
  }

// key=value pairs, as TXT records are written
#define MAP_FORMATTER(K, V)                                                    \
  template <> struct FMT::formatter<std::map<K, V>> {                          \
    constexpr auto parse(FMT::format_parse_context &ctx) {                     \
      return ctx.begin();                                                      \
    }                                                                          \
    auto format(const std::map<K, V> &v, FMT::format_context &ctx) const {     \
      auto it = ::FMT::format_to(ctx.out(), "{{");                             \
      bool first = true;                                                       \
      for (auto &item : v) {                                                   \
        if (!first) {                                                          \
          it = ::FMT::format_to(it, ", ");                                     \
        }                                                                      \
        first = false;                                                         \
        it = ::FMT::format_to(it, "{}={}", item.first, item.second);           \
      }                                                                        \
      return ::FMT::format_to(it, "}}");                                       \
    }                                                                          \
  }
