/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2024-Present The cosmos-cxx-bridge Authors
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */


#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace cosmos
{
/**
 * Routing key of an item: a string, a number or a boolean.
 *
 * @since 1.0.0
 * @committed
 */
class partition_key
{
public:
  using value_type = std::variant<std::string, std::int64_t, double, bool>;

  partition_key(const char* value)
    : value_{ std::string{ value } }
  {
  }

  partition_key(std::string value)
    : value_{ std::move(value) }
  {
  }

  partition_key(std::string_view value)
    : value_{ std::string{ value } }
  {
  }

  partition_key(bool value)
    : value_{ value }
  {
  }

  /**
   * Unsigned values above the range of std::int64_t are stored as floating point numbers, the
   * same way such numbers are decoded from the wire.
   */
  template<typename Integer,
           std::enable_if_t<std::is_integral_v<Integer> && !std::is_same_v<Integer, bool>, int> = 0>
  partition_key(Integer value)
  {
    if constexpr (std::is_unsigned_v<Integer> && sizeof(Integer) >= sizeof(std::int64_t)) {
      if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        value_ = static_cast<double>(value);
        return;
      }
    }
    value_ = static_cast<std::int64_t>(value);
  }

  template<typename Floating, std::enable_if_t<std::is_floating_point_v<Floating>, int> = 0>
  partition_key(Floating value)
    : value_{ static_cast<double>(value) }
  {
  }

  [[nodiscard]] auto value() const -> const value_type&
  {
    return value_;
  }

  /**
   * @return human readable rendering, strings are quoted
   */
  [[nodiscard]] auto to_string() const -> std::string;

  auto operator==(const partition_key& other) const -> bool
  {
    return value_ == other.value_;
  }

  auto operator!=(const partition_key& other) const -> bool
  {
    return value_ != other.value_;
  }

private:
  value_type value_;
};

/**
 * Partition key declaration of a container.
 *
 * @since 1.0.0
 * @committed
 */
struct partition_key_definition {
  /**
   * Paths into the item, for example "/category" or "/address/city". Only the first path is
   * used for routing.
   */
  std::vector<std::string> paths{};
  std::string kind{ "Hash" };
  std::uint32_t version{ 2 };

  partition_key_definition() = default;

  partition_key_definition(std::string path)
    : paths{ std::move(path) }
  {
  }

  partition_key_definition(const char* path)
    : paths{ std::string{ path } }
  {
  }

  auto operator==(const partition_key_definition& other) const -> bool
  {
    return paths == other.paths && kind == other.kind && version == other.version;
  }
};
} // namespace cosmos
