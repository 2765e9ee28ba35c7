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

#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace cosmos
{
/**
 * Dynamically typed value graph handed over by the application.
 *
 * This is the caller-side representation of items, query parameters and results. Mappings,
 * sequences, strings, numbers, booleans and null have a JSON representation. Binary blobs and
 * opaque host objects can be stored, but cannot be sent to the service.
 *
 * A top-level string passed as an item body is treated as pre-serialized JSON text.
 *
 * @since 1.0.0
 * @committed
 */
class dynamic_value
{
public:
  enum class kind {
    null,
    boolean,
    integer,
    floating,
    string,
    binary,
    sequence,
    mapping,
    opaque,
  };

  /**
   * Foreign host object, known only by the name of its type.
   */
  struct opaque_type {
    std::string type_name;

    auto operator==(const opaque_type& other) const -> bool
    {
      return type_name == other.type_name;
    }
  };

  using binary_type = std::vector<std::byte>;
  using sequence_type = std::vector<dynamic_value>;
  using mapping_type = std::map<std::string, dynamic_value>;

  dynamic_value() = default;

  dynamic_value(std::nullptr_t)
  {
  }

  dynamic_value(bool value)
    : value_{ value }
  {
  }

  /**
   * Unsigned values above the range of std::int64_t are stored as floating point numbers, the
   * same way such numbers are decoded from the wire.
   */
  template<typename Integer,
           std::enable_if_t<std::is_integral_v<Integer> && !std::is_same_v<Integer, bool>, int> = 0>
  dynamic_value(Integer value)
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
  dynamic_value(Floating value)
    : value_{ static_cast<double>(value) }
  {
  }

  dynamic_value(const char* value)
    : value_{ std::string{ value } }
  {
  }

  dynamic_value(std::string value)
    : value_{ std::move(value) }
  {
  }

  dynamic_value(std::string_view value)
    : value_{ std::string{ value } }
  {
  }

  dynamic_value(binary_type value)
    : value_{ std::move(value) }
  {
  }

  dynamic_value(sequence_type value)
    : value_{ std::move(value) }
  {
  }

  dynamic_value(mapping_type value)
    : value_{ std::move(value) }
  {
  }

  dynamic_value(opaque_type value)
    : value_{ std::move(value) }
  {
  }

  [[nodiscard]] auto type() const -> kind;

  [[nodiscard]] auto is_null() const -> bool
  {
    return std::holds_alternative<std::monostate>(value_);
  }

  [[nodiscard]] auto is_string() const -> bool
  {
    return std::holds_alternative<std::string>(value_);
  }

  [[nodiscard]] auto is_mapping() const -> bool
  {
    return std::holds_alternative<mapping_type>(value_);
  }

  [[nodiscard]] auto is_sequence() const -> bool
  {
    return std::holds_alternative<sequence_type>(value_);
  }

  /**
   * @throws std::bad_variant_access if the value holds another kind
   */
  [[nodiscard]] auto as_boolean() const -> bool
  {
    return std::get<bool>(value_);
  }

  [[nodiscard]] auto as_integer() const -> std::int64_t
  {
    return std::get<std::int64_t>(value_);
  }

  [[nodiscard]] auto as_floating() const -> double
  {
    return std::get<double>(value_);
  }

  [[nodiscard]] auto as_string() const -> const std::string&
  {
    return std::get<std::string>(value_);
  }

  [[nodiscard]] auto as_binary() const -> const binary_type&
  {
    return std::get<binary_type>(value_);
  }

  [[nodiscard]] auto as_sequence() const -> const sequence_type&
  {
    return std::get<sequence_type>(value_);
  }

  [[nodiscard]] auto as_mapping() const -> const mapping_type&
  {
    return std::get<mapping_type>(value_);
  }

  [[nodiscard]] auto as_opaque() const -> const opaque_type&
  {
    return std::get<opaque_type>(value_);
  }

  /**
   * Looks up a member of a mapping.
   *
   * @return pointer to the member, or nullptr if the value is not a mapping or has no such key
   */
  [[nodiscard]] auto find(std::string_view key) const -> const dynamic_value*;

  /**
   * @throws std::out_of_range if the value is not a mapping or has no such key
   */
  [[nodiscard]] auto at(std::string_view key) const -> const dynamic_value&;

  template<typename Visitor>
  auto visit(Visitor&& visitor) const
  {
    return std::visit(std::forward<Visitor>(visitor), value_);
  }

  friend auto operator==(const dynamic_value& lhs, const dynamic_value& rhs) -> bool
  {
    return lhs.value_ == rhs.value_;
  }

  friend auto operator!=(const dynamic_value& lhs, const dynamic_value& rhs) -> bool
  {
    return !(lhs == rhs);
  }

private:
  std::variant<std::monostate,
               bool,
               std::int64_t,
               double,
               std::string,
               binary_type,
               sequence_type,
               mapping_type,
               opaque_type>
    value_{};
};

auto
to_string(dynamic_value::kind kind) -> std::string_view;
} // namespace cosmos
