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


#include "partition_key_resolver.hxx"

#include <cosmos/error_codes.hxx>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <gsl/util>

#include <cstdint>
#include <limits>
#include <utility>

namespace cosmos::core
{
namespace
{
auto
key_from_wire(const tao::json::value& field, std::string_view name)
  -> tl::expected<partition_key, error>
{
  const auto& v = field.skip_value_ptr();
  if (v.is_string_type()) {
    return partition_key{ v.get_string_type() };
  }
  if (v.is_signed()) {
    return partition_key{ v.get_signed() };
  }
  if (v.is_unsigned()) {
    const auto number = v.get_unsigned();
    if (number > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return partition_key{ static_cast<double>(number) };
    }
    return partition_key{ gsl::narrow_cast<std::int64_t>(number) };
  }
  if (v.is_double()) {
    return partition_key{ v.get_double() };
  }
  if (v.is_boolean()) {
    return partition_key{ v.get_boolean() };
  }
  return tl::unexpected(error{
    errc::client::type_mismatch,
    fmt::format(R"(partition key field "{}" must be a string, number or boolean)", name),
  });
}

auto
key_from_option(const dynamic_value& value) -> tl::expected<partition_key, error>
{
  switch (value.type()) {
    case dynamic_value::kind::string:
      return partition_key{ value.as_string() };
    case dynamic_value::kind::integer:
      return partition_key{ value.as_integer() };
    case dynamic_value::kind::floating:
      return partition_key{ value.as_floating() };
    case dynamic_value::kind::boolean:
      return partition_key{ value.as_boolean() };
    default:
      break;
  }
  return tl::unexpected(error{
    errc::client::type_mismatch,
    fmt::format("partition_key option must be a string, number or boolean, got {}",
                to_string(value.type())),
  });
}

auto
unescape_token(std::string_view token) -> std::string
{
  std::string result;
  result.reserve(token.size());
  for (std::size_t i = 0; i < token.size(); ++i) {
    if (token[i] == '~' && i + 1 < token.size()) {
      if (token[i + 1] == '1') {
        result += '/';
        ++i;
        continue;
      }
      if (token[i + 1] == '0') {
        result += '~';
        ++i;
        continue;
      }
    }
    result += token[i];
  }
  return result;
}

/**
 * Follows "/a/b/c" through nested objects.
 *
 * @return nullptr if any segment is missing or not an object
 */
auto
find_path(const tao::json::value& body, std::string_view path) -> const tao::json::value*
{
  const tao::json::value* current = &body.skip_value_ptr();
  while (!path.empty()) {
    if (path.front() == '/') {
      path.remove_prefix(1);
      continue;
    }
    const auto end = path.find('/');
    const auto token = unescape_token(path.substr(0, end));
    path = end == std::string_view::npos ? std::string_view{} : path.substr(end);
    if (!current->is_object()) {
      return nullptr;
    }
    current = current->find(token);
    if (current == nullptr) {
      return nullptr;
    }
    current = &current->skip_value_ptr();
  }
  return current;
}
} // namespace

auto
to_string(key_operation operation) -> std::string_view
{
  switch (operation) {
    case key_operation::create_item:
      return "create_item";
    case key_operation::upsert_item:
      return "upsert_item";
    case key_operation::replace_item:
      return "replace_item";
    case key_operation::read_item:
      return "read_item";
    case key_operation::delete_item:
      return "delete_item";
    case key_operation::query_items:
      return "query_items";
  }
  return "unknown";
}

partition_key_resolver::partition_key_resolver(std::vector<std::string> candidates)
  : candidates_{ std::move(candidates) }
{
}

auto
partition_key_resolver::requires_explicit_key(key_operation operation) -> bool
{
  switch (operation) {
    case key_operation::create_item:
    case key_operation::upsert_item:
    case key_operation::replace_item:
      return false;
    case key_operation::read_item:
    case key_operation::delete_item:
    case key_operation::query_items:
      break;
  }
  return true;
}

auto
partition_key_resolver::explicit_key(const std::optional<partition_key>& typed,
                                     const std::map<std::string, dynamic_value>& options) const
  -> tl::expected<std::optional<partition_key>, error>
{
  if (typed) {
    return typed;
  }
  if (auto it = options.find(std::string{ partition_key_option }); it != options.end()) {
    auto key = key_from_option(it->second);
    if (!key) {
      return tl::unexpected(key.error());
    }
    return std::optional<partition_key>{ std::move(key.value()) };
  }
  return std::optional<partition_key>{};
}

auto
partition_key_resolver::from_body(const tao::json::value& body,
                                  const std::optional<std::string>& declared_path) const
  -> tl::expected<partition_key, error>
{
  if (declared_path) {
    if (const auto* field = find_path(body, declared_path.value()); field != nullptr) {
      return key_from_wire(*field, declared_path.value());
    }
    return tl::unexpected(error{
      errc::client::missing_partition_key,
      fmt::format(R"(item does not contain the partition key path "{}" of the container)",
                  declared_path.value()),
    });
  }

  if (const auto& v = body.skip_value_ptr(); v.is_object()) {
    for (const auto& name : candidates_) {
      if (const auto* field = v.find(name); field != nullptr) {
        return key_from_wire(*field, name);
      }
    }
  }
  return tl::unexpected(error{
    errc::client::missing_partition_key,
    fmt::format("partition key not found in the item, none of the fields [{}] is present, pass "
                "it explicitly",
                fmt::join(candidates_, ", ")),
  });
}

auto
partition_key_resolver::resolve(key_operation operation,
                                const std::optional<partition_key>& typed,
                                const std::map<std::string, dynamic_value>& options,
                                const tao::json::value* body,
                                const std::optional<std::string>& declared_path) const
  -> tl::expected<partition_key, error>
{
  auto explicit_value = explicit_key(typed, options);
  if (!explicit_value) {
    return tl::unexpected(explicit_value.error());
  }
  if (explicit_value.value()) {
    return std::move(explicit_value.value().value());
  }
  if (requires_explicit_key(operation) || body == nullptr) {
    return tl::unexpected(error{
      errc::client::missing_partition_key,
      fmt::format("{} requires an explicit partition key", to_string(operation)),
    });
  }
  return from_body(*body, declared_path);
}
} // namespace cosmos::core
