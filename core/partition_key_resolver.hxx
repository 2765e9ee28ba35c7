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

#include <cosmos/dynamic_value.hxx>
#include <cosmos/error.hxx>
#include <cosmos/partition_key.hxx>

#include <tao/json/value.hpp>
#include <tl/expected.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cosmos::core
{
enum class key_operation {
  create_item,
  upsert_item,
  replace_item,
  read_item,
  delete_item,
  query_items,
};

auto
to_string(key_operation operation) -> std::string_view;

/**
 * Name of the generic per-call option that carries the partition key.
 */
constexpr std::string_view partition_key_option{ "partition_key" };

/**
 * Determines the routing key of item operations.
 *
 * Precedence: the typed explicit value, then the "partition_key" option, then (writes only) the
 * declared path of the container, then the first candidate field present in the body. Read,
 * delete and query never look into a body.
 */
class partition_key_resolver
{
public:
  explicit partition_key_resolver(std::vector<std::string> candidates);

  [[nodiscard]] auto candidates() const -> const std::vector<std::string>&
  {
    return candidates_;
  }

  /**
   * @return the explicit key if the caller supplied one, or an empty optional
   */
  [[nodiscard]] auto explicit_key(const std::optional<partition_key>& typed,
                                  const std::map<std::string, dynamic_value>& options) const
    -> tl::expected<std::optional<partition_key>, error>;

  /**
   * Extracts the key from an encoded item body.
   *
   * @param declared_path path like "/category" or "/address/city", when known the candidate list
   * is not consulted
   */
  [[nodiscard]] auto from_body(const tao::json::value& body,
                               const std::optional<std::string>& declared_path) const
    -> tl::expected<partition_key, error>;

  [[nodiscard]] auto resolve(key_operation operation,
                             const std::optional<partition_key>& typed,
                             const std::map<std::string, dynamic_value>& options,
                             const tao::json::value* body,
                             const std::optional<std::string>& declared_path) const
    -> tl::expected<partition_key, error>;

  [[nodiscard]] static auto requires_explicit_key(key_operation operation) -> bool;

private:
  std::vector<std::string> candidates_;
};
} // namespace cosmos::core
