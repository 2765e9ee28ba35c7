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

#include <cosmos/common_options.hxx>
#include <cosmos/dynamic_value.hxx>
#include <cosmos/partition_key.hxx>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cosmos
{
/**
 * Options for the item operations of @ref container.
 *
 * @since 1.0.0
 * @committed
 */
struct item_options : public common_options<item_options> {
  /**
   * Immutable value object representing consistent options.
   *
   * @since 1.0.0
   * @internal
   */
  struct built : public common_options<item_options>::built {
    const std::optional<cosmos::partition_key> partition_key;
    const std::optional<std::string> if_match;
  };

  /**
   * Validates options and returns them as an immutable value.
   *
   * @return consistent options as an immutable value
   *
   * @since 1.0.0
   * @internal
   */
  [[nodiscard]] auto build() const -> built
  {
    return { build_common_options(), partition_key_, if_match_ };
  }

  /**
   * Sets the partition key explicitly. Takes precedence over the "partition_key" option and over
   * any value found in the item body.
   *
   * @param value the partition key
   * @return this options builder for chaining purposes.
   *
   * @since 1.0.0
   * @committed
   */
  auto partition_key(cosmos::partition_key value) -> item_options&
  {
    partition_key_ = std::move(value);
    return self();
  }

  /**
   * Makes the write conditional on the current ETag of the item.
   *
   * A mismatch is reported as @ref precondition_failed_error.
   *
   * @param etag the expected ETag
   * @return this options builder for chaining purposes.
   *
   * @since 1.0.0
   * @committed
   */
  auto if_match(std::string etag) -> item_options&
  {
    if_match_ = std::move(etag);
    return self();
  }

private:
  std::optional<cosmos::partition_key> partition_key_{};
  std::optional<std::string> if_match_{};
};

/**
 * Options for @ref container#query_items().
 *
 * @since 1.0.0
 * @committed
 */
struct query_options : public common_options<query_options> {
  struct built : public common_options<query_options>::built {
    const std::optional<cosmos::partition_key> partition_key;
    const std::vector<std::pair<std::string, dynamic_value>> parameters;
    const std::optional<std::uint32_t> max_item_count;
  };

  [[nodiscard]] auto build() const -> built
  {
    return { build_common_options(), partition_key_, parameters_, max_item_count_ };
  }

  /**
   * Sets the partition the query runs against. Required, queries never fan out across partitions.
   *
   * @since 1.0.0
   * @committed
   */
  auto partition_key(cosmos::partition_key value) -> query_options&
  {
    partition_key_ = std::move(value);
    return self();
  }

  /**
   * Binds a named parameter of the query text.
   *
   * @param name parameter name including the leading "@"
   * @param value parameter value, must have a JSON representation
   * @return this options builder for chaining purposes.
   *
   * @since 1.0.0
   * @committed
   */
  auto parameter(std::string name, dynamic_value value) -> query_options&
  {
    parameters_.emplace_back(std::move(name), std::move(value));
    return self();
  }

  /**
   * Limits the number of items per result page. All pages are still fetched.
   *
   * @since 1.0.0
   * @committed
   */
  auto max_item_count(std::uint32_t count) -> query_options&
  {
    max_item_count_ = count;
    return self();
  }

private:
  std::optional<cosmos::partition_key> partition_key_{};
  std::vector<std::pair<std::string, dynamic_value>> parameters_{};
  std::optional<std::uint32_t> max_item_count_{};
};

/**
 * Options for @ref database#create_container().
 *
 * @since 1.0.0
 * @committed
 */
struct container_options : public common_options<container_options> {
  struct built : public common_options<container_options>::built {
    const std::optional<std::int32_t> default_ttl;
    const std::optional<std::uint32_t> throughput;
  };

  [[nodiscard]] auto build() const -> built
  {
    return { build_common_options(), default_ttl_, throughput_ };
  }

  /**
   * Default time to live of the items in seconds, -1 enables TTL without a default.
   */
  auto default_ttl(std::int32_t seconds) -> container_options&
  {
    default_ttl_ = seconds;
    return self();
  }

  /**
   * Provisioned throughput in request units per second.
   */
  auto throughput(std::uint32_t request_units) -> container_options&
  {
    throughput_ = request_units;
    return self();
  }

private:
  std::optional<std::int32_t> default_ttl_{};
  std::optional<std::uint32_t> throughput_{};
};
} // namespace cosmos
