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

#include <cosmos/async_result.hxx>
#include <cosmos/common_options.hxx>
#include <cosmos/dynamic_value.hxx>
#include <cosmos/item_options.hxx>
#include <cosmos/partition_key.hxx>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cosmos
{
#ifndef COSMOS_CXX_BRIDGE_DOXYGEN
class client_impl;
class container_state;
#endif

/**
 * Handle of a container. Cheap to copy, performs no I/O when created.
 *
 * All copies share the connection of the @ref client they descend from, and the cached partition
 * key path of the container.
 *
 * @since 1.0.0
 * @committed
 */
class container
{
public:
  [[nodiscard]] auto id() const -> const std::string&;
  [[nodiscard]] auto database_id() const -> const std::string&;

  /**
   * Creates an item.
   *
   * @param body mapping (or sequence) of the item, or its JSON text
   * @param options partition key and per-call options, the partition key is looked up in the
   * body when not given
   * @return the stored item as returned by the service
   *
   * @throws invalid_payload_error if the text is not JSON, the item is not an object or contains
   * a value without JSON representation
   * @throws type_mismatch_error if the body is neither text nor a mapping/sequence
   * @throws missing_partition_key_error if no partition key can be resolved
   * @throws resource_exists_error if an item with the same id exists in the partition
   * @throws http_response_error, transport_error, client_closed_error
   *
   * @since 1.0.0
   * @committed
   */
  auto create_item(const dynamic_value& body, const item_options& options = {}) const
    -> dynamic_value;

  auto create_item_async(const dynamic_value& body, const item_options& options = {}) const
    -> async_result<dynamic_value>;

  /**
   * Reads an item. The partition key is required.
   *
   * @throws missing_partition_key_error if options do not carry a partition key
   * @throws resource_not_found_error if the item does not exist
   *
   * @since 1.0.0
   * @committed
   */
  auto read_item(std::string item_id, const item_options& options) const -> dynamic_value;

  auto read_item_async(std::string item_id, const item_options& options) const
    -> async_result<dynamic_value>;

  /**
   * Creates the item or replaces the existing one with the same id.
   *
   * @since 1.0.0
   * @committed
   */
  auto upsert_item(const dynamic_value& body, const item_options& options = {}) const
    -> dynamic_value;

  auto upsert_item_async(const dynamic_value& body, const item_options& options = {}) const
    -> async_result<dynamic_value>;

  /**
   * Replaces an existing item. Without an explicit partition key it is resolved from the body,
   * like for writes.
   *
   * @throws resource_not_found_error if the item does not exist
   * @throws precondition_failed_error if if_match was given and the ETag differs
   *
   * @since 1.0.0
   * @committed
   */
  auto replace_item(std::string item_id,
                    const dynamic_value& body,
                    const item_options& options = {}) const -> dynamic_value;

  auto replace_item_async(std::string item_id,
                          const dynamic_value& body,
                          const item_options& options = {}) const -> async_result<dynamic_value>;

  /**
   * Deletes an item. The partition key is required.
   *
   * @since 1.0.0
   * @committed
   */
  void delete_item(std::string item_id, const item_options& options) const;

  auto delete_item_async(std::string item_id, const item_options& options) const
    -> async_result<void>;

  /**
   * Runs a query in a single partition and returns the items of all result pages.
   *
   * @throws missing_partition_key_error if options do not carry a partition key
   *
   * @since 1.0.0
   * @committed
   */
  auto query_items(std::string query, const query_options& options) const
    -> std::vector<dynamic_value>;

  auto query_items_async(std::string query, const query_options& options) const
    -> async_result<std::vector<dynamic_value>>;

  /**
   * Reads the container properties and remembers its partition key path.
   *
   * @since 1.0.0
   * @committed
   */
  auto read(const request_options& options = {}) const -> dynamic_value;

  auto read_async(const request_options& options = {}) const -> async_result<dynamic_value>;

  /**
   * Deletes this container.
   *
   * @since 1.0.0
   * @committed
   */
  void delete_container(const request_options& options = {}) const;

  auto delete_container_async(const request_options& options = {}) const -> async_result<void>;

  /**
   * @return partition key path known for this container, no I/O is performed
   *
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto partition_key_path() const -> std::optional<std::string>;

private:
  friend class database;

  explicit container(std::shared_ptr<container_state> state);

  std::shared_ptr<container_state> state_;
};
} // namespace cosmos
