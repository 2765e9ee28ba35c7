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
#include <cosmos/container.hxx>
#include <cosmos/dynamic_value.hxx>
#include <cosmos/item_options.hxx>
#include <cosmos/partition_key.hxx>

#include <memory>
#include <string>
#include <vector>

namespace cosmos
{
#ifndef COSMOS_CXX_BRIDGE_DOXYGEN
class client_impl;
#endif

/**
 * Handle of a database. Cheap to copy, performs no I/O when created.
 *
 * @since 1.0.0
 * @committed
 */
class database
{
public:
  [[nodiscard]] auto id() const -> const std::string&;

  /**
   * @return handle of the container, the container is not checked for existence
   *
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto container(std::string container_id) const -> cosmos::container;

  /**
   * Creates a container.
   *
   * @param container_id id of the new container
   * @param partition_key partition key declaration, for example "/category"
   * @return handle of the created container, its partition key path is already known
   *
   * @throws resource_exists_error if the container exists
   *
   * @since 1.0.0
   * @committed
   */
  auto create_container(std::string container_id,
                        partition_key_definition partition_key,
                        const container_options& options = {}) const -> cosmos::container;

  auto create_container_async(std::string container_id,
                              partition_key_definition partition_key,
                              const container_options& options = {}) const
    -> async_result<cosmos::container>;

  /**
   * @return properties of all containers of the database
   *
   * @since 1.0.0
   * @committed
   */
  auto list_containers(const request_options& options = {}) const -> std::vector<dynamic_value>;

  auto list_containers_async(const request_options& options = {}) const
    -> async_result<std::vector<dynamic_value>>;

  void delete_container(std::string container_id, const request_options& options = {}) const;

  auto delete_container_async(std::string container_id, const request_options& options = {}) const
    -> async_result<void>;

  /**
   * @return database properties
   *
   * @since 1.0.0
   * @committed
   */
  auto read(const request_options& options = {}) const -> dynamic_value;

  auto read_async(const request_options& options = {}) const -> async_result<dynamic_value>;

  /**
   * Deletes this database with all its containers.
   *
   * @since 1.0.0
   * @committed
   */
  void delete_database(const request_options& options = {}) const;

  auto delete_database_async(const request_options& options = {}) const -> async_result<void>;

private:
  friend class client;
  friend class container;

  database(std::shared_ptr<client_impl> client, std::string database_id);

  std::shared_ptr<client_impl> client_;
  std::string id_;
};
} // namespace cosmos
