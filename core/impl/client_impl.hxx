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

#include "core/document_client.hxx"
#include "core/partition_key_resolver.hxx"

#include <cosmos/client_options.hxx>
#include <cosmos/credential.hxx>
#include <cosmos/error.hxx>

#include <tl/expected.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace cosmos
{
class client_impl;

/**
 * What is known about a container: its partition key path, once learned.
 */
class container_cache
{
public:
  [[nodiscard]] auto partition_key_path() const -> std::optional<std::string>
  {
    const std::scoped_lock lock(mutex_);
    return partition_key_path_;
  }

  void partition_key_path(std::optional<std::string> path)
  {
    const std::scoped_lock lock(mutex_);
    partition_key_path_ = std::move(path);
  }

  /**
   * Stores the outcome of reading the container properties. A container without a declared
   * path is remembered as such, so that the properties are not read again.
   */
  void discovered(std::optional<std::string> path)
  {
    const std::scoped_lock lock(mutex_);
    partition_key_path_ = std::move(path);
    discovered_ = true;
  }

  /**
   * @return true if the declared path is known, including "no declared path"
   */
  [[nodiscard]] auto is_resolved() const -> bool
  {
    const std::scoped_lock lock(mutex_);
    return discovered_ || partition_key_path_.has_value();
  }

  void forget()
  {
    const std::scoped_lock lock(mutex_);
    partition_key_path_.reset();
    discovered_ = false;
  }

private:
  mutable std::mutex mutex_{};
  std::optional<std::string> partition_key_path_{};
  bool discovered_{ false };
};

/**
 * State shared by all handles of one container.
 */
class container_state
{
public:
  container_state(std::shared_ptr<client_impl> client,
                  std::string database_id,
                  std::string container_id,
                  std::shared_ptr<container_cache> cache)
    : client_{ std::move(client) }
    , database_id_{ std::move(database_id) }
    , container_id_{ std::move(container_id) }
    , cache_{ std::move(cache) }
  {
  }

  [[nodiscard]] auto client() const -> const std::shared_ptr<client_impl>&
  {
    return client_;
  }

  [[nodiscard]] auto database_id() const -> const std::string&
  {
    return database_id_;
  }

  [[nodiscard]] auto container_id() const -> const std::string&
  {
    return container_id_;
  }

  [[nodiscard]] auto cache() const -> container_cache&
  {
    return *cache_;
  }

private:
  std::shared_ptr<client_impl> client_;
  std::string database_id_;
  std::string container_id_;
  std::shared_ptr<container_cache> cache_;
};

class client_impl : public std::enable_shared_from_this<client_impl>
{
public:
  client_impl(std::string endpoint, cosmos::credential credential, client_options::built options);

  client_impl(const client_impl&) = delete;
  client_impl(client_impl&&) = delete;
  auto operator=(const client_impl&) -> client_impl& = delete;
  auto operator=(client_impl&&) -> client_impl& = delete;
  ~client_impl();

  /**
   * Creates the transport through the configured factory.
   *
   * @throws std::system_error with errc::client::invalid_argument if the factory yields nothing
   */
  void open();

  void close();

  [[nodiscard]] auto is_open() const -> bool;

  [[nodiscard]] auto endpoint() const -> const std::string&
  {
    return endpoint_;
  }

  [[nodiscard]] auto options() const -> const client_options::built&
  {
    return options_;
  }

  [[nodiscard]] auto resolver() const -> const core::partition_key_resolver&
  {
    return resolver_;
  }

  /**
   * @return the transport, or errc::client::client_closed once the client has been closed
   */
  [[nodiscard]] auto transport() const
    -> tl::expected<std::shared_ptr<core::document_client>, error>;

  /**
   * @return cache entry of the container, created on first request
   */
  auto cache_for(const std::string& database_id, const std::string& container_id)
    -> std::shared_ptr<container_cache>;

  /**
   * Drops cached knowledge about a deleted container.
   */
  void forget_container(const std::string& database_id, const std::string& container_id);

  /**
   * Drops cached knowledge about all containers of a deleted database.
   */
  void forget_database(const std::string& database_id);

private:
  std::string endpoint_;
  cosmos::credential credential_;
  client_options::built options_;
  core::partition_key_resolver resolver_;

  mutable std::mutex transport_mutex_{};
  std::shared_ptr<core::document_client> transport_{};

  std::mutex containers_mutex_{};
  std::map<std::pair<std::string, std::string>, std::shared_ptr<container_cache>> containers_{};
};
} // namespace cosmos
