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
#include <cosmos/client_options.hxx>
#include <cosmos/common_options.hxx>
#include <cosmos/container.hxx>
#include <cosmos/credential.hxx>
#include <cosmos/database.hxx>
#include <cosmos/dynamic_value.hxx>

#include <memory>
#include <string>
#include <vector>

namespace cosmos
{
#ifndef COSMOS_CXX_BRIDGE_DOXYGEN
class client_impl;
#endif

/**
 * The {@link client} is the main entry point when talking to a database account.
 *
 * It owns the connection. @ref database and @ref container handles obtained from it share that
 * connection and become unusable (@ref client_closed_error) once the client is closed or
 * destroyed.
 *
 * @since 1.0.0
 * @committed
 */
class client
{
public:
  /**
   * Creates the client and its transport.
   *
   * @param endpoint account endpoint, for example "https://example.documents.azure.com:443/"
   * @param credential account credential
   * @param options client options, the transport factory is required
   *
   * @throws std::system_error with errc::client::invalid_argument if the endpoint is empty, the
   * credential carries no secret, or no transport is configured
   *
   * @since 1.0.0
   * @committed
   */
  client(std::string endpoint, cosmos::credential credential, const client_options& options);

  /**
   * Creates the client from an account connection string.
   *
   * Settings found in the connection string override the corresponding options.
   *
   * @throws std::system_error with errc::client::invalid_argument if the connection string is
   * malformed or lacks the endpoint or the key
   *
   * @since 1.0.0
   * @committed
   */
  static auto from_connection_string(const std::string& connection_string,
                                     client_options options) -> client;

  client(const client&) = delete;
  auto operator=(const client&) -> client& = delete;
  client(client&& other) noexcept;
  auto operator=(client&& other) noexcept -> client&;

  /**
   * Closes the client.
   */
  ~client();

  [[nodiscard]] auto endpoint() const -> const std::string&;

  [[nodiscard]] auto is_open() const -> bool;

  /**
   * Releases the transport. Idempotent. Operations issued afterwards through this client or any
   * handle obtained from it fail with @ref client_closed_error without contacting the service.
   *
   * @since 1.0.0
   * @committed
   */
  void close();

  /**
   * @return handle of the database, the database is not checked for existence
   *
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto database(std::string database_id) const -> cosmos::database;

  /**
   * Creates a database.
   *
   * @return database properties as returned by the service
   *
   * @throws resource_exists_error if the database exists
   *
   * @since 1.0.0
   * @committed
   */
  auto create_database(std::string database_id, const request_options& options = {}) const
    -> dynamic_value;

  auto create_database_async(std::string database_id, const request_options& options = {}) const
    -> async_result<dynamic_value>;

  /**
   * @return properties of all databases of the account
   *
   * @since 1.0.0
   * @committed
   */
  auto list_databases(const request_options& options = {}) const -> std::vector<dynamic_value>;

  auto list_databases_async(const request_options& options = {}) const
    -> async_result<std::vector<dynamic_value>>;

  /**
   * @throws resource_not_found_error if the database does not exist
   *
   * @since 1.0.0
   * @committed
   */
  void delete_database(std::string database_id, const request_options& options = {}) const;

  auto delete_database_async(std::string database_id, const request_options& options = {}) const
    -> async_result<void>;

private:
  std::shared_ptr<client_impl> impl_;
};
} // namespace cosmos
