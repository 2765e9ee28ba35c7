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

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#ifndef COSMOS_CXX_BRIDGE_DOXYGEN
namespace asio
{
class io_context;
} // namespace asio
#endif

namespace cosmos
{
#ifndef COSMOS_CXX_BRIDGE_DOXYGEN
namespace core
{
class document_client;
struct connection_config;
} // namespace core
#endif

/**
 * Creates the transport that performs the network I/O for a client.
 *
 * The factory receives the shared runtime of the process, the transport must run its
 * asynchronous work on it and must be safe for concurrent use.
 *
 * @since 1.0.0
 * @committed
 */
using transport_factory = std::function<
  std::shared_ptr<core::document_client>(asio::io_context&, const core::connection_config&)>;

/**
 * Options for @ref client.
 *
 * @since 1.0.0
 * @committed
 */
class client_options
{
public:
  /**
   * Ordered list of body fields inspected when an item is written without an explicit partition
   * key and the declared path of the container is not known. The first field present wins.
   */
  static auto default_partition_key_candidates() -> std::vector<std::string>
  {
    return { "category", "partitionKey", "pk", "type", "tenantId" };
  }

  struct built {
    transport_factory transport;
    std::vector<std::string> partition_key_candidates;
    bool discover_partition_key_path;
    std::string user_agent_suffix;
  };

  [[nodiscard]] auto build() const -> built
  {
    return { transport_, partition_key_candidates_, discover_partition_key_path_, user_agent_suffix_ };
  }

  /**
   * Sets the factory of the transport. Required.
   *
   * @return this options builder for chaining purposes.
   *
   * @since 1.0.0
   * @committed
   */
  auto transport(transport_factory factory) -> client_options&
  {
    transport_ = std::move(factory);
    return *this;
  }

  /**
   * Replaces the list of partition key candidate fields.
   *
   * @since 1.0.0
   * @committed
   */
  auto partition_key_candidates(std::vector<std::string> fields) -> client_options&
  {
    partition_key_candidates_ = std::move(fields);
    return *this;
  }

  /**
   * When enabled, the first write to a container without a known partition key path reads the
   * container properties to learn the declared path. Disabled by default.
   *
   * @since 1.0.0
   * @committed
   */
  auto discover_partition_key_path(bool enable) -> client_options&
  {
    discover_partition_key_path_ = enable;
    return *this;
  }

  /**
   * Appended to the user agent reported by the transport.
   *
   * @since 1.0.0
   * @committed
   */
  auto user_agent_suffix(std::string suffix) -> client_options&
  {
    user_agent_suffix_ = std::move(suffix);
    return *this;
  }

private:
  transport_factory transport_{};
  std::vector<std::string> partition_key_candidates_{ default_partition_key_candidates() };
  bool discover_partition_key_path_{ false };
  std::string user_agent_suffix_{};
};
} // namespace cosmos
