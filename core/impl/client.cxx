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


#include "client_impl.hxx"
#include "error.hxx"
#include "operation_support.hxx"

#include "core/logger/logger.hxx"
#include "core/utils/connection_string.hxx"

#include <cosmos/client.hxx>
#include <cosmos/error_codes.hxx>

#include <fmt/core.h>

#include <system_error>

namespace cosmos
{
namespace
{
auto
plan_create_database(std::shared_ptr<client_impl> client,
                     std::string database_id,
                     const request_options::built& options)
  -> tl::expected<core::operation<dynamic_value>, error>
{
  if (auto err = core::impl::ensure_open(client); err) {
    return tl::unexpected(err);
  }
  auto transport_options = core::impl::to_request_options(options.timeout, options.options);
  if (!transport_options) {
    return tl::unexpected(transport_options.error());
  }
  core::operations::create_database_request request{ std::move(database_id),
                                                      std::move(transport_options.value()) };
  return core::impl::resource_operation(
    std::move(client),
    [request = std::move(request)](core::document_client& transport,
                                   core::operations::resource_callback&& callback) mutable {
      return transport.create_database(std::move(request), std::move(callback));
    });
}

auto
plan_list_databases(std::shared_ptr<client_impl> client, const request_options::built& options)
  -> tl::expected<core::operation<std::vector<dynamic_value>>, error>
{
  if (auto err = core::impl::ensure_open(client); err) {
    return tl::unexpected(err);
  }
  auto transport_options = core::impl::to_request_options(options.timeout, options.options);
  if (!transport_options) {
    return tl::unexpected(transport_options.error());
  }
  return core::impl::paged_operation(
    std::move(client),
    [transport_options = std::move(transport_options.value())](
      core::document_client& transport,
      std::optional<std::string> continuation,
      core::operations::page_callback&& callback) {
      return transport.query_databases({ std::move(continuation), transport_options },
                                       std::move(callback));
    });
}

} // namespace

client::client(std::string endpoint, cosmos::credential credential, const client_options& options)
{
  if (endpoint.empty()) {
    throw std::system_error(errc::client::invalid_argument, "endpoint must not be empty");
  }
  if (!credential.valid()) {
    throw std::system_error(errc::client::invalid_argument, "credential must carry a secret");
  }
  auto built = options.build();
  if (!built.transport) {
    throw std::system_error(errc::client::invalid_argument, "transport factory is not configured");
  }
  impl_ = std::make_shared<client_impl>(std::move(endpoint), std::move(credential), std::move(built));
  impl_->open();
}

auto
client::from_connection_string(const std::string& connection_string, client_options options)
  -> client
{
  auto parsed = core::utils::parse_connection_string(connection_string);
  for (const auto& warning : parsed.warnings) {
    CS_LOG_WARNING("connection string: {}", warning);
  }
  if (parsed.error) {
    throw std::system_error(errc::client::invalid_argument,
                            fmt::format("unable to parse connection string: {}", parsed.error.value()));
  }
  if (parsed.partition_key_candidates) {
    options.partition_key_candidates(parsed.partition_key_candidates.value());
  }
  if (parsed.discover_partition_key_path) {
    options.discover_partition_key_path(parsed.discover_partition_key_path.value());
  }
  if (parsed.user_agent_suffix) {
    options.user_agent_suffix(parsed.user_agent_suffix.value());
  }
  return { parsed.endpoint, credential::from_key(parsed.account_key), options };
}

client::client(client&& other) noexcept = default;

auto
client::operator=(client&& other) noexcept -> client&
{
  if (this != &other) {
    close();
    impl_ = std::move(other.impl_);
  }
  return *this;
}

client::~client()
{
  close();
}

auto
client::endpoint() const -> const std::string&
{
  static const std::string empty{};
  if (!impl_) {
    return empty;
  }
  return impl_->endpoint();
}

auto
client::is_open() const -> bool
{
  return impl_ && impl_->is_open();
}

void
client::close()
{
  if (impl_) {
    impl_->close();
  }
}

auto
client::database(std::string database_id) const -> cosmos::database
{
  return { impl_, std::move(database_id) };
}

auto
client::create_database(std::string database_id, const request_options& options) const
  -> dynamic_value
{
  return core::impl::execute_blocking(
    plan_create_database(impl_, std::move(database_id), options.build()));
}

auto
client::create_database_async(std::string database_id, const request_options& options) const
  -> async_result<dynamic_value>
{
  return core::impl::execute_async(
    plan_create_database(impl_, std::move(database_id), options.build()));
}

auto
client::list_databases(const request_options& options) const -> std::vector<dynamic_value>
{
  return core::impl::execute_blocking(plan_list_databases(impl_, options.build()));
}

auto
client::list_databases_async(const request_options& options) const
  -> async_result<std::vector<dynamic_value>>
{
  return core::impl::execute_async(plan_list_databases(impl_, options.build()));
}

void
client::delete_database(std::string database_id, const request_options& options) const
{
  database(std::move(database_id)).delete_database(options);
}

auto
client::delete_database_async(std::string database_id, const request_options& options) const
  -> async_result<void>
{
  return database(std::move(database_id)).delete_database_async(options);
}
} // namespace cosmos
