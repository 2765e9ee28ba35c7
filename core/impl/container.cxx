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
#include "operation_support.hxx"

#include "core/logger/logger.hxx"
#include "core/partition_key_resolver.hxx"

#include <cosmos/container.hxx>
#include <cosmos/database.hxx>
#include <cosmos/error_codes.hxx>

#include <fmt/core.h>

namespace cosmos
{
namespace
{
/**
 * @return first path of the partition key declared in container properties
 */
auto
declared_partition_key_path(const tao::json::value& properties) -> std::optional<std::string>
{
  if (!properties.is_object()) {
    return {};
  }
  const auto* partition_key = properties.find("partitionKey");
  if (partition_key == nullptr || !partition_key->is_object()) {
    return {};
  }
  const auto* paths = partition_key->find("paths");
  if (paths == nullptr || !paths->is_array() || paths->get_array().empty() ||
      !paths->get_array().front().is_string()) {
    return {};
  }
  return paths->get_array().front().get_string();
}

auto
send_write(core::document_client& transport,
           core::key_operation operation,
           core::operations::write_item_request request,
           core::operations::resource_callback&& callback) -> core::document_client::result
{
  if (operation == core::key_operation::create_item) {
    return transport.create_item(std::move(request), std::move(callback));
  }
  if (operation == core::key_operation::replace_item) {
    return transport.replace_item(std::move(request), std::move(callback));
  }
  return transport.upsert_item(std::move(request), std::move(callback));
}

auto
require_item_id(const std::string& item_id) -> error
{
  if (item_id.empty()) {
    return { errc::client::invalid_argument, "item id must not be empty" };
  }
  return {};
}

auto
plan_write(std::shared_ptr<container_state> state,
           core::key_operation operation,
           std::optional<std::string> item_id,
           const dynamic_value& body,
           const item_options::built& options) -> tl::expected<core::operation<dynamic_value>, error>
{
  const auto& client = state->client();
  if (auto err = core::impl::ensure_open(client); err) {
    return tl::unexpected(err);
  }
  if (item_id) {
    if (auto err = require_item_id(item_id.value()); err) {
      return tl::unexpected(err);
    }
  }
  auto explicit_key = client->resolver().explicit_key(options.partition_key, options.options);
  if (!explicit_key) {
    return tl::unexpected(explicit_key.error());
  }
  auto encoded = core::encode_item(body);
  if (!encoded) {
    return tl::unexpected(encoded.error());
  }
  auto transport_options = core::impl::to_request_options(options.timeout, options.options);
  if (!transport_options) {
    return tl::unexpected(transport_options.error());
  }

  const auto path_resolved = state->cache().is_resolved();
  auto declared_path = state->cache().partition_key_path();
  if (explicit_key.value() || path_resolved || !client->options().discover_partition_key_path) {
    auto key = client->resolver().resolve(
      operation, explicit_key.value(), options.options, &encoded.value(), declared_path);
    if (!key) {
      return tl::unexpected(key.error());
    }
    CS_LOG_TRACE(R"({} "{}/{}" with partition key {})",
                 core::to_string(operation),
                 state->database_id(),
                 state->container_id(),
                 key->to_string());
    core::operations::write_item_request request{
      state->database_id(), state->container_id(),
      std::move(item_id),   std::move(key.value()),
      std::move(encoded.value()), options.if_match,
      std::move(transport_options.value()),
    };
    return core::impl::resource_operation(
      client,
      [operation, request = std::move(request)](
        core::document_client& transport, core::operations::resource_callback&& callback) mutable {
        return send_write(transport, operation, std::move(request), std::move(callback));
      });
  }

  // The declared path is learned from the container properties before the item is sent.
  return [state = std::move(state),
          operation,
          item_id = std::move(item_id),
          body = std::move(encoded.value()),
          if_match = options.if_match,
          user_options = options.options,
          transport_options = std::move(transport_options.value())](
           core::completion_handler<dynamic_value> handler) -> std::shared_ptr<core::pending_operation> {
    auto chain = std::make_shared<core::chained_operation>();
    const auto& client = state->client();
    auto pending = core::impl::issue<tao::json::value>(
      client,
      [state, transport_options](core::document_client& transport,
                                 core::operations::resource_callback&& callback) {
        return transport.read_container(
          { state->database_id(), state->container_id(), transport_options }, std::move(callback));
      },
      [state, chain, operation, item_id, body, if_match, user_options, transport_options, handler](
        tl::expected<tao::json::value, error> properties) {
        if (!properties) {
          return handler(tl::unexpected(properties.error()));
        }
        auto path = declared_partition_key_path(properties.value());
        CS_LOG_DEBUG(R"(learned partition key path of "{}/{}": {})",
                     state->database_id(),
                     state->container_id(),
                     path.value_or("<none>"));
        state->cache().discovered(path);
        const auto& client = state->client();
        auto key = client->resolver().resolve(operation, std::nullopt, user_options, &body, path);
        if (!key) {
          return handler(tl::unexpected(key.error()));
        }
        if (chain->is_canceled()) {
          return handler(tl::unexpected(error{ errc::client::request_canceled, "operation canceled" }));
        }
        core::operations::write_item_request request{
          state->database_id(), state->container_id(), item_id,         std::move(key.value()),
          body,                 if_match,              transport_options,
        };
        chain->replace(core::impl::issue<tao::json::value>(
          client,
          [operation, request = std::move(request)](
            core::document_client& transport, core::operations::resource_callback&& callback) mutable {
            return send_write(transport, operation, std::move(request), std::move(callback));
          },
          core::impl::decoding(handler)));
      });
    chain->replace(std::move(pending));
    return chain;
  };
}

auto
plan_read_item(std::shared_ptr<container_state> state,
               std::string item_id,
               const item_options::built& options)
  -> tl::expected<core::operation<dynamic_value>, error>
{
  const auto& client = state->client();
  if (auto err = core::impl::ensure_open(client); err) {
    return tl::unexpected(err);
  }
  if (auto err = require_item_id(item_id); err) {
    return tl::unexpected(err);
  }
  auto key = client->resolver().resolve(
    core::key_operation::read_item, options.partition_key, options.options, nullptr, std::nullopt);
  if (!key) {
    return tl::unexpected(key.error());
  }
  auto transport_options = core::impl::to_request_options(options.timeout, options.options);
  if (!transport_options) {
    return tl::unexpected(transport_options.error());
  }
  core::operations::read_item_request request{
    state->database_id(), state->container_id(),          std::move(item_id),
    std::move(key.value()), std::move(transport_options.value()),
  };
  return core::impl::resource_operation(
    client,
    [request = std::move(request)](core::document_client& transport,
                                   core::operations::resource_callback&& callback) mutable {
      return transport.read_item(std::move(request), std::move(callback));
    });
}

auto
plan_delete_item(std::shared_ptr<container_state> state,
                 std::string item_id,
                 const item_options::built& options)
  -> tl::expected<core::operation<std::monostate>, error>
{
  const auto& client = state->client();
  if (auto err = core::impl::ensure_open(client); err) {
    return tl::unexpected(err);
  }
  if (auto err = require_item_id(item_id); err) {
    return tl::unexpected(err);
  }
  auto key = client->resolver().resolve(
    core::key_operation::delete_item, options.partition_key, options.options, nullptr, std::nullopt);
  if (!key) {
    return tl::unexpected(key.error());
  }
  auto transport_options = core::impl::to_request_options(options.timeout, options.options);
  if (!transport_options) {
    return tl::unexpected(transport_options.error());
  }
  core::operations::delete_item_request request{
    state->database_id(), state->container_id(), std::move(item_id),
    std::move(key.value()), options.if_match,    std::move(transport_options.value()),
  };
  return [client, request = std::move(request)](
           core::completion_handler<std::monostate> handler) mutable {
    return core::impl::issue<std::monostate>(
      client,
      [request = std::move(request)](core::document_client& transport,
                                     core::operations::delete_callback&& callback) mutable {
        return transport.delete_item(std::move(request), std::move(callback));
      },
      std::move(handler));
  };
}

auto
plan_query_items(std::shared_ptr<container_state> state,
                 std::string query,
                 const query_options::built& options)
  -> tl::expected<core::operation<std::vector<dynamic_value>>, error>
{
  const auto& client = state->client();
  if (auto err = core::impl::ensure_open(client); err) {
    return tl::unexpected(err);
  }
  auto key = client->resolver().resolve(
    core::key_operation::query_items, options.partition_key, options.options, nullptr, std::nullopt);
  if (!key) {
    return tl::unexpected(key.error());
  }
  std::vector<std::pair<std::string, tao::json::value>> parameters{};
  parameters.reserve(options.parameters.size());
  for (const auto& [name, value] : options.parameters) {
    auto encoded = core::encode_value(value);
    if (!encoded) {
      return tl::unexpected(error{
        encoded.error().ec(),
        fmt::format(R"(query parameter "{}": {})", name, encoded.error().message()),
      });
    }
    parameters.emplace_back(name, std::move(encoded.value()));
  }
  auto transport_options = core::impl::to_request_options(options.timeout, options.options);
  if (!transport_options) {
    return tl::unexpected(transport_options.error());
  }
  core::operations::query_items_request request{
    state->database_id(),
    state->container_id(),
    std::move(query),
    std::move(parameters),
    std::move(key.value()),
    options.max_item_count,
    std::nullopt,
    std::move(transport_options.value()),
  };
  return core::impl::paged_operation(
    client,
    [request = std::move(request)](core::document_client& transport,
                                   std::optional<std::string> continuation,
                                   core::operations::page_callback&& callback) {
      auto page_request = request;
      page_request.continuation = std::move(continuation);
      return transport.query_items(std::move(page_request), std::move(callback));
    });
}

auto
plan_read_container(std::shared_ptr<container_state> state, const request_options::built& options)
  -> tl::expected<core::operation<dynamic_value>, error>
{
  if (auto err = core::impl::ensure_open(state->client()); err) {
    return tl::unexpected(err);
  }
  auto transport_options = core::impl::to_request_options(options.timeout, options.options);
  if (!transport_options) {
    return tl::unexpected(transport_options.error());
  }
  core::operations::read_container_request request{
    state->database_id(),
    state->container_id(),
    std::move(transport_options.value()),
  };
  return [state = std::move(state), request = std::move(request)](
           core::completion_handler<dynamic_value> handler) mutable {
    return core::impl::issue<tao::json::value>(
      state->client(),
      [request = std::move(request)](core::document_client& transport,
                                     core::operations::resource_callback&& callback) mutable {
        return transport.read_container(std::move(request), std::move(callback));
      },
      [state, handler = std::move(handler)](tl::expected<tao::json::value, error> resp) {
        if (!resp) {
          return handler(tl::unexpected(resp.error()));
        }
        state->cache().discovered(declared_partition_key_path(resp.value()));
        return handler(core::decode(resp.value()));
      });
  };
}
} // namespace

container::container(std::shared_ptr<container_state> state)
  : state_{ std::move(state) }
{
}

auto
container::id() const -> const std::string&
{
  return state_->container_id();
}

auto
container::database_id() const -> const std::string&
{
  return state_->database_id();
}

auto
container::create_item(const dynamic_value& body, const item_options& options) const
  -> dynamic_value
{
  return core::impl::execute_blocking(
    plan_write(state_, core::key_operation::create_item, std::nullopt, body, options.build()));
}

auto
container::create_item_async(const dynamic_value& body, const item_options& options) const
  -> async_result<dynamic_value>
{
  return core::impl::execute_async(
    plan_write(state_, core::key_operation::create_item, std::nullopt, body, options.build()));
}

auto
container::read_item(std::string item_id, const item_options& options) const -> dynamic_value
{
  return core::impl::execute_blocking(plan_read_item(state_, std::move(item_id), options.build()));
}

auto
container::read_item_async(std::string item_id, const item_options& options) const
  -> async_result<dynamic_value>
{
  return core::impl::execute_async(plan_read_item(state_, std::move(item_id), options.build()));
}

auto
container::upsert_item(const dynamic_value& body, const item_options& options) const
  -> dynamic_value
{
  return core::impl::execute_blocking(
    plan_write(state_, core::key_operation::upsert_item, std::nullopt, body, options.build()));
}

auto
container::upsert_item_async(const dynamic_value& body, const item_options& options) const
  -> async_result<dynamic_value>
{
  return core::impl::execute_async(
    plan_write(state_, core::key_operation::upsert_item, std::nullopt, body, options.build()));
}

auto
container::replace_item(std::string item_id,
                        const dynamic_value& body,
                        const item_options& options) const -> dynamic_value
{
  return core::impl::execute_blocking(plan_write(
    state_, core::key_operation::replace_item, std::move(item_id), body, options.build()));
}

auto
container::replace_item_async(std::string item_id,
                              const dynamic_value& body,
                              const item_options& options) const -> async_result<dynamic_value>
{
  return core::impl::execute_async(plan_write(
    state_, core::key_operation::replace_item, std::move(item_id), body, options.build()));
}

void
container::delete_item(std::string item_id, const item_options& options) const
{
  core::impl::execute_blocking(plan_delete_item(state_, std::move(item_id), options.build()));
}

auto
container::delete_item_async(std::string item_id, const item_options& options) const
  -> async_result<void>
{
  return core::impl::execute_async(plan_delete_item(state_, std::move(item_id), options.build()));
}

auto
container::query_items(std::string query, const query_options& options) const
  -> std::vector<dynamic_value>
{
  return core::impl::execute_blocking(plan_query_items(state_, std::move(query), options.build()));
}

auto
container::query_items_async(std::string query, const query_options& options) const
  -> async_result<std::vector<dynamic_value>>
{
  return core::impl::execute_async(plan_query_items(state_, std::move(query), options.build()));
}

auto
container::read(const request_options& options) const -> dynamic_value
{
  return core::impl::execute_blocking(plan_read_container(state_, options.build()));
}

auto
container::read_async(const request_options& options) const -> async_result<dynamic_value>
{
  return core::impl::execute_async(plan_read_container(state_, options.build()));
}

void
container::delete_container(const request_options& options) const
{
  cosmos::database{ state_->client(), state_->database_id() }.delete_container(state_->container_id(),
                                                                               options);
}

auto
container::delete_container_async(const request_options& options) const -> async_result<void>
{
  return cosmos::database{ state_->client(), state_->database_id() }.delete_container_async(
    state_->container_id(), options);
}

auto
container::partition_key_path() const -> std::optional<std::string>
{
  return state_->cache().partition_key_path();
}
} // namespace cosmos
