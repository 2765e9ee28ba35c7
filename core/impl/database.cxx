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

#include <cosmos/container.hxx>
#include <cosmos/database.hxx>
#include <cosmos/error_codes.hxx>

#include <fmt/core.h>

#include <functional>

namespace cosmos
{
namespace
{
using container_factory = std::function<cosmos::container(std::shared_ptr<container_state>)>;

auto
container_properties(const std::string& container_id,
                     const partition_key_definition& partition_key,
                     const container_options::built& options)
  -> tl::expected<tao::json::value, error>
{
  if (partition_key.paths.empty()) {
    return tl::unexpected(
      error{ errc::client::invalid_argument, "partition key definition must name a path" });
  }
  tao::json::value paths = tao::json::empty_array;
  for (const auto& path : partition_key.paths) {
    if (path.size() < 2 || path.front() != '/') {
      return tl::unexpected(error{
        errc::client::invalid_argument,
        fmt::format(R"(partition key path "{}" must start with "/" and name a field)", path),
      });
    }
    paths.emplace_back(path);
  }
  tao::json::value properties{
    { "id", container_id },
    {
      "partitionKey",
      {
        { "paths", std::move(paths) },
        { "kind", partition_key.kind },
        { "version", partition_key.version },
      },
    },
  };
  if (options.default_ttl) {
    properties["defaultTtl"] = options.default_ttl.value();
  }
  return properties;
}

auto
plan_create_container(std::shared_ptr<client_impl> client,
                      std::string database_id,
                      std::string container_id,
                      const partition_key_definition& partition_key,
                      const container_options::built& options,
                      container_factory make_handle)
  -> tl::expected<core::operation<cosmos::container>, error>
{
  if (auto err = core::impl::ensure_open(client); err) {
    return tl::unexpected(err);
  }
  auto properties = container_properties(container_id, partition_key, options);
  if (!properties) {
    return tl::unexpected(properties.error());
  }
  auto transport_options = core::impl::to_request_options(options.timeout, options.options);
  if (!transport_options) {
    return tl::unexpected(transport_options.error());
  }
  core::operations::create_container_request request{
    std::move(database_id),        std::move(container_id),
    std::move(properties.value()), options.throughput,
    std::move(transport_options.value()),
  };
  return [client = std::move(client),
          request = std::move(request),
          path = partition_key.paths.front(),
          make_handle = std::move(make_handle)](
           core::completion_handler<cosmos::container> handler) mutable {
    auto database_id = request.database_id;
    auto container_id = request.container_id;
    return core::impl::issue<tao::json::value>(
      client,
      [request = std::move(request)](core::document_client& transport,
                                     core::operations::resource_callback&& callback) mutable {
        return transport.create_container(std::move(request), std::move(callback));
      },
      [client, database_id, container_id, path, make_handle, handler = std::move(handler)](
        tl::expected<tao::json::value, error> resp) {
        if (!resp) {
          return handler(tl::unexpected(resp.error()));
        }
        auto cache = client->cache_for(database_id, container_id);
        cache->partition_key_path(path);
        return handler(make_handle(
          std::make_shared<container_state>(client, database_id, container_id, std::move(cache))));
      });
  };
}

auto
plan_list_containers(std::shared_ptr<client_impl> client,
                     std::string database_id,
                     const request_options::built& options)
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
    [database_id = std::move(database_id), transport_options = std::move(transport_options.value())](
      core::document_client& transport,
      std::optional<std::string> continuation,
      core::operations::page_callback&& callback) {
      return transport.query_containers({ database_id, std::move(continuation), transport_options },
                                        std::move(callback));
    });
}

auto
plan_delete_container(std::shared_ptr<client_impl> client,
                      std::string database_id,
                      std::string container_id,
                      const request_options::built& options)
  -> tl::expected<core::operation<std::monostate>, error>
{
  if (auto err = core::impl::ensure_open(client); err) {
    return tl::unexpected(err);
  }
  auto transport_options = core::impl::to_request_options(options.timeout, options.options);
  if (!transport_options) {
    return tl::unexpected(transport_options.error());
  }
  core::operations::delete_container_request request{
    std::move(database_id),
    std::move(container_id),
    std::move(transport_options.value()),
  };
  return [client = std::move(client), request = std::move(request)](
           core::completion_handler<std::monostate> handler) mutable {
    auto database_id = request.database_id;
    auto container_id = request.container_id;
    return core::impl::issue<std::monostate>(
      client,
      [request = std::move(request)](core::document_client& transport,
                                     core::operations::delete_callback&& callback) mutable {
        return transport.delete_container(std::move(request), std::move(callback));
      },
      [client, database_id, container_id, handler = std::move(handler)](
        tl::expected<std::monostate, error> resp) {
        if (resp) {
          client->forget_container(database_id, container_id);
        }
        return handler(std::move(resp));
      });
  };
}

auto
plan_read_database(std::shared_ptr<client_impl> client,
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
  core::operations::read_database_request request{ std::move(database_id),
                                                    std::move(transport_options.value()) };
  return core::impl::resource_operation(
    std::move(client),
    [request = std::move(request)](core::document_client& transport,
                                   core::operations::resource_callback&& callback) mutable {
      return transport.read_database(std::move(request), std::move(callback));
    });
}

auto
plan_delete_database(std::shared_ptr<client_impl> client,
                     std::string database_id,
                     const request_options::built& options)
  -> tl::expected<core::operation<std::monostate>, error>
{
  if (auto err = core::impl::ensure_open(client); err) {
    return tl::unexpected(err);
  }
  auto transport_options = core::impl::to_request_options(options.timeout, options.options);
  if (!transport_options) {
    return tl::unexpected(transport_options.error());
  }
  core::operations::delete_database_request request{ std::move(database_id),
                                                      std::move(transport_options.value()) };
  return [client = std::move(client), request = std::move(request)](
           core::completion_handler<std::monostate> handler) mutable {
    auto database_id = request.database_id;
    return core::impl::issue<std::monostate>(
      client,
      [request = std::move(request)](core::document_client& transport,
                                     core::operations::delete_callback&& callback) mutable {
        return transport.delete_database(std::move(request), std::move(callback));
      },
      [client, database_id, handler = std::move(handler)](
        tl::expected<std::monostate, error> resp) {
        if (resp) {
          client->forget_database(database_id);
        }
        return handler(std::move(resp));
      });
  };
}
} // namespace

database::database(std::shared_ptr<client_impl> client, std::string database_id)
  : client_{ std::move(client) }
  , id_{ std::move(database_id) }
{
}

auto
database::id() const -> const std::string&
{
  return id_;
}

auto
database::container(std::string container_id) const -> cosmos::container
{
  auto cache =
    client_ ? client_->cache_for(id_, container_id) : std::make_shared<container_cache>();
  return cosmos::container{
    std::make_shared<container_state>(client_, id_, std::move(container_id), std::move(cache)),
  };
}

auto
database::create_container(std::string container_id,
                           partition_key_definition partition_key,
                           const container_options& options) const -> cosmos::container
{
  return core::impl::execute_blocking(plan_create_container(
    client_, id_, std::move(container_id), partition_key, options.build(), [](std::shared_ptr<container_state> state) {
      return cosmos::container{ std::move(state) };
    }));
}

auto
database::create_container_async(std::string container_id,
                                 partition_key_definition partition_key,
                                 const container_options& options) const
  -> async_result<cosmos::container>
{
  return core::impl::execute_async(plan_create_container(
    client_, id_, std::move(container_id), partition_key, options.build(), [](std::shared_ptr<container_state> state) {
      return cosmos::container{ std::move(state) };
    }));
}

auto
database::list_containers(const request_options& options) const -> std::vector<dynamic_value>
{
  return core::impl::execute_blocking(plan_list_containers(client_, id_, options.build()));
}

auto
database::list_containers_async(const request_options& options) const
  -> async_result<std::vector<dynamic_value>>
{
  return core::impl::execute_async(plan_list_containers(client_, id_, options.build()));
}

void
database::delete_container(std::string container_id, const request_options& options) const
{
  core::impl::execute_blocking(
    plan_delete_container(client_, id_, std::move(container_id), options.build()));
}

auto
database::delete_container_async(std::string container_id, const request_options& options) const
  -> async_result<void>
{
  return core::impl::execute_async(
    plan_delete_container(client_, id_, std::move(container_id), options.build()));
}

auto
database::read(const request_options& options) const -> dynamic_value
{
  return core::impl::execute_blocking(plan_read_database(client_, id_, options.build()));
}

auto
database::read_async(const request_options& options) const -> async_result<dynamic_value>
{
  return core::impl::execute_async(plan_read_database(client_, id_, options.build()));
}

void
database::delete_database(const request_options& options) const
{
  core::impl::execute_blocking(plan_delete_database(client_, id_, options.build()));
}

auto
database::delete_database_async(const request_options& options) const -> async_result<void>
{
  return core::impl::execute_async(plan_delete_database(client_, id_, options.build()));
}
} // namespace cosmos
