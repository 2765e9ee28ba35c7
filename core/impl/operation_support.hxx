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

#include "client_impl.hxx"
#include "error.hxx"

#include "core/chained_operation.hxx"
#include "core/document_client.hxx"
#include "core/error_translator.hxx"
#include "core/execution_bridge.hxx"
#include "core/operations.hxx"
#include "core/payload_marshaler.hxx"

#include <cosmos/dynamic_value.hxx>
#include <cosmos/error.hxx>
#include <cosmos/error_codes.hxx>

#include <tao/json/value.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace cosmos::core::impl
{
/**
 * Converts per-call options into the form forwarded to the transport.
 *
 * @return errc::client::invalid_payload if an option value has no JSON representation
 */
auto
to_request_options(const std::optional<std::chrono::milliseconds>& timeout,
                   const std::map<std::string, dynamic_value>& options)
  -> tl::expected<operations::request_options, error>;

/**
 * @return errc::client::client_closed if the client is gone or closed
 */
auto
ensure_open(const std::shared_ptr<client_impl>& client) -> error;

/**
 * Sends one request through the transport of the client.
 *
 * The handler receives the translated outcome exactly once: a closed client, a request rejected
 * synchronously by the transport, or the completion of the request.
 */
template<typename Response, typename Verb>
auto
issue(const std::shared_ptr<client_impl>& client, Verb&& verb, completion_handler<Response> handler)
  -> std::shared_ptr<pending_operation>
{
  auto transport = client->transport();
  if (!transport) {
    handler(tl::unexpected(transport.error()));
    return nullptr;
  }
  document_client::result started{};
  if constexpr (std::is_same_v<Response, std::monostate>) {
    started = verb(*transport.value(), translating_delete_callback(handler));
  } else {
    started = verb(*transport.value(), translating_callback<Response>(handler));
  }
  if (!started) {
    handler(tl::unexpected(translate(started.error())));
    return nullptr;
  }
  return std::move(started.value());
}

/**
 * @return handler of wire responses that hands over the decoded value
 */
inline auto
decoding(completion_handler<dynamic_value> handler) -> completion_handler<tao::json::value>
{
  return [handler = std::move(handler)](tl::expected<tao::json::value, error> resp) {
    if (!resp) {
      return handler(tl::unexpected(resp.error()));
    }
    return handler(decode(resp.value()));
  };
}

/**
 * Operation made of a single request that yields a resource.
 *
 * @param verb callable (document_client&, operations::resource_callback&&) -> document_client::result
 */
template<typename Verb>
auto
resource_operation(std::shared_ptr<client_impl> client, Verb verb) -> operation<dynamic_value>
{
  return [client = std::move(client), verb = std::move(verb)](
           completion_handler<dynamic_value> handler) mutable {
    return issue<tao::json::value>(client, verb, decoding(std::move(handler)));
  };
}

/**
 * Requests pages one after another until the continuation is exhausted, then hands over all
 * items decoded.
 *
 * @param verb callable (document_client&, std::optional<std::string> continuation,
 * operations::page_callback&&) -> document_client::result
 */
template<typename Verb>
void
fetch_pages(std::shared_ptr<client_impl> client,
            std::shared_ptr<chained_operation> chain,
            Verb verb,
            std::shared_ptr<std::vector<tao::json::value>> items,
            std::optional<std::string> continuation,
            completion_handler<std::vector<dynamic_value>> handler)
{
  auto pending = issue<operations::query_page>(
    client,
    [verb, continuation](document_client& transport, operations::page_callback&& callback) {
      return verb(transport, continuation, std::move(callback));
    },
    [client, chain, verb, items, handler](
      tl::expected<operations::query_page, error> page) mutable {
      if (!page) {
        return handler(tl::unexpected(page.error()));
      }
      for (auto& item : page->items) {
        items->emplace_back(std::move(item));
      }
      if (page->continuation && !page->continuation->empty()) {
        if (chain->is_canceled()) {
          return handler(tl::unexpected(error{ errc::client::request_canceled, "operation canceled" }));
        }
        return fetch_pages(std::move(client),
                           std::move(chain),
                           std::move(verb),
                           std::move(items),
                           std::move(page->continuation),
                           std::move(handler));
      }
      std::vector<dynamic_value> decoded{};
      decoded.reserve(items->size());
      for (const auto& item : *items) {
        decoded.emplace_back(decode(item));
      }
      return handler(std::move(decoded));
    });
  chain->replace(std::move(pending));
}

template<typename Verb>
auto
paged_operation(std::shared_ptr<client_impl> client, Verb verb) -> operation<std::vector<dynamic_value>>
{
  return [client = std::move(client), verb = std::move(verb)](
           completion_handler<std::vector<dynamic_value>> handler) -> std::shared_ptr<pending_operation> {
    auto chain = std::make_shared<chained_operation>();
    fetch_pages(client,
                chain,
                verb,
                std::make_shared<std::vector<tao::json::value>>(),
                std::nullopt,
                std::move(handler));
    return chain;
  };
}

/**
 * Runs the planned operation and waits for it.
 *
 * @throws the exception matching the error, see @ref throw_error
 */
template<typename T>
auto
execute_blocking(tl::expected<operation<T>, error> plan) -> T
{
  if (!plan) {
    throw_error(plan.error());
  }
  auto result = execution_bridge::instance().run_blocking(std::move(plan.value()));
  if (!result) {
    throw_error(result.error());
  }
  return std::move(result.value());
}

template<typename T>
auto
execute_async(tl::expected<operation<T>, error> plan)
  -> async_result<typename detail::async_traits<T>::public_type>
{
  if (!plan) {
    return execution_bridge::failed<T>(plan.error());
  }
  return execution_bridge::instance().run_async(std::move(plan.value()));
}
} // namespace cosmos::core::impl
