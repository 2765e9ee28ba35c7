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

#include <cosmos/client_options.hxx>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <tao/json/value.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace test::utils
{
struct stub_settings {
  /**
   * Delay before every response.
   */
  std::chrono::milliseconds latency{ 0 };

  /**
   * Maximum number of entries per listing or query page, zero means one page.
   */
  std::size_t page_size{ 0 };
};

/**
 * In-memory document service that keeps databases, containers and items, runs every request on
 * the io_context as a timer and records what it was asked for.
 */
class stub_document_client
  : public cosmos::core::document_client
  , public std::enable_shared_from_this<stub_document_client>
{
public:
  stub_document_client(asio::io_context& io, stub_settings settings);

  auto create_database(cosmos::core::operations::create_database_request request,
                       cosmos::core::operations::resource_callback&& callback) -> result override;
  auto read_database(cosmos::core::operations::read_database_request request,
                     cosmos::core::operations::resource_callback&& callback) -> result override;
  auto delete_database(cosmos::core::operations::delete_database_request request,
                       cosmos::core::operations::delete_callback&& callback) -> result override;
  auto query_databases(cosmos::core::operations::query_databases_request request,
                       cosmos::core::operations::page_callback&& callback) -> result override;

  auto create_container(cosmos::core::operations::create_container_request request,
                        cosmos::core::operations::resource_callback&& callback) -> result override;
  auto read_container(cosmos::core::operations::read_container_request request,
                      cosmos::core::operations::resource_callback&& callback) -> result override;
  auto delete_container(cosmos::core::operations::delete_container_request request,
                        cosmos::core::operations::delete_callback&& callback) -> result override;
  auto query_containers(cosmos::core::operations::query_containers_request request,
                        cosmos::core::operations::page_callback&& callback) -> result override;

  auto create_item(cosmos::core::operations::write_item_request request,
                   cosmos::core::operations::resource_callback&& callback) -> result override;
  auto read_item(cosmos::core::operations::read_item_request request,
                 cosmos::core::operations::resource_callback&& callback) -> result override;
  auto upsert_item(cosmos::core::operations::write_item_request request,
                   cosmos::core::operations::resource_callback&& callback) -> result override;
  auto replace_item(cosmos::core::operations::write_item_request request,
                    cosmos::core::operations::resource_callback&& callback) -> result override;
  auto delete_item(cosmos::core::operations::delete_item_request request,
                   cosmos::core::operations::delete_callback&& callback) -> result override;
  auto query_items(cosmos::core::operations::query_items_request request,
                   cosmos::core::operations::page_callback&& callback) -> result override;

  void close() override;

  /**
   * @return number of requests received for the verb, rejected ones included
   */
  [[nodiscard]] auto calls(const std::string& verb) const -> std::size_t;
  [[nodiscard]] auto total_calls() const -> std::size_t;
  [[nodiscard]] auto is_closed() const -> bool;

  /**
   * @return highest number of requests in flight at the same time
   */
  [[nodiscard]] auto max_in_flight() const -> std::size_t;
  [[nodiscard]] auto canceled() const -> std::size_t;

  [[nodiscard]] auto last_write() const -> std::optional<cosmos::core::operations::write_item_request>;
  [[nodiscard]] auto last_query() const -> std::optional<cosmos::core::operations::query_items_request>;

  /**
   * The next request of the verb completes with the failure.
   */
  void fail_next(const std::string& verb, cosmos::core::failure f);

  /**
   * The next request of the verb is rejected synchronously.
   */
  void reject_next(const std::string& verb, cosmos::core::failure f);

  void latency(std::chrono::milliseconds value);

  /**
   * Stores container properties as given, bypassing the checks of create_container.
   */
  void seed_container(const std::string& database_id,
                      const std::string& container_id,
                      tao::json::value properties);

private:
  using item_key = std::tuple<std::string, std::string, std::string, std::string>;

  template<typename Callback, typename Outcome>
  auto schedule(const std::string& verb, Callback&& callback, Outcome&& outcome) -> result;

  auto store_item(const cosmos::core::operations::write_item_request& request, bool must_exist, bool must_not_exist)
    -> std::pair<cosmos::core::failure, tao::json::value>;

  auto page_of(const std::vector<tao::json::value>& entries,
               const std::optional<std::string>& continuation,
               std::optional<std::uint32_t> limit) const -> cosmos::core::operations::query_page;

  asio::io_context& io_;
  stub_settings settings_;

  mutable std::mutex mutex_{};
  bool closed_{ false };
  std::map<std::string, std::size_t> calls_{};
  std::map<std::string, cosmos::core::failure> failures_{};
  std::map<std::string, cosmos::core::failure> rejections_{};
  std::size_t in_flight_{ 0 };
  std::size_t max_in_flight_{ 0 };
  std::size_t canceled_{ 0 };
  std::uint64_t etag_{ 0 };

  std::map<std::string, tao::json::value> databases_{};
  std::map<std::pair<std::string, std::string>, tao::json::value> containers_{};
  std::map<item_key, tao::json::value> items_{};
  std::optional<cosmos::core::operations::write_item_request> last_write_{};
  std::optional<cosmos::core::operations::query_items_request> last_query_{};
};

/**
 * @return factory that creates the stub on the shared runtime and hands it over through transport
 */
auto
stub_transport(std::shared_ptr<stub_document_client>& transport, stub_settings settings = {})
  -> cosmos::transport_factory;
} // namespace test::utils
