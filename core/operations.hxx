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

#include "failure.hxx"

#include <cosmos/partition_key.hxx>

#include <tao/json/value.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cosmos::core::operations
{
/**
 * Per-request settings forwarded to the transport untouched.
 */
struct request_options {
  std::optional<std::chrono::milliseconds> timeout{};
  std::map<std::string, tao::json::value> extra{};
};

struct create_database_request {
  std::string database_id;
  request_options options{};
};

struct read_database_request {
  std::string database_id;
  request_options options{};
};

struct delete_database_request {
  std::string database_id;
  request_options options{};
};

struct query_databases_request {
  std::optional<std::string> continuation{};
  request_options options{};
};

struct create_container_request {
  std::string database_id;
  std::string container_id;
  /**
   * Container properties as sent to the service: "id", "partitionKey" and optional settings.
   */
  tao::json::value properties{};
  std::optional<std::uint32_t> throughput{};
  request_options options{};
};

struct read_container_request {
  std::string database_id;
  std::string container_id;
  request_options options{};
};

struct delete_container_request {
  std::string database_id;
  std::string container_id;
  request_options options{};
};

struct query_containers_request {
  std::string database_id;
  std::optional<std::string> continuation{};
  request_options options{};
};

/**
 * Used for create, upsert and replace. For replace the item id is taken from item_id, the body
 * must carry the same id.
 */
struct write_item_request {
  std::string database_id;
  std::string container_id;
  std::optional<std::string> item_id{};
  cosmos::partition_key partition_key;
  tao::json::value body{};
  std::optional<std::string> if_match{};
  request_options options{};
};

struct read_item_request {
  std::string database_id;
  std::string container_id;
  std::string item_id;
  cosmos::partition_key partition_key;
  request_options options{};
};

struct delete_item_request {
  std::string database_id;
  std::string container_id;
  std::string item_id;
  cosmos::partition_key partition_key;
  std::optional<std::string> if_match{};
  request_options options{};
};

struct query_items_request {
  std::string database_id;
  std::string container_id;
  std::string query;
  std::vector<std::pair<std::string, tao::json::value>> parameters{};
  cosmos::partition_key partition_key;
  std::optional<std::uint32_t> max_item_count{};
  std::optional<std::string> continuation{};
  request_options options{};
};

/**
 * One page of a query or listing. The listing is complete when continuation is empty.
 */
struct query_page {
  std::vector<tao::json::value> items{};
  std::optional<std::string> continuation{};
};

using resource_callback = std::function<void(failure, tao::json::value)>;
using delete_callback = std::function<void(failure)>;
using page_callback = std::function<void(failure, query_page)>;
} // namespace cosmos::core::operations
