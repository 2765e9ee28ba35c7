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
#include "operations.hxx"
#include "pending_operation.hxx"

#include <cosmos/credential.hxx>

#include <tl/expected.hpp>

#include <memory>
#include <string>

namespace cosmos::core
{
struct connection_config {
  std::string endpoint;
  cosmos::credential credential;
  std::string user_agent;
};

/**
 * Asynchronous client of the document database service.
 *
 * Implementations run their I/O on the io_context given to the transport factory and must be
 * safe for concurrent use. Each verb either fails synchronously (nothing was sent) or returns a
 * handle of the started operation and later invokes the callback exactly once, possibly on a
 * thread of the runtime.
 */
class document_client
{
public:
  using result = tl::expected<std::shared_ptr<pending_operation>, failure>;

  virtual ~document_client() = default;

  virtual auto create_database(operations::create_database_request request,
                               operations::resource_callback&& callback) -> result = 0;
  virtual auto read_database(operations::read_database_request request,
                             operations::resource_callback&& callback) -> result = 0;
  virtual auto delete_database(operations::delete_database_request request,
                               operations::delete_callback&& callback) -> result = 0;
  virtual auto query_databases(operations::query_databases_request request,
                               operations::page_callback&& callback) -> result = 0;

  virtual auto create_container(operations::create_container_request request,
                                operations::resource_callback&& callback) -> result = 0;
  virtual auto read_container(operations::read_container_request request,
                              operations::resource_callback&& callback) -> result = 0;
  virtual auto delete_container(operations::delete_container_request request,
                                operations::delete_callback&& callback) -> result = 0;
  virtual auto query_containers(operations::query_containers_request request,
                                operations::page_callback&& callback) -> result = 0;

  virtual auto create_item(operations::write_item_request request,
                           operations::resource_callback&& callback) -> result = 0;
  virtual auto read_item(operations::read_item_request request,
                         operations::resource_callback&& callback) -> result = 0;
  virtual auto upsert_item(operations::write_item_request request,
                           operations::resource_callback&& callback) -> result = 0;
  virtual auto replace_item(operations::write_item_request request,
                            operations::resource_callback&& callback) -> result = 0;
  virtual auto delete_item(operations::delete_item_request request,
                           operations::delete_callback&& callback) -> result = 0;
  virtual auto query_items(operations::query_items_request request,
                           operations::page_callback&& callback) -> result = 0;

  /**
   * Called once when the owning client is closed, releases connections.
   */
  virtual void close()
  {
  }
};
} // namespace cosmos::core
