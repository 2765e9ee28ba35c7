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

#include <system_error>

namespace cosmos
{
#ifndef COSMOS_CXX_BRIDGE_DOXYGEN
namespace core::impl
{
auto
http_category() noexcept -> const std::error_category&;

auto
client_category() noexcept -> const std::error_category&;
} // namespace core::impl
#endif

namespace errc
{
/**
 * Errors derived from a response of the remote service.
 *
 * All of them are surfaced as @ref http_response_error or one of its subclasses.
 *
 * @since 1.0.0
 * @committed
 */
enum class http {
  /**
   * The service answered with a non-success status that does not have a more specific code.
   *
   * Also used when the collaborator reports a failure that cannot be classified.
   */
  generic_http_error = 1,

  /**
   * The addressed database, container or item does not exist.
   */
  // HTTP 404
  resource_not_found = 2,

  /**
   * A resource with the same id (and partition key) already exists.
   */
  // HTTP 409
  resource_exists = 3,

  /**
   * An access condition (for example If-Match on the ETag) was not satisfied.
   */
  // HTTP 412
  precondition_failed = 4,
};

/**
 * Errors detected on the client side, without a response from the service.
 *
 * @since 1.0.0
 * @committed
 */
enum class client {
  /**
   * The collaborator failed before a response was obtained (connectivity, timeout, I/O).
   */
  transport_error = 101,

  /**
   * The item text is not valid JSON, or the structure contains a value that has no JSON representation.
   */
  invalid_payload = 102,

  /**
   * The item is neither JSON text nor a mapping/sequence.
   */
  type_mismatch = 103,

  /**
   * The operation needs a partition key and none could be resolved.
   */
  missing_partition_key = 104,

  /**
   * The operation was attempted after the client has been closed.
   */
  client_closed = 105,

  /**
   * The observer of an asynchronous operation canceled it.
   */
  request_canceled = 106,

  /**
   * Invalid arguments were given to the client (endpoint, credential, options).
   */
  invalid_argument = 107,

  /**
   * A blocking call was made from a thread of the shared runtime, which would never complete.
   */
  blocking_on_runtime_thread = 108,
};

#ifndef COSMOS_CXX_BRIDGE_DOXYGEN
inline auto
make_error_code(http e) -> std::error_code
{
  return { static_cast<int>(e), core::impl::http_category() };
}

inline auto
make_error_code(client e) -> std::error_code
{
  return { static_cast<int>(e), core::impl::client_category() };
}
#endif
} // namespace errc
} // namespace cosmos

#ifndef COSMOS_CXX_BRIDGE_DOXYGEN
template<>
struct std::is_error_code_enum<cosmos::errc::http> : std::true_type {
};

template<>
struct std::is_error_code_enum<cosmos::errc::client> : std::true_type {
};
#endif
