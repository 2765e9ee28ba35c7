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

#include <cosmos/error.hxx>

#include <cstdint>
#include <string>
#include <system_error>

namespace cosmos
{
/**
 * Root of the HTTP branch: the service answered with a non-success status.
 *
 * Catching this type catches @ref resource_not_found_error, @ref resource_exists_error and
 * @ref precondition_failed_error as well.
 *
 * @since 1.0.0
 * @committed
 */
class http_response_error : public std::system_error
{
public:
  explicit http_response_error(const error& err);

  [[nodiscard]] auto status_code() const -> std::uint16_t
  {
    return status_code_;
  }

  [[nodiscard]] auto sub_status() const -> std::uint32_t
  {
    return sub_status_;
  }

  /**
   * @return message reported by the service, without the error code prefix
   */
  [[nodiscard]] auto message() const -> const std::string&
  {
    return message_;
  }

private:
  std::uint16_t status_code_;
  std::uint32_t sub_status_;
  std::string message_;
};

class resource_not_found_error : public http_response_error
{
public:
  using http_response_error::http_response_error;
};

class resource_exists_error : public http_response_error
{
public:
  using http_response_error::http_response_error;
};

class precondition_failed_error : public http_response_error
{
public:
  using http_response_error::http_response_error;
};

/**
 * The collaborator failed before any response was obtained.
 */
class transport_error : public std::system_error
{
public:
  explicit transport_error(const error& err);
};

/**
 * The item could not be marshaled: malformed JSON text or a value without JSON representation.
 * Raised before any network call.
 */
class invalid_payload_error : public std::system_error
{
public:
  explicit invalid_payload_error(const error& err);
};

/**
 * The item is neither JSON text nor a mapping/sequence. Raised before any network call.
 */
class type_mismatch_error : public std::system_error
{
public:
  explicit type_mismatch_error(const error& err);
};

/**
 * No partition key could be resolved for an operation that needs one. Raised before any network call.
 */
class missing_partition_key_error : public std::system_error
{
public:
  explicit missing_partition_key_error(const error& err);
};

/**
 * The operation was attempted on a closed client. The collaborator was not contacted.
 */
class client_closed_error : public std::system_error
{
public:
  explicit client_closed_error(const error& err);
};

/**
 * The asynchronous operation was canceled by its observer. The remote side effect may still happen.
 */
class operation_canceled_error : public std::system_error
{
public:
  explicit operation_canceled_error(const error& err);
};
} // namespace cosmos
