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


#include "error_translator.hxx"

#include "core/logger/logger.hxx"

#include <cosmos/error_codes.hxx>

#include <fmt/core.h>

#include <string>

namespace cosmos::core
{
namespace
{
constexpr std::uint16_t status_not_found{ 404 };
constexpr std::uint16_t status_conflict{ 409 };
constexpr std::uint16_t status_precondition_failed{ 412 };

auto
classify_http(std::uint16_t status, const std::string& server_code) -> errc::http
{
  if (status == status_not_found || server_code == "NotFound") {
    return errc::http::resource_not_found;
  }
  if (status == status_conflict || server_code == "Conflict") {
    return errc::http::resource_exists;
  }
  if (status == status_precondition_failed || server_code == "PreconditionFailed") {
    return errc::http::precondition_failed;
  }
  return errc::http::generic_http_error;
}

auto
describe(const failure& f, std::uint16_t status) -> std::string
{
  if (!f.message.empty()) {
    return f.message;
  }
  if (!f.server_code.empty()) {
    return f.server_code;
  }
  if (status != 0) {
    return fmt::format("HTTP status {}", status);
  }
  return to_string(f.kind);
}
} // namespace

auto
to_string(failure_kind kind) -> std::string
{
  switch (kind) {
    case failure_kind::none:
      return "none";
    case failure_kind::http_response:
      return "http_response";
    case failure_kind::connection:
      return "connection";
    case failure_kind::timeout:
      return "timeout";
    case failure_kind::io:
      return "io";
    case failure_kind::credential:
      return "credential";
    case failure_kind::data_conversion:
      return "data_conversion";
    case failure_kind::other:
      return "other";
  }
  return "unknown";
}

auto
translate(const failure& f) -> error
{
  const auto status = f.status_code.value_or(0);
  const auto sub_status = f.sub_status.value_or(0);
  error result{};

  switch (f.kind) {
    case failure_kind::http_response:
      result = { classify_http(status, f.server_code), describe(f, status), status, sub_status };
      break;

    case failure_kind::connection:
    case failure_kind::timeout:
    case failure_kind::io:
      result = { errc::client::transport_error, describe(f, 0) };
      break;

    case failure_kind::none:
    case failure_kind::credential:
    case failure_kind::data_conversion:
    case failure_kind::other:
      // without a response only the server code can tell more, the status is not meaningful
      result = { classify_http(0, f.server_code), describe(f, 0), 0, sub_status };
      break;
  }
  CS_LOG_DEBUG("transport failure {} translated to {} ({})",
               f,
               result.ec().message(),
               result.message());
  return result;
}
} // namespace cosmos::core
