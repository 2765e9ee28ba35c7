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


#include "error.hxx"

#include <cosmos/error.hxx>
#include <cosmos/error_codes.hxx>
#include <cosmos/exceptions.hxx>

#include <string>
#include <system_error>
#include <utility>

namespace cosmos
{
error::error(std::error_code ec, std::string message)
  : ec_{ ec }
  , message_{ std::move(message) }
{
}

error::error(std::error_code ec,
             std::string message,
             std::uint16_t status_code,
             std::uint32_t sub_status)
  : ec_{ ec }
  , message_{ std::move(message) }
  , status_code_{ status_code }
  , sub_status_{ sub_status }
{
}

auto
error::ec() const -> std::error_code
{
  return ec_;
}

auto
error::message() const -> const std::string&
{
  return message_;
}

auto
error::status_code() const -> std::uint16_t
{
  return status_code_;
}

auto
error::sub_status() const -> std::uint32_t
{
  return sub_status_;
}

error::operator bool() const
{
  return ec_.value() != 0;
}

auto
error::operator==(const cosmos::error& other) const -> bool
{
  return ec() == other.ec() && message() == other.message() &&
         status_code() == other.status_code() && sub_status() == other.sub_status();
}

namespace core::impl
{
void
throw_error(const error& err)
{
  const auto ec = err.ec();
  if (ec.category() == http_category()) {
    switch (static_cast<errc::http>(ec.value())) {
      case errc::http::resource_not_found:
        throw resource_not_found_error(err);
      case errc::http::resource_exists:
        throw resource_exists_error(err);
      case errc::http::precondition_failed:
        throw precondition_failed_error(err);
      case errc::http::generic_http_error:
        break;
    }
    throw http_response_error(err);
  }
  if (ec.category() == client_category()) {
    switch (static_cast<errc::client>(ec.value())) {
      case errc::client::transport_error:
        throw transport_error(err);
      case errc::client::invalid_payload:
        throw invalid_payload_error(err);
      case errc::client::type_mismatch:
        throw type_mismatch_error(err);
      case errc::client::missing_partition_key:
        throw missing_partition_key_error(err);
      case errc::client::client_closed:
        throw client_closed_error(err);
      case errc::client::request_canceled:
        throw operation_canceled_error(err);
      case errc::client::invalid_argument:
      case errc::client::blocking_on_runtime_thread:
        break;
    }
  }
  throw std::system_error(ec, err.message());
}
} // namespace core::impl
} // namespace cosmos
