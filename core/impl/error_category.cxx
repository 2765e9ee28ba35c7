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


#include <cosmos/error_codes.hxx>

#include <string>

namespace cosmos::core::impl
{
struct http_error_category : std::error_category {
  [[nodiscard]] auto name() const noexcept -> const char* override
  {
    return "cosmos.http";
  }

  [[nodiscard]] auto message(int ev) const noexcept -> std::string override
  {
    switch (static_cast<errc::http>(ev)) {
      case errc::http::generic_http_error:
        return "generic_http_error (1)";
      case errc::http::resource_not_found:
        return "resource_not_found (2)";
      case errc::http::resource_exists:
        return "resource_exists (3)";
      case errc::http::precondition_failed:
        return "precondition_failed (4)";
    }
    return "FIXME: unknown error code (recompile with newer library): cosmos.http." +
           std::to_string(ev);
  }
};

const inline static http_error_category http_category_instance;

auto
http_category() noexcept -> const std::error_category&
{
  return http_category_instance;
}

struct client_error_category : std::error_category {
  [[nodiscard]] auto name() const noexcept -> const char* override
  {
    return "cosmos.client";
  }

  [[nodiscard]] auto message(int ev) const noexcept -> std::string override
  {
    switch (static_cast<errc::client>(ev)) {
      case errc::client::transport_error:
        return "transport_error (101)";
      case errc::client::invalid_payload:
        return "invalid_payload (102)";
      case errc::client::type_mismatch:
        return "type_mismatch (103)";
      case errc::client::missing_partition_key:
        return "missing_partition_key (104)";
      case errc::client::client_closed:
        return "client_closed (105)";
      case errc::client::request_canceled:
        return "request_canceled (106)";
      case errc::client::invalid_argument:
        return "invalid_argument (107)";
      case errc::client::blocking_on_runtime_thread:
        return "blocking_on_runtime_thread (108)";
    }
    return "FIXME: unknown error code (recompile with newer library): cosmos.client." +
           std::to_string(ev);
  }
};

const inline static client_error_category client_category_instance;

auto
client_category() noexcept -> const std::error_category&
{
  return client_category_instance;
}
} // namespace cosmos::core::impl
