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


#include "operation_support.hxx"

#include <fmt/core.h>

namespace cosmos::core::impl
{
auto
to_request_options(const std::optional<std::chrono::milliseconds>& timeout,
                   const std::map<std::string, dynamic_value>& options)
  -> tl::expected<operations::request_options, error>
{
  operations::request_options result{ timeout, {} };
  for (const auto& [name, value] : options) {
    auto encoded = encode_value(value);
    if (!encoded) {
      return tl::unexpected(error{
        encoded.error().ec(),
        fmt::format(R"(option "{}": {})", name, encoded.error().message()),
      });
    }
    result.extra.emplace(name, std::move(encoded.value()));
  }
  return result;
}

auto
ensure_open(const std::shared_ptr<client_impl>& client) -> error
{
  if (!client) {
    return { errc::client::client_closed, "client is closed" };
  }
  if (auto transport = client->transport(); !transport) {
    return transport.error();
  }
  return {};
}
} // namespace cosmos::core::impl
