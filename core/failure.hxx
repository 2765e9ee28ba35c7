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

#include <fmt/core.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace cosmos::core
{
enum class failure_kind {
  none,
  /**
   * The service answered with a non-success status.
   */
  http_response,
  connection,
  timeout,
  io,
  credential,
  data_conversion,
  other,
};

/**
 * Failure reported by the transport. Default constructed value means success.
 */
struct failure {
  failure_kind kind{ failure_kind::none };
  std::optional<std::uint16_t> status_code{};
  std::optional<std::uint32_t> sub_status{};

  /**
   * Error code reported by the service in the response body, for example "NotFound".
   */
  std::string server_code{};
  std::string message{};

  explicit operator bool() const
  {
    return kind != failure_kind::none;
  }

  static auto http(std::uint16_t status, std::string message, std::string server_code = {})
    -> failure
  {
    return { failure_kind::http_response, status, {}, std::move(server_code), std::move(message) };
  }

  static auto of(failure_kind kind, std::string message) -> failure
  {
    return { kind, {}, {}, {}, std::move(message) };
  }
};

auto
to_string(failure_kind kind) -> std::string;
} // namespace cosmos::core

template<>
struct fmt::formatter<cosmos::core::failure> {
  template<typename ParseContext>
  constexpr auto parse(ParseContext& ctx)
  {
    return ctx.begin();
  }

  template<typename FormatContext>
  auto format(const cosmos::core::failure& f, FormatContext& ctx) const
  {
    if (f.status_code) {
      return format_to(ctx.out(),
                       R"({{kind="{}", status={}, server_code="{}", message="{}"}})",
                       cosmos::core::to_string(f.kind),
                       f.status_code.value(),
                       f.server_code,
                       f.message);
    }
    return format_to(ctx.out(),
                     R"({{kind="{}", message="{}"}})",
                     cosmos::core::to_string(f.kind),
                     f.message);
  }
};
