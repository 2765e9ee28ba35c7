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

#include <cosmos/error.hxx>

#include <tl/expected.hpp>

#include <utility>
#include <variant>

namespace cosmos::core
{
/**
 * Maps a transport failure to the error surfaced by the public API. Total: every failure maps to
 * exactly one error code.
 *
 * | failure                                              | error code                  |
 * |------------------------------------------------------|-----------------------------|
 * | HTTP 404, or server code "NotFound"                  | errc::http::resource_not_found |
 * | HTTP 409, or server code "Conflict"                  | errc::http::resource_exists |
 * | HTTP 412, or server code "PreconditionFailed"        | errc::http::precondition_failed |
 * | any other HTTP response                              | errc::http::generic_http_error |
 * | connection, timeout, io                              | errc::client::transport_error |
 * | credential, data_conversion, other                   | errc::http::generic_http_error, status 0 |
 */
[[nodiscard]] auto
translate(const failure& f) -> error;

/**
 * Wraps a handler of tl::expected<Response, error> into a transport callback. This is the only
 * place where transport failures are converted.
 */
template<typename Response, typename Handler>
auto
translating_callback(Handler&& handler)
{
  return [handler = std::forward<Handler>(handler)](failure f, Response response) mutable {
    if (f) {
      return handler(tl::expected<Response, error>(tl::unexpected(translate(f))));
    }
    return handler(tl::expected<Response, error>(std::move(response)));
  };
}

/**
 * Same as @ref translating_callback for transport callbacks without a response.
 */
template<typename Handler>
auto
translating_delete_callback(Handler&& handler)
{
  return [handler = std::forward<Handler>(handler)](failure f) mutable {
    if (f) {
      return handler(tl::expected<std::monostate, error>(tl::unexpected(translate(f))));
    }
    return handler(tl::expected<std::monostate, error>(std::monostate{}));
  };
}
} // namespace cosmos::core
