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


#include <cosmos/exceptions.hxx>

#include <fmt/core.h>

#include <string>

namespace cosmos
{
namespace
{
auto
describe_response(const error& err) -> std::string
{
  if (err.sub_status() != 0) {
    return fmt::format(
      "{} (status_code={}, sub_status={})", err.message(), err.status_code(), err.sub_status());
  }
  return fmt::format("{} (status_code={})", err.message(), err.status_code());
}
} // namespace

http_response_error::http_response_error(const error& err)
  : std::system_error{ err.ec(), describe_response(err) }
  , status_code_{ err.status_code() }
  , sub_status_{ err.sub_status() }
  , message_{ err.message() }
{
}

transport_error::transport_error(const error& err)
  : std::system_error{ err.ec(), err.message() }
{
}

invalid_payload_error::invalid_payload_error(const error& err)
  : std::system_error{ err.ec(), err.message() }
{
}

type_mismatch_error::type_mismatch_error(const error& err)
  : std::system_error{ err.ec(), err.message() }
{
}

missing_partition_key_error::missing_partition_key_error(const error& err)
  : std::system_error{ err.ec(), err.message() }
{
}

client_closed_error::client_closed_error(const error& err)
  : std::system_error{ err.ec(), err.message() }
{
}

operation_canceled_error::operation_canceled_error(const error& err)
  : std::system_error{ err.ec(), err.message() }
{
}
} // namespace cosmos
