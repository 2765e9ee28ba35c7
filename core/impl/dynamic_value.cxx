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


#include <cosmos/dynamic_value.hxx>

#include <stdexcept>
#include <string>

namespace cosmos
{
auto
dynamic_value::type() const -> kind
{
  switch (value_.index()) {
    case 0:
      return kind::null;
    case 1:
      return kind::boolean;
    case 2:
      return kind::integer;
    case 3:
      return kind::floating;
    case 4:
      return kind::string;
    case 5:
      return kind::binary;
    case 6:
      return kind::sequence;
    case 7:
      return kind::mapping;
    default:
      break;
  }
  return kind::opaque;
}

auto
dynamic_value::find(std::string_view key) const -> const dynamic_value*
{
  const auto* members = std::get_if<mapping_type>(&value_);
  if (members == nullptr) {
    return nullptr;
  }
  if (auto it = members->find(std::string{ key }); it != members->end()) {
    return &it->second;
  }
  return nullptr;
}

auto
dynamic_value::at(std::string_view key) const -> const dynamic_value&
{
  if (const auto* member = find(key); member != nullptr) {
    return *member;
  }
  throw std::out_of_range("dynamic_value has no member \"" + std::string{ key } + "\"");
}

auto
to_string(dynamic_value::kind kind) -> std::string_view
{
  switch (kind) {
    case dynamic_value::kind::null:
      return "null";
    case dynamic_value::kind::boolean:
      return "boolean";
    case dynamic_value::kind::integer:
      return "integer";
    case dynamic_value::kind::floating:
      return "floating";
    case dynamic_value::kind::string:
      return "string";
    case dynamic_value::kind::binary:
      return "binary";
    case dynamic_value::kind::sequence:
      return "sequence";
    case dynamic_value::kind::mapping:
      return "mapping";
    case dynamic_value::kind::opaque:
      return "opaque";
  }
  return "unknown";
}
} // namespace cosmos
