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


#include "payload_marshaler.hxx"

#include "core/utils/json.hxx"

#include <cosmos/error_codes.hxx>

#include <fmt/core.h>
#include <gsl/util>
#include <tao/json.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace cosmos::core
{
namespace
{
auto
escape_pointer_token(const std::string& token) -> std::string
{
  std::string escaped;
  escaped.reserve(token.size());
  for (const char c : token) {
    switch (c) {
      case '~':
        escaped += "~0";
        break;
      case '/':
        escaped += "~1";
        break;
      default:
        escaped += c;
        break;
    }
  }
  return escaped;
}

auto
unsupported_leaf(const std::string& path, std::string_view what) -> error
{
  return { errc::client::invalid_payload,
           fmt::format("value at \"{}\" has no JSON representation: {}",
                       path.empty() ? "/" : path,
                       what) };
}

auto
walk(const dynamic_value& node, std::string& path) -> tl::expected<tao::json::value, error>
{
  switch (node.type()) {
    case dynamic_value::kind::null:
      return tao::json::value{ tao::json::null };

    case dynamic_value::kind::boolean:
      return tao::json::value{ node.as_boolean() };

    case dynamic_value::kind::integer:
      return tao::json::value{ node.as_integer() };

    case dynamic_value::kind::floating:
      if (const double v = node.as_floating(); std::isfinite(v)) {
        return tao::json::value{ v };
      }
      return tl::unexpected(unsupported_leaf(path, "non-finite floating point number"));

    case dynamic_value::kind::string:
      return tao::json::value{ node.as_string() };

    case dynamic_value::kind::sequence: {
      tao::json::value array = tao::json::empty_array;
      const auto& elements = node.as_sequence();
      array.get_array().reserve(elements.size());
      const auto prefix_size = path.size();
      for (std::size_t i = 0; i < elements.size(); ++i) {
        path.append("/").append(std::to_string(i));
        auto element = walk(elements[i], path);
        if (!element) {
          return element;
        }
        array.get_array().emplace_back(std::move(element.value()));
        path.resize(prefix_size);
      }
      return array;
    }

    case dynamic_value::kind::mapping: {
      tao::json::value object = tao::json::empty_object;
      const auto prefix_size = path.size();
      for (const auto& [key, member] : node.as_mapping()) {
        path.append("/").append(escape_pointer_token(key));
        auto encoded = walk(member, path);
        if (!encoded) {
          return encoded;
        }
        object.get_object().insert_or_assign(key, std::move(encoded.value()));
        path.resize(prefix_size);
      }
      return object;
    }

    case dynamic_value::kind::binary:
      return tl::unexpected(unsupported_leaf(path, "binary"));

    case dynamic_value::kind::opaque:
      return tl::unexpected(
        unsupported_leaf(path, fmt::format("object of type \"{}\"", node.as_opaque().type_name)));
  }
  return tl::unexpected(unsupported_leaf(path, to_string(node.type())));
}

auto
parse_text(std::string_view text) -> tl::expected<tao::json::value, error>
{
  try {
    return utils::json::parse(text);
  } catch (const tao::pegtl::parse_error& e) {
    return tl::unexpected(
      error{ errc::client::invalid_payload, fmt::format("invalid JSON text: {}", e.what()) });
  }
}
} // namespace

auto
classify(const dynamic_value& input) -> classified_input
{
  switch (input.type()) {
    case dynamic_value::kind::string:
      return text_input{ input.as_string() };
    case dynamic_value::kind::mapping:
    case dynamic_value::kind::sequence:
      return structural_input{ &input };
    default:
      break;
  }
  return unsupported_input{ input.type() };
}

auto
encode(const dynamic_value& input) -> tl::expected<tao::json::value, error>
{
  const auto classified = classify(input);
  if (const auto* text = std::get_if<text_input>(&classified); text != nullptr) {
    return parse_text(text->text);
  }
  if (const auto* structural = std::get_if<structural_input>(&classified); structural != nullptr) {
    std::string path{};
    return walk(*structural->value, path);
  }
  return tl::unexpected(error{
    errc::client::type_mismatch,
    fmt::format("expected JSON text, mapping or sequence, got {}",
                to_string(std::get<unsupported_input>(classified).kind)),
  });
}

auto
encode_item(const dynamic_value& input) -> tl::expected<tao::json::value, error>
{
  auto encoded = encode(input);
  if (encoded && !encoded->is_object()) {
    return tl::unexpected(
      error{ errc::client::invalid_payload, "item body must be a JSON object" });
  }
  return encoded;
}

auto
encode_value(const dynamic_value& value) -> tl::expected<tao::json::value, error>
{
  std::string path{};
  return walk(value, path);
}

auto
decode(const tao::json::value& value) -> dynamic_value
{
  const auto& v = value.skip_value_ptr();
  if (v.is_boolean()) {
    return v.get_boolean();
  }
  if (v.is_signed()) {
    return v.get_signed();
  }
  if (v.is_unsigned()) {
    const auto number = v.get_unsigned();
    if (number > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return static_cast<double>(number);
    }
    return gsl::narrow_cast<std::int64_t>(number);
  }
  if (v.is_double()) {
    return v.get_double();
  }
  if (v.is_string_type()) {
    return dynamic_value{ v.get_string_type() };
  }
  if (v.is_binary_type()) {
    const auto bytes = v.get_binary_type();
    return dynamic_value::binary_type(bytes.begin(), bytes.end());
  }
  if (v.is_array()) {
    dynamic_value::sequence_type elements;
    elements.reserve(v.get_array().size());
    for (const auto& element : v.get_array()) {
      elements.emplace_back(decode(element));
    }
    return dynamic_value{ std::move(elements) };
  }
  if (v.is_object()) {
    dynamic_value::mapping_type members;
    for (const auto& [key, member] : v.get_object()) {
      members.emplace(key, decode(member));
    }
    return dynamic_value{ std::move(members) };
  }
  return {};
}
} // namespace cosmos::core
