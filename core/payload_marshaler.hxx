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

#include <cosmos/dynamic_value.hxx>
#include <cosmos/error.hxx>

#include <tao/json/value.hpp>
#include <tl/expected.hpp>

#include <string_view>
#include <variant>

namespace cosmos::core
{
/**
 * Raw wire text supplied by the caller.
 */
struct text_input {
  std::string_view text;
};

/**
 * Mapping or sequence to be walked into wire nodes.
 */
struct structural_input {
  const dynamic_value* value;
};

/**
 * Neither text nor an aggregate.
 */
struct unsupported_input {
  dynamic_value::kind kind;
};

using classified_input = std::variant<text_input, structural_input, unsupported_input>;

[[nodiscard]] auto
classify(const dynamic_value& input) -> classified_input;

/**
 * Converts caller input into a wire value.
 *
 * Strings are parsed as JSON text, mappings and sequences are walked directly. Malformed text or
 * a leaf without JSON representation yields errc::client::invalid_payload, any other input
 * yields errc::client::type_mismatch.
 */
[[nodiscard]] auto
encode(const dynamic_value& input) -> tl::expected<tao::json::value, error>;

/**
 * Same as @ref encode, but the result must be a JSON object, as required for item bodies.
 */
[[nodiscard]] auto
encode_item(const dynamic_value& input) -> tl::expected<tao::json::value, error>;

/**
 * Walks any value into a wire node, scalars included. Strings are kept as strings. Used for
 * query parameters and free-form options.
 */
[[nodiscard]] auto
encode_value(const dynamic_value& value) -> tl::expected<tao::json::value, error>;

[[nodiscard]] auto
decode(const tao::json::value& value) -> dynamic_value;
} // namespace cosmos::core
