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


#include "test_helper.hxx"

#include "core/partition_key_resolver.hxx"
#include "core/utils/json.hxx"

#include <cosmos/client_options.hxx>
#include <cosmos/error_codes.hxx>

#include <catch2/matchers/catch_matchers_string.hpp>
#include <tao/json.hpp>

using cosmos::core::key_operation;
using cosmos::core::partition_key_resolver;

namespace
{
auto
default_resolver() -> partition_key_resolver
{
  return partition_key_resolver{ cosmos::client_options::default_partition_key_candidates() };
}

const std::map<std::string, cosmos::dynamic_value> no_options{};
} // namespace

TEST_CASE("unit: explicit partition key", "[unit]")
{
  auto resolver = default_resolver();
  auto body = cosmos::core::utils::json::parse(R"({"id":"1","category":"from-body"})");

  SECTION("typed value wins over the option and the body")
  {
    std::map<std::string, cosmos::dynamic_value> options{ { "partition_key", "from-option" } };
    auto key = resolver.resolve(
      key_operation::create_item, cosmos::partition_key{ "typed" }, options, &body, std::nullopt);
    EXPECT_SUCCESS(key);
    CHECK(key.value() == cosmos::partition_key{ "typed" });
  }

  SECTION("option wins over the body")
  {
    std::map<std::string, cosmos::dynamic_value> options{ { "partition_key", 17 } };
    auto key = resolver.resolve(key_operation::upsert_item, std::nullopt, options, &body, std::nullopt);
    EXPECT_SUCCESS(key);
    CHECK(key.value() == cosmos::partition_key{ 17 });
  }

  SECTION("option must be a scalar")
  {
    std::map<std::string, cosmos::dynamic_value> options{
      { "partition_key", cosmos::dynamic_value::sequence_type{ "a" } },
    };
    auto key = resolver.resolve(key_operation::read_item, std::nullopt, options, nullptr, std::nullopt);
    REQUIRE_FALSE(key);
    CHECK(key.error().ec() == cosmos::errc::client::type_mismatch);
  }
}

TEST_CASE("unit: partition key from the item body", "[unit]")
{
  auto resolver = default_resolver();

  SECTION("first candidate present wins")
  {
    auto body = cosmos::core::utils::json::parse(R"({"id":"1","type":"order","pk":"tenant-a"})");
    auto key = resolver.resolve(key_operation::create_item, std::nullopt, no_options, &body, std::nullopt);
    EXPECT_SUCCESS(key);
    CHECK(key.value() == cosmos::partition_key{ "tenant-a" });
  }

  SECTION("numbers and booleans keep their type")
  {
    auto numeric = cosmos::core::utils::json::parse(R"({"id":"1","category":12})");
    auto key = resolver.from_body(numeric, std::nullopt);
    EXPECT_SUCCESS(key);
    CHECK(key.value() == cosmos::partition_key{ 12 });

    auto boolean = cosmos::core::utils::json::parse(R"({"id":"1","partitionKey":false})");
    key = resolver.from_body(boolean, std::nullopt);
    EXPECT_SUCCESS(key);
    CHECK(key.value() == cosmos::partition_key{ false });
  }

  SECTION("candidate of the wrong type")
  {
    auto body = cosmos::core::utils::json::parse(R"({"id":"1","category":{"name":"x"}})");
    auto key = resolver.from_body(body, std::nullopt);
    REQUIRE_FALSE(key);
    CHECK(key.error().ec() == cosmos::errc::client::type_mismatch);
  }

  SECTION("no candidate present")
  {
    auto body = cosmos::core::utils::json::parse(R"({"id":"1","name":"x"})");
    auto key = resolver.resolve(key_operation::create_item, std::nullopt, no_options, &body, std::nullopt);
    REQUIRE_FALSE(key);
    CHECK(key.error().ec() == cosmos::errc::client::missing_partition_key);
    REQUIRE_THAT(key.error().message(), Catch::Matchers::ContainsSubstring("category, partitionKey"));
  }

  SECTION("the id field is not a candidate")
  {
    auto body = cosmos::core::utils::json::parse(R"({"id":"1"})");
    auto key = resolver.from_body(body, std::nullopt);
    REQUIRE_FALSE(key);
    CHECK(key.error().ec() == cosmos::errc::client::missing_partition_key);
  }

  SECTION("custom candidates")
  {
    partition_key_resolver custom{ std::vector<std::string>{ "region" } };
    auto body = cosmos::core::utils::json::parse(R"({"id":"1","category":"c","region":"eu"})");
    auto key = custom.from_body(body, std::nullopt);
    EXPECT_SUCCESS(key);
    CHECK(key.value() == cosmos::partition_key{ "eu" });
  }
}

TEST_CASE("unit: declared partition key path", "[unit]")
{
  auto resolver = default_resolver();

  SECTION("nested path")
  {
    auto body = cosmos::core::utils::json::parse(
      R"({"id":"1","category":"ignored","address":{"city":"Oslo"}})");
    auto key = resolver.from_body(body, std::string{ "/address/city" });
    EXPECT_SUCCESS(key);
    CHECK(key.value() == cosmos::partition_key{ "Oslo" });
  }

  SECTION("escaped path segments")
  {
    auto body = cosmos::core::utils::json::parse(R"({"id":"1","a/b":"slash","c~d":"tilde"})");
    CHECK(resolver.from_body(body, std::string{ "/a~1b" }).value() ==
          cosmos::partition_key{ "slash" });
    CHECK(resolver.from_body(body, std::string{ "/c~0d" }).value() ==
          cosmos::partition_key{ "tilde" });
  }

  SECTION("declared path is authoritative")
  {
    auto body = cosmos::core::utils::json::parse(R"({"id":"1","category":"c"})");
    auto key = resolver.from_body(body, std::string{ "/tenant" });
    REQUIRE_FALSE(key);
    CHECK(key.error().ec() == cosmos::errc::client::missing_partition_key);
    REQUIRE_THAT(key.error().message(), Catch::Matchers::ContainsSubstring("/tenant"));
  }
}

TEST_CASE("unit: operations that never look into a body", "[unit]")
{
  auto resolver = default_resolver();
  auto body = cosmos::core::utils::json::parse(R"({"id":"1","category":"c"})");

  for (auto operation :
       { key_operation::read_item, key_operation::delete_item, key_operation::query_items }) {
    CHECK(partition_key_resolver::requires_explicit_key(operation));
    auto key = resolver.resolve(operation, std::nullopt, no_options, &body, std::nullopt);
    REQUIRE_FALSE(key);
    CHECK(key.error().ec() == cosmos::errc::client::missing_partition_key);
  }

  for (auto operation :
       { key_operation::create_item, key_operation::upsert_item, key_operation::replace_item }) {
    CHECK_FALSE(partition_key_resolver::requires_explicit_key(operation));
  }
}
