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

#include "core/payload_marshaler.hxx"
#include "core/utils/json.hxx"

#include <cosmos/error_codes.hxx>
#include <cosmos/partition_key.hxx>

#include <catch2/matchers/catch_matchers_string.hpp>
#include <tao/json.hpp>

#include <limits>

using cosmos::dynamic_value;

TEST_CASE("unit: classify caller input", "[unit]")
{
  SECTION("text")
  {
    const dynamic_value input{ R"({"id":"1"})" };
    auto classified = cosmos::core::classify(input);
    REQUIRE(std::holds_alternative<cosmos::core::text_input>(classified));
    CHECK(std::get<cosmos::core::text_input>(classified).text == R"({"id":"1"})");
  }

  SECTION("aggregates")
  {
    const dynamic_value mapping{ dynamic_value::mapping_type{ { "id", "1" } } };
    CHECK(std::holds_alternative<cosmos::core::structural_input>(cosmos::core::classify(mapping)));

    const dynamic_value sequence{ dynamic_value::sequence_type{ 1, 2, 3 } };
    CHECK(std::holds_alternative<cosmos::core::structural_input>(cosmos::core::classify(sequence)));
  }

  SECTION("everything else")
  {
    auto classified = cosmos::core::classify(dynamic_value{ 42 });
    REQUIRE(std::holds_alternative<cosmos::core::unsupported_input>(classified));
    CHECK(std::get<cosmos::core::unsupported_input>(classified).kind == dynamic_value::kind::integer);
  }
}

TEST_CASE("unit: encode item bodies", "[unit]")
{
  SECTION("nested mapping")
  {
    const dynamic_value body{ dynamic_value::mapping_type{
      { "id", "item-1" },
      { "count", 42 },
      { "price", 9.5 },
      { "tags", dynamic_value::sequence_type{ "a", "b" } },
      { "nested", dynamic_value::mapping_type{ { "ok", true }, { "none", nullptr } } },
    } };
    auto encoded = cosmos::core::encode_item(body);
    EXPECT_SUCCESS(encoded);
    const auto& object = encoded.value();
    CHECK(object.at("id").get_string() == "item-1");
    CHECK(object.at("count").as<std::int64_t>() == 42);
    CHECK(object.at("price").get_double() == 9.5);
    CHECK(object.at("tags").get_array().size() == 2);
    CHECK(object.at("nested").at("ok").get_boolean());
    CHECK(object.at("nested").at("none").is_null());
  }

  SECTION("JSON text is parsed")
  {
    auto encoded = cosmos::core::encode_item(dynamic_value{ R"({"id":"1","category":"books"})" });
    EXPECT_SUCCESS(encoded);
    CHECK(encoded->at("category").get_string() == "books");
  }

  SECTION("malformed text")
  {
    auto encoded = cosmos::core::encode_item(dynamic_value{ R"({"id": "1",)" });
    REQUIRE_FALSE(encoded);
    CHECK(encoded.error().ec() == cosmos::errc::client::invalid_payload);
  }

  SECTION("item must be an object")
  {
    auto from_text = cosmos::core::encode_item(dynamic_value{ "[1, 2]" });
    REQUIRE_FALSE(from_text);
    CHECK(from_text.error().ec() == cosmos::errc::client::invalid_payload);
    CHECK(from_text.error().message() == "item body must be a JSON object");

    auto from_sequence =
      cosmos::core::encode_item(dynamic_value{ dynamic_value::sequence_type{ 1, 2 } });
    REQUIRE_FALSE(from_sequence);
    CHECK(from_sequence.error().ec() == cosmos::errc::client::invalid_payload);
  }

  SECTION("scalars are rejected as type mismatch")
  {
    for (const auto& input : { dynamic_value{ 7 }, dynamic_value{ true }, dynamic_value{} }) {
      auto encoded = cosmos::core::encode(input);
      REQUIRE_FALSE(encoded);
      CHECK(encoded.error().ec() == cosmos::errc::client::type_mismatch);
    }
  }
}

TEST_CASE("unit: leaves without JSON representation", "[unit]")
{
  SECTION("binary member")
  {
    const dynamic_value body{ dynamic_value::mapping_type{
      { "id", "1" },
      { "data", dynamic_value::binary_type{ std::byte{ 0x01 }, std::byte{ 0x02 } } },
    } };
    auto encoded = cosmos::core::encode(body);
    REQUIRE_FALSE(encoded);
    CHECK(encoded.error().ec() == cosmos::errc::client::invalid_payload);
    REQUIRE_THAT(encoded.error().message(), Catch::Matchers::ContainsSubstring(R"("/data")"));
  }

  SECTION("path points into nested sequences")
  {
    const dynamic_value body{ dynamic_value::mapping_type{
      { "a",
        dynamic_value::sequence_type{
          1,
          dynamic_value::mapping_type{ { "b", dynamic_value::opaque_type{ "Socket" } } },
        } },
    } };
    auto encoded = cosmos::core::encode(body);
    REQUIRE_FALSE(encoded);
    CHECK(encoded.error().ec() == cosmos::errc::client::invalid_payload);
    REQUIRE_THAT(encoded.error().message(), Catch::Matchers::ContainsSubstring("/a/1/b"));
    REQUIRE_THAT(encoded.error().message(), Catch::Matchers::ContainsSubstring("Socket"));
  }

  SECTION("keys are escaped in the path")
  {
    const dynamic_value body{ dynamic_value::mapping_type{
      { "x/y", std::numeric_limits<double>::quiet_NaN() },
    } };
    auto encoded = cosmos::core::encode(body);
    REQUIRE_FALSE(encoded);
    REQUIRE_THAT(encoded.error().message(), Catch::Matchers::ContainsSubstring("/x~1y"));
  }
}

TEST_CASE("unit: encode free-form values", "[unit]")
{
  auto text = cosmos::core::encode_value(dynamic_value{ "{not parsed}" });
  EXPECT_SUCCESS(text);
  CHECK(text->get_string() == "{not parsed}");

  auto number = cosmos::core::encode_value(dynamic_value{ -3 });
  EXPECT_SUCCESS(number);
  CHECK(number->as<std::int64_t>() == -3);

  auto infinite = cosmos::core::encode_value(dynamic_value{ std::numeric_limits<double>::infinity() });
  REQUIRE_FALSE(infinite);
  CHECK(infinite.error().ec() == cosmos::errc::client::invalid_payload);
}

TEST_CASE("unit: decode wire values", "[unit]")
{
  auto wire = cosmos::core::utils::json::parse(
    R"({"a":1,"b":2.5,"c":"s","d":[true,null],"e":18446744073709551615,"f":-7})");
  auto decoded = cosmos::core::decode(wire);

  REQUIRE(decoded.is_mapping());
  CHECK(decoded.at("a") == dynamic_value{ 1 });
  CHECK(decoded.at("b") == dynamic_value{ 2.5 });
  CHECK(decoded.at("c") == dynamic_value{ "s" });
  CHECK(decoded.at("d") == dynamic_value{ dynamic_value::sequence_type{ true, nullptr } });
  CHECK(decoded.at("e").type() == dynamic_value::kind::floating);
  CHECK(decoded.at("f") == dynamic_value{ -7 });
  CHECK(decoded.find("missing") == nullptr);

  SECTION("decoded values encode back to the same document")
  {
    auto encoded = cosmos::core::encode(decoded);
    EXPECT_SUCCESS(encoded);
    CHECK(encoded->at("c").get_string() == "s");
    CHECK(encoded->at("d").get_array().size() == 2);
  }
}

TEST_CASE("unit: structural values survive a round trip", "[unit]")
{
  const dynamic_value original{ dynamic_value::mapping_type{
    { "id", "order-17" },
    { "total", 129.95 },
    { "quantity", 3 },
    { "balance", -42 },
    { "paid", false },
    { "note", nullptr },
    { "lines",
      dynamic_value::sequence_type{
        dynamic_value::mapping_type{ { "sku", "A-1" }, { "tags", dynamic_value::sequence_type{} } },
        dynamic_value::mapping_type{ { "sku", "B-2" },
                                     { "tags", dynamic_value::sequence_type{ "gift", 1, true } } },
      } },
    { "customer",
      dynamic_value::mapping_type{
        { "name", "Ada" },
        { "address", dynamic_value::mapping_type{ { "city", "Zurich" }, { "zip", "8001" } } },
      } },
    { "empty", dynamic_value::mapping_type{} },
  } };

  auto encoded = cosmos::core::encode(original);
  EXPECT_SUCCESS(encoded);
  CHECK(cosmos::core::decode(encoded.value()) == original);

  const dynamic_value nested_empty{ dynamic_value::sequence_type{} };
  const dynamic_value sequence{ dynamic_value::sequence_type{
    1, -1, 0.5, "x", nullptr, dynamic_value::sequence_type{ nested_empty } } };
  auto encoded_sequence = cosmos::core::encode(sequence);
  EXPECT_SUCCESS(encoded_sequence);
  CHECK(cosmos::core::decode(encoded_sequence.value()) == sequence);
}

TEST_CASE("unit: JSON text and mappings encode alike", "[unit]")
{
  const dynamic_value text{
    R"({"id":"1","category":"books","price":12.5,"stock":7,"offset":-2,"active":true,)"
    R"("removed":null,"tags":["new",3],"dimensions":{"width":10,"unit":"cm"}})"
  };
  const dynamic_value mapping{ dynamic_value::mapping_type{
    { "id", "1" },
    { "category", "books" },
    { "price", 12.5 },
    { "stock", 7 },
    { "offset", -2 },
    { "active", true },
    { "removed", nullptr },
    { "tags", dynamic_value::sequence_type{ "new", 3 } },
    { "dimensions", dynamic_value::mapping_type{ { "width", 10 }, { "unit", "cm" } } },
  } };

  auto from_text = cosmos::core::encode_item(text);
  auto from_mapping = cosmos::core::encode_item(mapping);
  EXPECT_SUCCESS(from_text);
  EXPECT_SUCCESS(from_mapping);
  CHECK(from_text.value() == from_mapping.value());
  CHECK(cosmos::core::decode(from_text.value()) == cosmos::core::decode(from_mapping.value()));
}

TEST_CASE("unit: unsigned host numbers beyond the signed range", "[unit]")
{
  constexpr auto largest = std::numeric_limits<std::uint64_t>::max();
  constexpr auto boundary = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

  SECTION("values keep their magnitude")
  {
    const dynamic_value value{ largest };
    REQUIRE(value.type() == dynamic_value::kind::floating);
    CHECK(value.as_floating() == static_cast<double>(largest));

    const dynamic_value fits{ boundary };
    REQUIRE(fits.type() == dynamic_value::kind::integer);
    CHECK(fits.as_integer() == std::numeric_limits<std::int64_t>::max());

    CHECK(dynamic_value{ std::uint32_t{ 4'000'000'000 } }.as_integer() == 4'000'000'000);
  }

  SECTION("host value and wire value agree")
  {
    auto wire = cosmos::core::utils::json::parse(R"({"n":18446744073709551615})");
    const dynamic_value host{ dynamic_value::mapping_type{ { "n", largest } } };
    CHECK(cosmos::core::decode(wire) == host);

    auto encoded = cosmos::core::encode(host);
    EXPECT_SUCCESS(encoded);
    CHECK(encoded->at("n").is_double());
  }

  SECTION("partition keys")
  {
    const cosmos::partition_key key{ largest };
    REQUIRE(std::holds_alternative<double>(key.value()));
    CHECK(key == cosmos::partition_key{ static_cast<double>(largest) });
    CHECK(key != cosmos::partition_key{ -1 });
    CHECK(cosmos::partition_key{ boundary } ==
          cosmos::partition_key{ std::numeric_limits<std::int64_t>::max() });
  }
}
