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

#include "core/error_translator.hxx"
#include "core/impl/error.hxx"

#include <cosmos/error_codes.hxx>
#include <cosmos/exceptions.hxx>

#include <catch2/matchers/catch_matchers_string.hpp>

using cosmos::core::failure;
using cosmos::core::failure_kind;

TEST_CASE("unit: translate HTTP responses", "[unit]")
{
  SECTION("status codes")
  {
    CHECK(cosmos::core::translate(failure::http(404, "gone")).ec() ==
          cosmos::errc::http::resource_not_found);
    CHECK(cosmos::core::translate(failure::http(409, "dup")).ec() ==
          cosmos::errc::http::resource_exists);
    CHECK(cosmos::core::translate(failure::http(412, "etag")).ec() ==
          cosmos::errc::http::precondition_failed);
    CHECK(cosmos::core::translate(failure::http(429, "slow down")).ec() ==
          cosmos::errc::http::generic_http_error);
    CHECK(cosmos::core::translate(failure::http(503, "unavailable")).ec() ==
          cosmos::errc::http::generic_http_error);
  }

  SECTION("server code is enough")
  {
    CHECK(cosmos::core::translate(failure::http(400, "", "NotFound")).ec() ==
          cosmos::errc::http::resource_not_found);
    CHECK(cosmos::core::translate(failure::http(400, "", "Conflict")).ec() ==
          cosmos::errc::http::resource_exists);
    CHECK(cosmos::core::translate(failure::http(400, "", "PreconditionFailed")).ec() ==
          cosmos::errc::http::precondition_failed);
  }

  SECTION("status and message are preserved")
  {
    auto f = failure::http(429, "request rate is large", "TooManyRequests");
    f.sub_status = 3200;
    auto err = cosmos::core::translate(f);
    CHECK(err.status_code() == 429);
    CHECK(err.sub_status() == 3200);
    CHECK(err.message() == "request rate is large");
  }

  SECTION("message falls back to the server code")
  {
    auto err = cosmos::core::translate(failure::http(404, "", "NotFound"));
    CHECK(err.message() == "NotFound");
  }
}

TEST_CASE("unit: translate failures without a response", "[unit]")
{
  SECTION("transport failures")
  {
    for (auto kind : { failure_kind::connection, failure_kind::timeout, failure_kind::io }) {
      auto err = cosmos::core::translate(failure::of(kind, "socket closed"));
      CHECK(err.ec() == cosmos::errc::client::transport_error);
      CHECK(err.message() == "socket closed");
      CHECK(err.status_code() == 0);
    }
  }

  SECTION("everything else is a generic error without status")
  {
    for (auto kind :
         { failure_kind::credential, failure_kind::data_conversion, failure_kind::other }) {
      auto err = cosmos::core::translate(failure::of(kind, "nope"));
      CHECK(err.ec() == cosmos::errc::http::generic_http_error);
      CHECK(err.status_code() == 0);
    }
  }

  SECTION("server code still classifies")
  {
    failure f = failure::of(failure_kind::other, "missing");
    f.server_code = "NotFound";
    CHECK(cosmos::core::translate(f).ec() == cosmos::errc::http::resource_not_found);
  }
}

TEST_CASE("unit: translating callback", "[unit]")
{
  std::optional<tl::expected<int, cosmos::error>> received{};
  auto callback = cosmos::core::translating_callback<int>(
    [&received](tl::expected<int, cosmos::error> result) { received = std::move(result); });

  SECTION("success")
  {
    callback(failure{}, 42);
    REQUIRE(received.has_value());
    REQUIRE(received->has_value());
    CHECK(received->value() == 42);
  }

  SECTION("failure")
  {
    callback(failure::http(409, "exists"), 0);
    REQUIRE(received.has_value());
    REQUIRE_FALSE(received->has_value());
    CHECK(received->error().ec() == cosmos::errc::http::resource_exists);
  }
}

TEST_CASE("unit: errors are raised as typed exceptions", "[unit]")
{
  SECTION("HTTP family")
  {
    const cosmos::error not_found{ cosmos::errc::http::resource_not_found, "missing", 404 };
    REQUIRE_THROWS_AS(cosmos::core::impl::throw_error(not_found), cosmos::resource_not_found_error);
    REQUIRE_THROWS_AS(cosmos::core::impl::throw_error(not_found), cosmos::http_response_error);

    const cosmos::error exists{ cosmos::errc::http::resource_exists, "dup", 409 };
    REQUIRE_THROWS_AS(cosmos::core::impl::throw_error(exists), cosmos::resource_exists_error);

    const cosmos::error etag{ cosmos::errc::http::precondition_failed, "etag", 412 };
    REQUIRE_THROWS_AS(cosmos::core::impl::throw_error(etag), cosmos::precondition_failed_error);

    const cosmos::error generic{ cosmos::errc::http::generic_http_error, "busy", 429, 3200 };
    try {
      cosmos::core::impl::throw_error(generic);
      FAIL("expected exception");
    } catch (const cosmos::http_response_error& e) {
      CHECK(e.status_code() == 429);
      CHECK(e.sub_status() == 3200);
      CHECK(e.message() == "busy");
      CHECK(e.code() == cosmos::errc::http::generic_http_error);
      REQUIRE_THAT(e.what(), Catch::Matchers::ContainsSubstring("status_code=429"));
    }
  }

  SECTION("client family")
  {
    REQUIRE_THROWS_AS(
      cosmos::core::impl::throw_error({ cosmos::errc::client::transport_error, "reset" }),
      cosmos::transport_error);
    REQUIRE_THROWS_AS(
      cosmos::core::impl::throw_error({ cosmos::errc::client::invalid_payload, "bad" }),
      cosmos::invalid_payload_error);
    REQUIRE_THROWS_AS(
      cosmos::core::impl::throw_error({ cosmos::errc::client::type_mismatch, "int" }),
      cosmos::type_mismatch_error);
    REQUIRE_THROWS_AS(
      cosmos::core::impl::throw_error({ cosmos::errc::client::missing_partition_key, "pk" }),
      cosmos::missing_partition_key_error);
    REQUIRE_THROWS_AS(
      cosmos::core::impl::throw_error({ cosmos::errc::client::client_closed, "closed" }),
      cosmos::client_closed_error);
    REQUIRE_THROWS_AS(
      cosmos::core::impl::throw_error({ cosmos::errc::client::request_canceled, "canceled" }),
      cosmos::operation_canceled_error);
    REQUIRE_THROWS_AS(
      cosmos::core::impl::throw_error({ cosmos::errc::client::invalid_argument, "arg" }),
      std::system_error);
  }

  SECTION("HTTP errors are not transport errors")
  {
    const cosmos::error not_found{ cosmos::errc::http::resource_not_found, "missing", 404 };
    try {
      cosmos::core::impl::throw_error(not_found);
    } catch (const cosmos::transport_error&) {
      FAIL("HTTP failure raised as transport error");
    } catch (const std::system_error& e) {
      CHECK(e.code().category().name() == std::string{ "cosmos.http" });
    }
  }
}
