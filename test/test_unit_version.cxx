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

#include "core/meta/version.hxx"
#include "core/utils/json.hxx"

#include <catch2/matchers/catch_matchers_string.hpp>

TEST_CASE("unit: build information", "[unit]")
{
  const auto info = cosmos::core::meta::sdk_build_info();
  CHECK(info.at("semver") == cosmos::core::meta::sdk_semver());
  CHECK(info.at("platform") == cosmos::core::meta::os());
  CHECK(info.at("semver") == fmt::format("{}.{}.{}",
                                         info.at("version_major"),
                                         info.at("version_minor"),
                                         info.at("version_patch")));
  CHECK(info.count("spdlog") == 1);
  CHECK(info.count("fmt") == 1);
  CHECK(info.count("asio") == 1);
  CHECK(info.count("__cplusplus") == 1);

  SECTION("as JSON")
  {
    auto json = cosmos::core::utils::json::parse(cosmos::core::meta::sdk_build_info_json());
    REQUIRE(json.is_object());
    CHECK(json.at("semver").get_string() == cosmos::core::meta::sdk_semver());
    CHECK(json.at("version_major").is_signed());
    CHECK(json.at("asio").get_string() == info.at("asio"));
  }
}

TEST_CASE("unit: user agent", "[unit]")
{
  const auto& short_version = cosmos::core::meta::sdk_version_short();
  CHECK(short_version == "cosmos-cxx-bridge/" + cosmos::core::meta::sdk_semver());

  auto plain = cosmos::core::meta::user_agent();
  CHECK(plain == fmt::format("{} ({})", short_version, cosmos::core::meta::os()));

  auto extended = cosmos::core::meta::user_agent("inventory\nservice\r1");
  CHECK(extended == plain + " inventory service 1");
  REQUIRE_THAT(extended, !Catch::Matchers::ContainsSubstring("\n"));
}
