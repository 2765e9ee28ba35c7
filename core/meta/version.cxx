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


#include "version.hxx"

#include "core/utils/json.hxx"

#include <asio/version.hpp>
#include <fmt/core.h>
#include <spdlog/version.h>
#include <tao/json/value.hpp>

#include <string>

#ifndef COSMOS_CXX_BRIDGE_VERSION_MAJOR
#define COSMOS_CXX_BRIDGE_VERSION_MAJOR 1
#endif
#ifndef COSMOS_CXX_BRIDGE_VERSION_MINOR
#define COSMOS_CXX_BRIDGE_VERSION_MINOR 0
#endif
#ifndef COSMOS_CXX_BRIDGE_VERSION_PATCH
#define COSMOS_CXX_BRIDGE_VERSION_PATCH 0
#endif
#ifndef COSMOS_CXX_BRIDGE_SYSTEM
#define COSMOS_CXX_BRIDGE_SYSTEM "unknown"
#endif

namespace cosmos::core::meta
{
auto
sdk_build_info() -> std::map<std::string, std::string>
{
  std::map<std::string, std::string> info{};
  info["version_major"] = std::to_string(COSMOS_CXX_BRIDGE_VERSION_MAJOR);
  info["version_minor"] = std::to_string(COSMOS_CXX_BRIDGE_VERSION_MINOR);
  info["version_patch"] = std::to_string(COSMOS_CXX_BRIDGE_VERSION_PATCH);
  info["semver"] = sdk_semver();
  info["platform"] = COSMOS_CXX_BRIDGE_SYSTEM;
  info["spdlog"] = fmt::format("{}.{}.{}", SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR, SPDLOG_VER_PATCH);
  info["fmt"] =
    fmt::format("{}.{}.{}", FMT_VERSION / 10'000, FMT_VERSION / 100 % 1000, FMT_VERSION % 100);
  info["asio"] =
    fmt::format("{}.{}.{}", ASIO_VERSION / 100'000, ASIO_VERSION / 100 % 1000, ASIO_VERSION % 100);
  info["__cplusplus"] = fmt::format("{}", __cplusplus);
#if defined(__GLIBC__)
  info["libc"] = fmt::format("glibc {}.{}", __GLIBC__, __GLIBC_MINOR__);
#endif
  return info;
}

auto
sdk_build_info_json() -> std::string
{
  tao::json::value info = tao::json::empty_object;
  for (const auto& [name, value] : sdk_build_info()) {
    if (name == "version_major" || name == "version_minor" || name == "version_patch") {
      info[name] = std::stoi(value);
    } else {
      info[name] = value;
    }
  }
  return utils::json::generate(info);
}

auto
sdk_semver() -> const std::string&
{
  static const std::string version{ std::to_string(COSMOS_CXX_BRIDGE_VERSION_MAJOR) + "." +
                                    std::to_string(COSMOS_CXX_BRIDGE_VERSION_MINOR) + "." +
                                    std::to_string(COSMOS_CXX_BRIDGE_VERSION_PATCH) };
  return version;
}

auto
sdk_version_short() -> const std::string&
{
  static const std::string version{ "cosmos-cxx-bridge/" + sdk_semver() };
  return version;
}

auto
os() -> const std::string&
{
  static const std::string system{ COSMOS_CXX_BRIDGE_SYSTEM };
  return system;
}

auto
user_agent(const std::string& extra) -> std::string
{
  auto result = fmt::format("{} ({})", sdk_version_short(), os());
  if (!extra.empty()) {
    result.append(" ").append(extra);
  }
  for (auto& ch : result) {
    if (ch == '\n' || ch == '\r') {
      ch = ' ';
    }
  }
  return result;
}
} // namespace cosmos::core::meta
