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

#include <map>
#include <string>

namespace cosmos::core::meta
{
auto
sdk_semver() -> const std::string&;

/**
 * @return short identifier, like "cosmos-cxx-bridge/1.0.0"
 */
auto
sdk_version_short() -> const std::string&;

auto
sdk_build_info() -> std::map<std::string, std::string>;

auto
sdk_build_info_json() -> std::string;

auto
os() -> const std::string&;

/**
 * @param extra application supplied suffix, line breaks are replaced with spaces
 */
auto
user_agent(const std::string& extra = "") -> std::string;
} // namespace cosmos::core::meta
