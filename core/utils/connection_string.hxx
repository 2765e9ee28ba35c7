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
#include <optional>
#include <string>
#include <vector>

namespace cosmos::core::utils
{
/**
 * Account connection string, as shown by the portal:
 *
 *   AccountEndpoint=https://example.documents.azure.com:443/;AccountKey=base64==;
 *
 * Keys are case insensitive. Besides the endpoint and the key, the following settings are
 * recognized: PartitionKeyCandidates (comma separated field names), DiscoverPartitionKeyPath
 * (boolean) and UserAgentSuffix.
 */
struct connection_string {
  std::string endpoint{};
  std::string account_key{};
  std::optional<std::vector<std::string>> partition_key_candidates{};
  std::optional<bool> discover_partition_key_path{};
  std::optional<std::string> user_agent_suffix{};

  /**
   * All parameters as written, keyed by the lower-cased name.
   */
  std::map<std::string, std::string> params{};

  std::vector<std::string> warnings{};
  std::optional<std::string> error{};
};

auto
parse_connection_string(const std::string& input) -> connection_string;
} // namespace cosmos::core::utils
