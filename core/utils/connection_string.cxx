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


#include "connection_string.hxx"

#include <fmt/core.h>
#include <tao/pegtl.hpp>

#include <algorithm>
#include <cctype>

namespace cosmos::core::utils
{
namespace priv
{
using namespace tao::pegtl;

struct param_key : plus<sor<alnum, one<'_'>>> {
};
struct param_value : star<not_one<';'>> {
};
struct param : seq<star<space>, param_key, star<space>, one<'='>, param_value> {
};

using grammar = must<seq<list_tail<param, one<';'>>, star<space>, eof>>;

auto
trim(std::string value) -> std::string
{
  const auto not_space = [](unsigned char c) {
    return std::isspace(c) == 0;
  };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  return value;
}

template<typename Rule>
struct action {
};

template<>
struct action<param> {
  template<typename ActionInput>
  static void apply(const ActionInput& in, connection_string& cs)
  {
    const auto pair = in.string();
    const auto eq = pair.find('=');
    auto key = trim(pair.substr(0, eq));
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
      return std::tolower(c);
    });
    if (cs.params.count(key) > 0) {
      cs.warnings.push_back(
        fmt::format(R"(parameter "{}" is given more than once, the last value is used)", key));
    }
    cs.params[key] = trim(pair.substr(eq + 1));
  }
};
} // namespace priv

void
parse_option(std::string& receiver,
             const std::string& /* name */,
             const std::string& value,
             std::vector<std::string>& /* warnings */)
{
  receiver = value;
}

void
parse_option(bool& receiver,
             const std::string& name,
             const std::string& value,
             std::vector<std::string>& warnings)
{
  auto lowered = value;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  if (lowered == "true" || lowered == "yes" || lowered == "on") {
    receiver = true;
  } else if (lowered == "false" || lowered == "no" || lowered == "off") {
    receiver = false;
  } else {
    warnings.push_back(fmt::format(
      R"(unable to parse "{}" parameter in connection string (value "{}" cannot be interpreted as a boolean))",
      name,
      value));
  }
}

void
parse_option(std::vector<std::string>& receiver,
             const std::string& name,
             const std::string& value,
             std::vector<std::string>& warnings)
{
  std::vector<std::string> fields{};
  std::size_t start = 0;
  while (start <= value.size()) {
    auto end = value.find(',', start);
    if (end == std::string::npos) {
      end = value.size();
    }
    if (auto field = priv::trim(value.substr(start, end - start)); !field.empty()) {
      fields.emplace_back(std::move(field));
    }
    start = end + 1;
  }
  if (fields.empty()) {
    warnings.push_back(fmt::format(
      R"(unable to parse "{}" parameter in connection string (value "{}" does not name any field))",
      name,
      value));
    return;
  }
  receiver = std::move(fields);
}

template<typename T>
void
parse_option(std::optional<T>& receiver,
             const std::string& name,
             const std::string& value,
             std::vector<std::string>& warnings)
{
  T parsed{};
  const auto warnings_before = warnings.size();
  parse_option(parsed, name, value, warnings);
  if (warnings.size() == warnings_before) {
    receiver = std::move(parsed);
  }
}

void
extract_options(connection_string& connstr)
{
  for (const auto& [name, value] : connstr.params) {
    if (name == "accountendpoint") {
      parse_option(connstr.endpoint, name, value, connstr.warnings);
    } else if (name == "accountkey") {
      parse_option(connstr.account_key, name, value, connstr.warnings);
    } else if (name == "partitionkeycandidates") {
      /**
       * Ordered list of body fields used to find the partition key of written items.
       */
      parse_option(connstr.partition_key_candidates, name, value, connstr.warnings);
    } else if (name == "discoverpartitionkeypath") {
      /**
       * Read container properties to learn the declared partition key path.
       */
      parse_option(connstr.discover_partition_key_path, name, value, connstr.warnings);
    } else if (name == "useragentsuffix") {
      parse_option(connstr.user_agent_suffix, name, value, connstr.warnings);
    } else {
      connstr.warnings.push_back(
        fmt::format(R"(unknown parameter "{}" in connection string (value "{}"))", name, value));
    }
  }
  if (connstr.error) {
    return;
  }
  if (connstr.endpoint.empty()) {
    connstr.error = "connection string does not contain AccountEndpoint";
  } else if (connstr.account_key.empty()) {
    connstr.error = "connection string does not contain AccountKey";
  }
}

auto
parse_connection_string(const std::string& input) -> connection_string
{
  connection_string res{};

  if (input.empty()) {
    res.error = "failed to parse connection string: empty input";
    return res;
  }

  auto in = tao::pegtl::memory_input(input, __FUNCTION__);
  try {
    tao::pegtl::parse<priv::grammar, priv::action>(in, res);
  } catch (const tao::pegtl::parse_error& e) {
    for (const auto& position : e.positions()) {
      if (position.source == __FUNCTION__) {
        res.error = fmt::format("failed to parse connection string (column: {}, trailer: \"{}\")",
                                position.column,
                                input.substr(position.byte));
        break;
      }
    }
    if (!res.error) {
      res.error = e.what();
    }
    return res;
  }
  extract_options(res);
  return res;
}
} // namespace cosmos::core::utils
