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

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace cosmos
{
/**
 * Common options that used by most operations.
 *
 * @since 1.0.0
 * @committed
 */
template<typename derived_class>
class common_options
{
public:
  /**
   * Specifies a custom per-operation timeout.
   *
   * @note the timeout is forwarded to the transport, the binding layer does not enforce it.
   *
   * @param timeout the timeout to use for this operation.
   * @return this options builder for chaining purposes.
   *
   * @since 1.0.0
   * @committed
   */
  auto timeout(const std::chrono::milliseconds timeout) -> derived_class&
  {
    timeout_ = timeout;
    return self();
  }

  /**
   * Adds a free-form option that is passed to the transport with the request.
   *
   * The option named "partition_key" is also consulted when resolving the partition key of an
   * item operation.
   *
   * @param name name of the option
   * @param value value of the option
   * @return this options builder for chaining purposes.
   *
   * @since 1.0.0
   * @committed
   */
  auto option(std::string name, dynamic_value value) -> derived_class&
  {
    options_.insert_or_assign(std::move(name), std::move(value));
    return self();
  }

  /**
   * Immutable value object representing consistent options.
   *
   * @since 1.0.0
   * @internal
   */
  struct built {
    const std::optional<std::chrono::milliseconds> timeout;
    const std::map<std::string, dynamic_value> options;
  };

protected:
  /**
   * @return immutable representation of the common options
   * @since 1.0.0
   * @internal
   */
  [[nodiscard]] auto build_common_options() const -> built
  {
    return { timeout_, options_ };
  }

  /**
   * Allows to return the right options builder instance for child implementations.
   *
   * @return derived_class
   *
   * @since 1.0.0
   * @internal
   */
  auto self() -> derived_class&
  {
    return *static_cast<derived_class*>(this);
  }

private:
  std::optional<std::chrono::milliseconds> timeout_{};
  std::map<std::string, dynamic_value> options_{};
};

/**
 * Options for operations that only take the common set (database and container management).
 *
 * @since 1.0.0
 * @committed
 */
struct request_options : public common_options<request_options> {
  struct built : public common_options<request_options>::built {
  };

  [[nodiscard]] auto build() const -> built
  {
    return { build_common_options() };
  }
};
} // namespace cosmos
