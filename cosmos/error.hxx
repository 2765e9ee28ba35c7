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

#include <cstdint>
#include <string>
#include <system_error>

namespace cosmos
{
/**
 * Outcome of a single operation as seen by the binding layer.
 *
 * An empty error (default constructed) means success. The blocking API raises it as one of the
 * exceptions declared in @ref cosmos/exceptions.hxx.
 *
 * @since 1.0.0
 * @committed
 */
class error
{
public:
  error() = default;
  error(std::error_code ec, std::string message = {});
  error(std::error_code ec, std::string message, std::uint16_t status_code, std::uint32_t sub_status = 0);

  [[nodiscard]] auto ec() const -> std::error_code;
  [[nodiscard]] auto message() const -> const std::string&;

  /**
   * @return HTTP status reported by the service, or zero when no response was obtained
   */
  [[nodiscard]] auto status_code() const -> std::uint16_t;
  [[nodiscard]] auto sub_status() const -> std::uint32_t;

  explicit operator bool() const;
  auto operator==(const error& other) const -> bool;

private:
  std::error_code ec_{};
  std::string message_{};
  std::uint16_t status_code_{ 0 };
  std::uint32_t sub_status_{ 0 };
};
} // namespace cosmos
