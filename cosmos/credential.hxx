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

#include <string>
#include <utility>

namespace cosmos
{
enum class credential_kind {
  /**
   * Account master key (primary or secondary).
   */
  account_key,
};

/**
 * Authentication material for the account.
 *
 * @since 1.0.0
 * @committed
 */
class credential
{
public:
  credential() = default;

  /**
   * Creates a credential from the account key.
   *
   * @param key base64 encoded account key
   *
   * @since 1.0.0
   * @committed
   */
  static auto from_key(std::string key) -> credential
  {
    return { credential_kind::account_key, std::move(key) };
  }

  [[nodiscard]] auto kind() const -> credential_kind
  {
    return kind_;
  }

  [[nodiscard]] auto secret() const -> const std::string&
  {
    return secret_;
  }

  /**
   * @return true if the credential carries secret material
   */
  [[nodiscard]] auto valid() const -> bool
  {
    return !secret_.empty();
  }

private:
  credential(credential_kind kind, std::string secret)
    : kind_{ kind }
    , secret_{ std::move(secret) }
  {
  }

  credential_kind kind_{ credential_kind::account_key };
  std::string secret_{};
};
} // namespace cosmos
