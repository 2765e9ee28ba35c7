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

#include "pending_operation.hxx"

#include <memory>
#include <mutex>
#include <utility>

namespace cosmos::core
{
/**
 * Pending operation made of several transport requests issued one after another (result pages,
 * property lookup followed by the item request). Cancellation reaches the request in flight and
 * stops the chain.
 */
class chained_operation : public pending_operation
{
public:
  void cancel() override
  {
    std::shared_ptr<pending_operation> current{};
    {
      const std::scoped_lock lock(mutex_);
      canceled_ = true;
      std::swap(current, current_);
    }
    if (current) {
      current->cancel();
    }
  }

  [[nodiscard]] auto is_canceled() const -> bool
  {
    const std::scoped_lock lock(mutex_);
    return canceled_;
  }

  void replace(std::shared_ptr<pending_operation> next)
  {
    {
      const std::scoped_lock lock(mutex_);
      if (!canceled_) {
        current_ = std::move(next);
        return;
      }
    }
    if (next) {
      next->cancel();
    }
  }

private:
  mutable std::mutex mutex_{};
  bool canceled_{ false };
  std::shared_ptr<pending_operation> current_{};
};
} // namespace cosmos::core
