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

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>

namespace cosmos::core
{
/**
 * Decides who resolves the future of an asynchronous operation: its completion or its
 * cancellation, whichever comes first. The loser is ignored.
 */
class async_control
{
public:
  enum class state {
    queued,
    running,
    completed,
    canceled,
  };

  /**
   * Handler that resolves the future as canceled. Invoked at most once, outside of the lock.
   */
  void on_cancel(std::function<void()> handler);

  /**
   * Moves a queued operation to running.
   *
   * @return false if the operation has been canceled while queued
   */
  auto try_start() -> bool;

  /**
   * Remembers the in-flight transport operation. Cancels it right away if the observer canceled
   * in the meantime.
   */
  void attach(std::shared_ptr<pending_operation> operation);

  /**
   * @return true if the caller may resolve the future with the result
   */
  auto try_complete() -> bool;

  auto cancel() -> bool;

  [[nodiscard]] auto current_state() const -> state;

  /**
   * Blocks until the operation is completed or canceled, or the timeout expires.
   *
   * @return true if the operation is done
   */
  auto wait_until_done(std::chrono::milliseconds timeout) -> bool;

private:
  mutable std::mutex mutex_{};
  std::condition_variable done_{};
  state state_{ state::queued };
  std::shared_ptr<pending_operation> operation_{};
  std::function<void()> on_cancel_{};
};
} // namespace cosmos::core
